#pragma once

#include "storage/RecordStore.hpp"
#include <mutex>
#include <string>

namespace rainsight {
namespace postgres {

/**
 * @brief PostgreSQL backend (libpqxx)
 *
 * Chaque session ouvre sa propre connexion. Le schéma est créé au premier
 * openSession() (CREATE TABLE IF NOT EXISTS).
 */
class PostgresRecordStore : public storage::IRecordStore {
public:
    /**
     * @param connectionString Format: "host=localhost port=5432 dbname=mydb user=user password=pass"
     * @throws ValidationError si la chaîne est vide
     */
    explicit PostgresRecordStore(std::string connectionString);

    std::unique_ptr<storage::IStoreSession> openSession() override;
    std::string backendName() const override { return "postgres"; }

    const std::string& connectionString() const { return m_connectionString; }

    /**
     * @brief Chaîne de connexion sans le mot de passe (pour les logs)
     */
    std::string redactedConnectionString() const;

private:
    std::string m_connectionString;
    std::mutex m_schemaMutex;
    bool m_schemaReady = false;
};

} // namespace postgres
} // namespace rainsight
