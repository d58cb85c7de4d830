#pragma once

#include "storage/RecordStore.hpp"
#include <chrono>
#include <string>

namespace rainsight {
namespace storage {

/**
 * SQLite backend
 *
 * The constructor creates the schema. Every openSession() opens a new
 * connection (WAL journal, busy timeout) so concurrent pipeline workers
 * never share a handle.
 *
 * Usage:
 *   SqliteRecordStore store("./rainsight.db");
 *   auto session = store.openSession();
 *   auto query = session->createQuery(42, "Will it rain this week?");
 *   session->saveResponse(query.id, "Mostly dry.");
 */
class SqliteRecordStore : public IRecordStore {
public:
    explicit SqliteRecordStore(const std::string& dbPath,
                               std::chrono::milliseconds busyTimeout = std::chrono::milliseconds(5000));

    std::unique_ptr<IStoreSession> openSession() override;
    std::string backendName() const override { return "sqlite"; }

    const std::string& path() const { return m_dbPath; }

private:
    std::string m_dbPath;
    std::chrono::milliseconds m_busyTimeout;
};

} // namespace storage
} // namespace rainsight
