#pragma once

#include <stdexcept>
#include <string>

namespace rainsight {

/**
 * Error taxonomy shared by every module.
 * The workflow engine routes on the kind, never on the message.
 */
enum class ErrorKind {
    Validation,
    InsufficientData,
    ArtifactLoad,
    Provider,
    Capability,
    Transport,
    Persistence,
    Unexpected
};

std::string errorKindToString(ErrorKind kind);

/**
 * Base exception - all domain errors carry their kind
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::Validation, message) {}
};

class InsufficientDataError : public Error {
public:
    explicit InsufficientDataError(const std::string& message)
        : Error(ErrorKind::InsufficientData, message) {}
};

class ArtifactLoadError : public Error {
public:
    explicit ArtifactLoadError(const std::string& message)
        : Error(ErrorKind::ArtifactLoad, message) {}
};

class ProviderError : public Error {
public:
    explicit ProviderError(const std::string& message)
        : Error(ErrorKind::Provider, message) {}
};

// Language model unavailable, refused or answered garbage
class CapabilityError : public Error {
public:
    explicit CapabilityError(const std::string& message)
        : Error(ErrorKind::Capability, message) {}
};

// Timeout, resolve, connect or TLS failure - the request may be retried
class TransportError : public Error {
public:
    explicit TransportError(const std::string& message)
        : Error(ErrorKind::Transport, message) {}
};

class PersistenceError : public Error {
public:
    explicit PersistenceError(const std::string& message)
        : Error(ErrorKind::Persistence, message) {}
};

} // namespace rainsight
