#pragma once

#include <stdexcept>
#include <string>

// Run-level failures. Anything thrown from here aborts the current execution;
// single-file problems are reported as ItemResult instead.
class BackupError : public std::runtime_error {
public:
    explicit BackupError(const std::string& message) : std::runtime_error(message) {}
};

// Missing or inconsistent transport/credential configuration. Not retried.
class ConfigurationError : public BackupError {
public:
    explicit ConfigurationError(const std::string& message) : BackupError(message) {}
};

class AuthenticationError : public BackupError {
public:
    enum class Reason {
        InvalidCode,
        Expired,
        Unauthorized
    };

    AuthenticationError(Reason reason, const std::string& message)
        : BackupError(message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

// Agent unreachable, timed out or answered with a non-2xx status.
class TransportError : public BackupError {
public:
    explicit TransportError(const std::string& message, long httpStatus = 0)
        : BackupError(message), httpStatus_(httpStatus) {}

    long httpStatus() const { return httpStatus_; }

private:
    long httpStatus_;
};

// The local destination tree cannot be created or enumerated.
class DestinationError : public BackupError {
public:
    explicit DestinationError(const std::string& message) : BackupError(message) {}
};

// A configuration or journal store could not be read or written.
class PersistenceError : public BackupError {
public:
    explicit PersistenceError(const std::string& message) : BackupError(message) {}
};

inline const char* authReasonToString(AuthenticationError::Reason reason) {
    switch (reason) {
        case AuthenticationError::Reason::InvalidCode:  return "InvalidCode";
        case AuthenticationError::Reason::Expired:      return "Expired";
        case AuthenticationError::Reason::Unauthorized: return "Unauthorized";
    }
    return "Unknown";
}
