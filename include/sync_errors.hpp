#ifndef SYNC_ERRORS_HPP
#define SYNC_ERRORS_HPP

#include <stdexcept>
#include <string>

/// Base class for every error raised by the sync core
class SyncError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Login against an instance failed (bad app password, no sid returned, or
/// the instance could not be reached while logging in)
class AuthError : public SyncError {
public:
    using SyncError::SyncError;
};

/// Network failure, timeout or non-2xx answer from the Pi-hole API
class TransportError : public SyncError {
public:
    explicit TransportError(const std::string& what, int status = 0)
        : SyncError(what), m_status(status) {}

    /// HTTP status of the failed exchange, 0 when no response was received
    int status() const { return m_status; }

private:
    int m_status;
};

/// Malformed include/exclude policy in the configuration file
class FilterConfigError : public SyncError {
public:
    using SyncError::SyncError;
};

/// Any other invalid or missing configuration value
class ConfigurationError : public SyncError {
public:
    using SyncError::SyncError;
};

/// An instance did not answer within the readiness window
class ReadinessTimeout : public SyncError {
public:
    using SyncError::SyncError;
};

#endif // SYNC_ERRORS_HPP
