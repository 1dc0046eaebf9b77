#ifndef SYNC_TYPES_HPP
#define SYNC_TYPES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "configuration.hpp"

enum class TriggerSource {
    STARTUP,
    INTERVAL,
    CONFIG_FILE_CHANGE,
    CONFIG_API_CHANGE,
    MANUAL  // --once
};

const char* toString(TriggerSource source);

/// What caused a cycle. API-change events carry the main config they observed.
struct TriggerEvent {
    TriggerSource source = TriggerSource::MANUAL;
    std::optional<Json::Value> mainConfig;

    bool isConfigChange() const {
        return source == TriggerSource::CONFIG_FILE_CHANGE || source == TriggerSource::CONFIG_API_CHANGE;
    }
};

/// One main -> secondary transfer inside a cycle
struct SyncJob {
    const InstanceConfig& main;
    const InstanceConfig& secondary;
    SyncMode mode;
};

enum class OutcomeStatus {
    SUCCEEDED,
    DEGRADED,
    FAILED,
    SKIPPED
};

enum class ErrorKind {
    NONE,
    AUTH,
    TRANSPORT,
    READINESS,
    CANCELLED
};

const char* toString(OutcomeStatus status);
const char* toString(ErrorKind kind);

struct SecondaryOutcome {
    std::string instance;  // host:port
    SyncMode mode = SyncMode::TELEPORTER;
    OutcomeStatus status = OutcomeStatus::SUCCEEDED;
    ErrorKind error = ErrorKind::NONE;
    std::string reason;
    std::vector<std::string> warnings;
    std::map<std::string, std::string> rejectedKeys;
};

/// Everything one sync cycle did, one entry per secondary in configuration order
struct CycleResult {
    TriggerEvent trigger;
    std::vector<SecondaryOutcome> outcomes;

    // the whole cycle did not run
    bool skipped = false;
    ErrorKind skipError = ErrorKind::NONE;
    std::string skipReason;

    /// false when a secondary failed or the cycle was skipped because of an error
    bool ok() const;
    std::size_t count(OutcomeStatus status) const;
    /// one-line "2 succeeded, 1 failed" style summary
    std::string summary() const;

    static CycleResult skippedCycle(TriggerEvent trigger, ErrorKind error, std::string reason);
};

#endif // SYNC_TYPES_HPP
