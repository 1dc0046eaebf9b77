#include "sync_types.hpp"

#include <algorithm>
#include <sstream>

const char* toString(TriggerSource source) {
    switch (source) {
        case TriggerSource::STARTUP: return "startup";
        case TriggerSource::INTERVAL: return "interval";
        case TriggerSource::CONFIG_FILE_CHANGE: return "config file change";
        case TriggerSource::CONFIG_API_CHANGE: return "config api change";
        case TriggerSource::MANUAL: return "manual";
    }
    return "manual";
}

const char* toString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::SUCCEEDED: return "succeeded";
        case OutcomeStatus::DEGRADED: return "degraded";
        case OutcomeStatus::FAILED: return "failed";
        case OutcomeStatus::SKIPPED: return "skipped";
    }
    return "failed";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::AUTH: return "auth";
        case ErrorKind::TRANSPORT: return "transport";
        case ErrorKind::READINESS: return "readiness timeout";
        case ErrorKind::CANCELLED: return "cancelled";
    }
    return "none";
}

bool CycleResult::ok() const {
    if (skipped && skipError != ErrorKind::NONE) {
        return false;
    }
    return count(OutcomeStatus::FAILED) == 0;
}

std::size_t CycleResult::count(OutcomeStatus status) const {
    return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [status](const SecondaryOutcome& outcome) { return outcome.status == status; }));
}

std::string CycleResult::summary() const {
    std::ostringstream out;
    out << "sync (" << toString(trigger.source) << ")";
    if (skipped) {
        out << " skipped: " << skipReason;
        return out.str();
    }

    out << ": " << outcomes.size() << " secondaries";
    for (auto status : {OutcomeStatus::SUCCEEDED, OutcomeStatus::DEGRADED, OutcomeStatus::FAILED, OutcomeStatus::SKIPPED}) {
        if (auto n = count(status); n > 0) {
            out << ", " << n << " " << toString(status);
        }
    }
    return out.str();
}

CycleResult CycleResult::skippedCycle(TriggerEvent trigger, ErrorKind error, std::string reason) {
    CycleResult result;
    result.trigger = std::move(trigger);
    result.skipped = true;
    result.skipError = error;
    result.skipReason = std::move(reason);
    return result;
}
