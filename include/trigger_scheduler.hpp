#ifndef TRIGGER_SCHEDULER_HPP
#define TRIGGER_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include <json/json.h>

#include "configuration.hpp"
#include "readiness_prober.hpp"
#include "sync_types.hpp"

class FileSystemMonitor;

struct IntervalTrigger {
    std::chrono::milliseconds interval;
};

struct FileWatchTrigger {
    std::string path;
    std::chrono::milliseconds readinessTimeout;
};

struct ApiPollTrigger {
    std::chrono::milliseconds pollInterval;
};

using TriggerMode = std::variant<IntervalTrigger, FileWatchTrigger, ApiPollTrigger>;

TriggerMode triggerModeFrom(const SyncSettings& settings);

/// Decides when a sync cycle runs.
///
/// One loop per trigger mode; every loop reports through the same fire
/// handler. The handler returns false when the event was not accepted (a
/// cycle was already running), which keeps the API baseline unchanged.
class TriggerScheduler {
public:
    using FireHandler = std::function<bool(const TriggerEvent&)>;
    using SkipHandler = std::function<void(const CycleResult&)>;
    using SnapshotFetcher = std::function<Json::Value()>;
    using ReadinessCheck = std::function<Readiness(std::chrono::milliseconds timeout)>;
    using UpdateDetector = std::function<bool()>;

    /// File changes are debounced for this long; further events reset the wait
    static constexpr std::chrono::milliseconds FILE_WATCH_DEBOUNCE{750};

    TriggerScheduler(TriggerMode mode, FireHandler onFire, SkipHandler onSkip = {});
    TriggerScheduler(const TriggerScheduler&) = delete;
    TriggerScheduler& operator=(const TriggerScheduler&) = delete;

    /// Fetches main's current /config tree (watch_config_api)
    void setSnapshotFetcher(SnapshotFetcher fetcher) { m_fetchSnapshot = std::move(fetcher); }
    /// Probes main before a file-change fire, with the trigger's readiness timeout
    void setReadinessCheck(ReadinessCheck check) { m_checkReadiness = std::move(check); }
    /// Reports a running `pihole -up`; both watch modes hold fires while it does
    void setUpdateDetector(UpdateDetector detector) { m_updateRunning = std::move(detector); }
    void setFileSystemMonitor(std::shared_ptr<FileSystemMonitor> monitor) { m_monitor = std::move(monitor); }

    void seedBaseline(Json::Value snapshot);
    const std::optional<Json::Value>& baseline() const { return m_baseline; }

    const TriggerMode& mode() const { return m_mode; }

    /// Blocks in the loop for the configured mode until stop() is called
    void run();
    void stop();
    bool stopped() const;

    // One iteration of each loop, without the waiting.
    bool tickInterval();
    bool handleFileChange();
    bool pollApi();

private:
    void runInterval(const IntervalTrigger& trigger);
    void runFileWatch(const FileWatchTrigger& trigger);
    void runApiPoll(const ApiPollTrigger& trigger);

    /// Sleep unless stopped first. Returns false when stopped.
    bool waitFor(std::chrono::milliseconds duration);
    bool updateInProgress() const;

    TriggerMode m_mode;
    FireHandler m_onFire;
    SkipHandler m_onSkip;
    SnapshotFetcher m_fetchSnapshot;
    ReadinessCheck m_checkReadiness;
    UpdateDetector m_updateRunning;
    std::shared_ptr<FileSystemMonitor> m_monitor;

    std::optional<Json::Value> m_baseline;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    bool m_stop = false;
};

#endif // TRIGGER_SCHEDULER_HPP
