#include "trigger_scheduler.hpp"
#include "file_system_monitor.hpp"
#include "sync_errors.hpp"

#include <spdlog/spdlog.h>

namespace {

// how long one monitor wait may block before the stop flag is re-checked
constexpr std::chrono::milliseconds MONITOR_WAIT{200};

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

TriggerMode triggerModeFrom(const SyncSettings& settings) {
    switch (settings.triggerMode) {
        case TriggerKind::WATCH_CONFIG_FILE:
            return FileWatchTrigger{settings.configPath, settings.readinessTimeout()};
        case TriggerKind::WATCH_CONFIG_API:
            return ApiPollTrigger{settings.apiPollInterval()};
        case TriggerKind::INTERVAL:
            break;
    }
    return IntervalTrigger{settings.interval()};
}

TriggerScheduler::TriggerScheduler(TriggerMode mode, FireHandler onFire, SkipHandler onSkip)
    : m_mode(std::move(mode)), m_onFire(std::move(onFire)), m_onSkip(std::move(onSkip)) {}

void TriggerScheduler::seedBaseline(Json::Value snapshot) {
    m_baseline = std::move(snapshot);
}

void TriggerScheduler::run() {
    std::visit(overloaded{
        [this](const IntervalTrigger& trigger) { runInterval(trigger); },
        [this](const FileWatchTrigger& trigger) { runFileWatch(trigger); },
        [this](const ApiPollTrigger& trigger) { runApiPoll(trigger); },
    }, m_mode);
    spdlog::debug("Trigger scheduler stopped");
}

void TriggerScheduler::stop() {
    {
        std::lock_guard lock(m_mutex);
        m_stop = true;
    }
    m_wakeup.notify_all();
    if (m_monitor) {
        m_monitor->stop();
    }
}

bool TriggerScheduler::stopped() const {
    std::lock_guard lock(m_mutex);
    return m_stop;
}

bool TriggerScheduler::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock lock(m_mutex);
    return !m_wakeup.wait_for(lock, duration, [this] { return m_stop; });
}

bool TriggerScheduler::updateInProgress() const {
    if (!m_updateRunning) {
        return false;
    }
    try {
        return m_updateRunning();
    } catch (const std::exception& e) {
        spdlog::warn("Could not check for a running \"pihole -up\": {}", e.what());
        return false;
    }
}

void TriggerScheduler::runInterval(const IntervalTrigger& trigger) {
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(trigger.interval).count();
    spdlog::info("Sync trigger mode: interval. Running every {} minute(s)", minutes);
    while (waitFor(trigger.interval)) {
        tickInterval();
    }
}

bool TriggerScheduler::tickInterval() {
    return m_onFire(TriggerEvent{TriggerSource::INTERVAL, std::nullopt});
}

void TriggerScheduler::runFileWatch(const FileWatchTrigger& trigger) {
    if (!m_monitor) {
        m_monitor = std::make_shared<FileSystemMonitor>();
    }
    m_monitor->addWatch(trigger.path);
    spdlog::info("Sync trigger mode: watch_config_file. Watching {}", trigger.path);

    while (!stopped()) {
        if (!m_monitor->waitForEvents(MONITOR_WAIT)) {
            continue;
        }
        while (m_monitor->getNextEvent()) {
        }
        spdlog::info("Detected change in {}. Debouncing for {}ms", trigger.path, FILE_WATCH_DEBOUNCE.count());

        // coalesce the burst: keep draining until the file has been quiet for the debounce window
        while (m_monitor->waitForEvents(FILE_WATCH_DEBOUNCE)) {
            while (auto event = m_monitor->getNextEvent()) {
                spdlog::debug("Coalescing additional {} event on {}", event->action, event->path);
            }
        }
        if (stopped()) {
            break;
        }
        handleFileChange();
    }
}

bool TriggerScheduler::handleFileChange() {
    if (updateInProgress()) {
        spdlog::warn("Detected running \"pihole -up\"; skipping sync until the update completes");
        return false;
    }

    const auto* fileWatch = std::get_if<FileWatchTrigger>(&m_mode);
    const auto readinessTimeout = fileWatch != nullptr ? fileWatch->readinessTimeout : std::chrono::milliseconds(0);
    if (m_checkReadiness && m_checkReadiness(readinessTimeout) != Readiness::READY) {
        spdlog::warn("Skipping triggered sync; main Pi-hole API not ready");
        if (m_onSkip) {
            m_onSkip(CycleResult::skippedCycle(TriggerEvent{TriggerSource::CONFIG_FILE_CHANGE, std::nullopt},
                                               ErrorKind::READINESS, "main API not ready"));
        }
        return false;
    }

    return m_onFire(TriggerEvent{TriggerSource::CONFIG_FILE_CHANGE, std::nullopt});
}

void TriggerScheduler::runApiPoll(const ApiPollTrigger& trigger) {
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(trigger.pollInterval).count();
    spdlog::info("Sync trigger mode: watch_config_api. Polling every {} minute(s)", minutes);
    while (waitFor(trigger.pollInterval)) {
        pollApi();
    }
}

bool TriggerScheduler::pollApi() {
    if (!m_fetchSnapshot) {
        throw SyncError("watch_config_api needs a snapshot fetcher");
    }

    Json::Value snapshot;
    try {
        snapshot = m_fetchSnapshot();
    } catch (const std::exception& e) {
        // the poll loop keeps running; the next tick tries again
        spdlog::warn("Failed to fetch config from main instance: {}", e.what());
        return false;
    }

    if (m_baseline && *m_baseline == snapshot) {
        spdlog::debug("No config change detected on main instance");
        return false;
    }

    if (updateInProgress()) {
        spdlog::warn("Detected running \"pihole -up\"; skipping sync until the update completes");
        return false;
    }

    spdlog::info("Detected config change on main instance{}", m_baseline ? "" : " (no baseline yet)");
    if (!m_onFire(TriggerEvent{TriggerSource::CONFIG_API_CHANGE, snapshot})) {
        return false;
    }
    m_baseline = std::move(snapshot);
    return true;
}
