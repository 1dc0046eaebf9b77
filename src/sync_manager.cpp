#include "sync_manager.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

#include "config_api_transport.hpp"
#include "configuration.hpp"
#include "file_system_monitor.hpp"
#include "http_client.hpp"
#include "metrics_collector.hpp"
#include "readiness_prober.hpp"
#include "session_manager.hpp"
#include "sync_errors.hpp"
#include "sync_orchestrator.hpp"
#include "sys/process_table.hpp"
#include "teleporter_transport.hpp"
#include "thread_pool.hpp"
#include "trigger_scheduler.hpp"

SyncManager::SyncManager(std::shared_ptr<Configuration> config,
                         std::unique_ptr<MetricsCollector> metrics,
                         std::shared_ptr<http::Client> client)
    : config(std::move(config)), metrics(std::move(metrics)), m_client(std::move(client)) {
    if (!this->config) {
        throw ConfigurationError("SyncManager needs a configuration");
    }
    if (!this->metrics) {
        this->metrics = std::make_unique<MetricsCollector>();
    }
    if (!m_client) {
        m_client = std::make_shared<http::BeastClient>(std::chrono::seconds(this->config->sync.httpTimeoutSecs));
    }

    m_sessions = std::make_unique<SessionManager>(m_client);
    m_teleporter = std::make_unique<TeleporterTransport>(this->config->sync.cacheLocation);
    m_configApi = std::make_unique<ConfigApiTransport>(std::chrono::milliseconds(this->config->sync.apiWriteThrottleMs));
    m_prober = std::make_unique<ReadinessProber>(m_client);
    m_orchestrator = std::make_unique<SyncOrchestrator>(*this->config, *m_sessions, *m_teleporter, *m_configApi,
                                                        *m_prober, *this->metrics);
    m_pool = std::make_unique<ThreadPool>();
    m_pool->start(1);
}

SyncManager::~SyncManager() {
    stop();
    m_pool->shutdown();
}

void SyncManager::setUpdateDetector(std::function<bool()> detector) {
    m_updateDetector = std::move(detector);
}

void SyncManager::setFileSystemMonitor(std::shared_ptr<FileSystemMonitor> monitor) {
    m_monitor = std::move(monitor);
}

void SyncManager::setResultListener(std::function<void(const CycleResult&)> listener) {
    m_resultListener = std::move(listener);
}

void SyncManager::prepareCache() {
    if (!config->hasTeleporterSecondaries()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(config->sync.cacheLocation, ec);
    if (ec) {
        throw ConfigurationError("cannot create cache directory " + config->sync.cacheLocation + ": " + ec.message());
    }
}

CycleResult SyncManager::runOnce() {
    prepareCache();
    spdlog::info("Sync trigger mode: run-once");

    m_inFlight = true;
    CycleResult result;
    try {
        result = m_orchestrator->runCycle(TriggerEvent{TriggerSource::MANUAL, std::nullopt}, &m_stopRequested);
    } catch (const std::exception&) {
        finishCycle();
        throw;
    }
    finishCycle();
    reportResult(result);
    return result;
}

void SyncManager::run(bool initialSync) {
    prepareCache();

    if (initialSync && !m_stopRequested) {
        if (submit(TriggerEvent{TriggerSource::STARTUP, std::nullopt})) {
            // the API baseline comes from this cycle, so wait for it
            while (!waitForIdle(std::chrono::milliseconds(200)) && !m_stopRequested) {
            }
        }
    }

    TriggerScheduler scheduler(triggerModeFrom(config->sync),
                               [this](const TriggerEvent& event) { return submit(event); },
                               [this](const CycleResult& result) { reportResult(result); });
    configureScheduler(scheduler, initialSync);

    {
        std::lock_guard lock(m_schedulerMutex);
        m_scheduler = &scheduler;
    }
    if (!m_stopRequested) {
        scheduler.run();
    }
    {
        std::lock_guard lock(m_schedulerMutex);
        m_scheduler = nullptr;
    }

    spdlog::info("Shutting down; waiting for the running sync to finish");
    m_pool->shutdown();
}

void SyncManager::configureScheduler(TriggerScheduler& scheduler, bool initialSync) {
    const InstanceConfig& main = config->main;

    scheduler.setUpdateDetector(m_updateDetector ? m_updateDetector : [] { return sys::isPiholeUpdateRunning(); });
    if (m_monitor) {
        scheduler.setFileSystemMonitor(m_monitor);
    }

    scheduler.setReadinessCheck([this, &main](std::chrono::milliseconds timeout) {
        return m_prober->waitReady(main, timeout, &m_stopRequested);
    });

    scheduler.setSnapshotFetcher([this, &main] {
        Session session = m_sessions->acquire(main);
        return m_configApi->fetchConfig(session);
    });

    if (!std::holds_alternative<ApiPollTrigger>(scheduler.mode())) {
        return;
    }

    if (initialSync) {
        if (auto snapshot = m_orchestrator->lastMainConfig()) {
            scheduler.seedBaseline(std::move(*snapshot));
            return;
        }
    }

    // seed without syncing so that the first poll only fires on a real change
    try {
        Session session = m_sessions->acquire(main);
        scheduler.seedBaseline(m_configApi->fetchConfig(session));
        spdlog::info("Seeded baseline config from main instance");
    } catch (const SyncError& e) {
        spdlog::warn("[{}] Failed to fetch config for baseline: {}", main.label(), e.what());
    }
}

void SyncManager::stop() {
    m_stopRequested = true;
    std::lock_guard lock(m_schedulerMutex);
    if (m_scheduler != nullptr) {
        m_scheduler->stop();
    }
}

bool SyncManager::submit(const TriggerEvent& event) {
    bool expected = false;
    if (!m_inFlight.compare_exchange_strong(expected, true)) {
        spdlog::debug("Sync already in progress, dropping {} trigger", toString(event.source));
        metrics->recordMetric("trigger_dropped", toString(event.source));
        return false;
    }
    m_pool->enqueue([this, event] { executeCycle(event); });
    return true;
}

void SyncManager::executeCycle(const TriggerEvent& event) {
    try {
        const auto result = m_orchestrator->runCycle(event, &m_stopRequested);
        reportResult(result);
        finishCycle();
    } catch (const std::exception& e) {
        finishCycle();
        spdlog::error("Sync cycle aborted: {}", e.what());
    }
}

void SyncManager::finishCycle() {
    {
        std::lock_guard lock(m_idleMutex);
        m_inFlight = false;
    }
    m_idle.notify_all();
}

bool SyncManager::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(m_idleMutex);
    return m_idle.wait_for(lock, timeout, [this] { return !m_inFlight.load(); });
}

void SyncManager::reportResult(const CycleResult& result) {
    const std::string summary = result.summary();
    if (result.skipped) {
        if (result.skipError == ErrorKind::NONE) {
            spdlog::info("{}", summary);
        } else {
            spdlog::warn("{}", summary);
        }
        metrics->recordMetric("cycle_skipped", result.skipReason);
    } else if (result.count(OutcomeStatus::FAILED) > 0) {
        spdlog::error("{}", summary);
        metrics->recordMetric("cycle_finished", summary);
    } else if (result.count(OutcomeStatus::DEGRADED) > 0 || result.count(OutcomeStatus::SKIPPED) > 0) {
        spdlog::warn("{}", summary);
        metrics->recordMetric("cycle_finished", summary);
    } else {
        spdlog::info("{}", summary);
        metrics->recordMetric("cycle_finished", summary);
    }

    if (m_resultListener) {
        m_resultListener(result);
    }
    metrics->collect();
}
