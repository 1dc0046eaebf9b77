#ifndef SYNC_MANAGER_HPP
#define SYNC_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

#include "sync_types.hpp"

class MetricsCollector;
class Configuration;
class ConfigApiTransport;
class FileSystemMonitor;
class ReadinessProber;
class SessionManager;
class SyncOrchestrator;
class TeleporterTransport;
class ThreadPool;
class TriggerScheduler;

namespace http {
class Client;
}

/// Runs main-to-secondary sync cycles in response to triggers.
///
/// Owns the transports, the orchestrator and the single worker thread that
/// runs cycles. A trigger that arrives while a cycle is running is dropped.
class SyncManager
{
public:
    SyncManager(std::shared_ptr<Configuration> config,
                std::unique_ptr<MetricsCollector> metrics,
                std::shared_ptr<http::Client> client = nullptr);
    ~SyncManager();
    SyncManager(const SyncManager&) = delete;
    SyncManager& operator=(const SyncManager&) = delete;
    SyncManager(SyncManager&&) = delete;
    SyncManager& operator=(SyncManager&&) = delete;

    /// Run a single cycle on the calling thread (--once)
    CycleResult runOnce();

    /// @brief Daemon mode. Blocks until stop() is called.
    /// @param initialSync run a cycle before the trigger loop starts
    void run(bool initialSync);

    /// Safe to call from any thread, including before run()
    void stop();

    /// @brief Hand a trigger to the worker
    /// @return false when a cycle is already in flight and the trigger was dropped
    bool submit(const TriggerEvent& event);

    bool cycleInFlight() const { return m_inFlight.load(); }

    /// Block until no cycle is running. Returns false on timeout.
    bool waitForIdle(std::chrono::milliseconds timeout);

    /// Replaces the /proc scan for `pihole -up`
    void setUpdateDetector(std::function<bool()> detector);
    /// Replaces the inotify monitor used by watch_config_file
    void setFileSystemMonitor(std::shared_ptr<FileSystemMonitor> monitor);
    /// Called with every finished or skipped cycle
    void setResultListener(std::function<void(const CycleResult&)> listener);


private:
    void prepareCache();
    void executeCycle(const TriggerEvent& event);
    void finishCycle();
    void reportResult(const CycleResult& result);
    void configureScheduler(TriggerScheduler& scheduler, bool initialSync);

    std::shared_ptr<Configuration> config;
    std::unique_ptr<MetricsCollector> metrics;
    std::shared_ptr<http::Client> m_client;

    std::unique_ptr<SessionManager> m_sessions;
    std::unique_ptr<TeleporterTransport> m_teleporter;
    std::unique_ptr<ConfigApiTransport> m_configApi;
    std::unique_ptr<ReadinessProber> m_prober;
    std::unique_ptr<SyncOrchestrator> m_orchestrator;
    std::unique_ptr<ThreadPool> m_pool;

    std::function<bool()> m_updateDetector;
    std::shared_ptr<FileSystemMonitor> m_monitor;
    std::function<void(const CycleResult&)> m_resultListener;

    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_inFlight{false};
    std::mutex m_idleMutex;
    std::condition_variable m_idle;

    std::mutex m_schedulerMutex;
    TriggerScheduler* m_scheduler = nullptr;
};


#endif //SYNC_MANAGER_HPP
