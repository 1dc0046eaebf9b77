#ifndef SYNC_ORCHESTRATOR_HPP
#define SYNC_ORCHESTRATOR_HPP

#include <atomic>
#include <mutex>
#include <optional>

#include <json/json.h>

#include "config_api_transport.hpp"
#include "configuration.hpp"
#include "readiness_prober.hpp"
#include "session_manager.hpp"
#include "sync_types.hpp"
#include "teleporter_transport.hpp"
#include "content_digest.hpp"

class MetricsCollector;

/// Runs one sync cycle: main session, then every secondary in configuration
/// order, each with its own session and its own outcome. A failing secondary
/// never stops the others and nothing is retried within a cycle.
class SyncOrchestrator {
public:
    SyncOrchestrator(const Configuration& config,
                     const SessionManager& sessions,
                     const TeleporterTransport& teleporter,
                     const ConfigApiTransport& configApi,
                     const ReadinessProber& prober,
                     MetricsCollector& metrics);

    /// @param stop checked before each secondary; set it to finish early
    CycleResult runCycle(const TriggerEvent& event, const std::atomic<bool>* stop = nullptr);

    /// Main's /config tree as seen by the most recent cycle, if one was fetched
    std::optional<Json::Value> lastMainConfig() const;

private:
    class MainData;

    SecondaryOutcome syncSecondary(const SyncJob& job, MainData& mainData, const TriggerEvent& event,
                                   const std::atomic<bool>* stop);
    void syncTeleporter(const SyncJob& job, const Session& session, MainData& mainData,
                        SecondaryOutcome& outcome);
    void syncApi(const SyncJob& job, const Session& session, MainData& mainData,
                 SecondaryOutcome& outcome, const std::atomic<bool>* stop);
    void record(const SecondaryOutcome& outcome);

    const Configuration& m_config;
    const SessionManager& m_sessions;
    const TeleporterTransport& m_teleporter;
    const ConfigApiTransport& m_configApi;
    const ReadinessProber& m_prober;
    MetricsCollector& m_metrics;

    DigestTracker m_digests;

    mutable std::mutex m_mutex;
    std::optional<Json::Value> m_lastMainConfig;
};

#endif // SYNC_ORCHESTRATOR_HPP
