#include "sync_orchestrator.hpp"
#include "config_filter.hpp"
#include "group_list_sync.hpp"
#include "metrics_collector.hpp"
#include "sync_errors.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <functional>

namespace {

bool stopRequested(const std::atomic<bool>* stop) {
    return stop != nullptr && stop->load();
}

/// A main-side fetch performed at most once per cycle. A failure is
/// remembered and rethrown to every secondary that needs the value.
template <typename T>
class Lazy {
public:
    const T& get(const std::function<T()>& fetch) {
        if (m_value) {
            return *m_value;
        }
        if (m_error) {
            std::rethrow_exception(m_error);
        }
        try {
            m_value = fetch();
        } catch (const std::exception&) {
            m_error = std::current_exception();
            throw;
        }
        return *m_value;
    }

    void seed(T value) { m_value = std::move(value); }
    const std::optional<T>& value() const { return m_value; }

private:
    std::optional<T> m_value;
    std::exception_ptr m_error;
};

} // namespace

class SyncOrchestrator::MainData {
public:
    MainData(const Session& session, const TeleporterTransport& teleporter, const ConfigApiTransport& configApi)
        : m_session(session), m_teleporter(teleporter), m_configApi(configApi) {}

    const BackupBlob& backup() {
        return m_backup.get([this] { return m_teleporter.exportBackup(m_session); });
    }

    const std::string& backupDigest() {
        return m_backupDigest.get([this] { return backup().digest(); });
    }

    const Json::Value& config() {
        return m_config.get([this] { return m_configApi.fetchConfig(m_session); });
    }

    const std::vector<Group>& groups() {
        return m_groups.get([this] { return m_configApi.fetchGroups(m_session); });
    }

    const std::vector<AdList>& lists() {
        return m_lists.get([this] { return m_configApi.fetchLists(m_session); });
    }

    void seedConfig(Json::Value config) { m_config.seed(std::move(config)); }
    const std::optional<Json::Value>& fetchedConfig() const { return m_config.value(); }

private:
    const Session& m_session;
    const TeleporterTransport& m_teleporter;
    const ConfigApiTransport& m_configApi;

    Lazy<BackupBlob> m_backup;
    Lazy<std::string> m_backupDigest;
    Lazy<Json::Value> m_config;
    Lazy<std::vector<Group>> m_groups;
    Lazy<std::vector<AdList>> m_lists;
};

SyncOrchestrator::SyncOrchestrator(const Configuration& config,
                                   const SessionManager& sessions,
                                   const TeleporterTransport& teleporter,
                                   const ConfigApiTransport& configApi,
                                   const ReadinessProber& prober,
                                   MetricsCollector& metrics)
    : m_config(config),
      m_sessions(sessions),
      m_teleporter(teleporter),
      m_configApi(configApi),
      m_prober(prober),
      m_metrics(metrics) {}

std::optional<Json::Value> SyncOrchestrator::lastMainConfig() const {
    std::lock_guard lock(m_mutex);
    return m_lastMainConfig;
}

CycleResult SyncOrchestrator::runCycle(const TriggerEvent& event, const std::atomic<bool>* stop) {
    CycleResult result;
    result.trigger = event;
    m_metrics.recordMetric("cycle_started", toString(event.source));
    spdlog::info("Starting sync ({}) from {} to {} secondaries",
                 toString(event.source), m_config.main.label(), m_config.secondaries.size());

    std::optional<Session> mainSession;
    try {
        mainSession.emplace(m_sessions.acquire(m_config.main));
    } catch (const AuthError& e) {
        spdlog::error("{}", e.what());
        for (const auto& secondary : m_config.secondaries) {
            SecondaryOutcome outcome;
            outcome.instance = secondary.label();
            outcome.mode = secondary.syncMode;
            outcome.status = OutcomeStatus::FAILED;
            outcome.error = ErrorKind::AUTH;
            outcome.reason = std::string("main login failed: ") + e.what();
            record(outcome);
            result.outcomes.push_back(std::move(outcome));
        }
        return result;
    }

    MainData mainData(*mainSession, m_teleporter, m_configApi);
    if (event.mainConfig) {
        mainData.seedConfig(*event.mainConfig);
    }

    for (const auto& secondary : m_config.secondaries) {
        if (stopRequested(stop)) {
            SecondaryOutcome outcome;
            outcome.instance = secondary.label();
            outcome.mode = secondary.syncMode;
            outcome.status = OutcomeStatus::SKIPPED;
            outcome.error = ErrorKind::CANCELLED;
            outcome.reason = "shutdown";
            record(outcome);
            result.outcomes.push_back(std::move(outcome));
            continue;
        }

        const SyncJob job{m_config.main, secondary, secondary.syncMode};
        auto outcome = syncSecondary(job, mainData, event, stop);
        record(outcome);
        result.outcomes.push_back(std::move(outcome));
    }

    if (mainData.fetchedConfig()) {
        std::lock_guard lock(m_mutex);
        m_lastMainConfig = *mainData.fetchedConfig();
    }

    mainSession->release();
    return result;
}

SecondaryOutcome SyncOrchestrator::syncSecondary(const SyncJob& job, MainData& mainData, const TriggerEvent& event,
                                                 const std::atomic<bool>* stop) {
    SecondaryOutcome outcome;
    outcome.instance = job.secondary.label();
    outcome.mode = job.mode;

    try {
        if (event.isConfigChange()) {
            m_prober.requireReady(job.secondary, m_config.sync.readinessTimeout(), stop);
        }
        Session session = m_sessions.acquire(job.secondary);
        if (job.mode == SyncMode::TELEPORTER) {
            syncTeleporter(job, session, mainData, outcome);
        } else {
            syncApi(job, session, mainData, outcome, stop);
        }
    } catch (const AuthError& e) {
        outcome.status = OutcomeStatus::FAILED;
        outcome.error = ErrorKind::AUTH;
        outcome.reason = e.what();
    } catch (const ReadinessTimeout& e) {
        outcome.status = OutcomeStatus::SKIPPED;
        if (stopRequested(stop)) {
            outcome.error = ErrorKind::CANCELLED;
            outcome.reason = "shutdown";
        } else {
            outcome.error = ErrorKind::READINESS;
            outcome.reason = e.what();
        }
    } catch (const std::exception& e) {
        outcome.status = OutcomeStatus::FAILED;
        outcome.error = ErrorKind::TRANSPORT;
        outcome.reason = e.what();
    }
    return outcome;
}

void SyncOrchestrator::syncTeleporter(const SyncJob& job, const Session& session, MainData& mainData,
                                      SecondaryOutcome& outcome) {
    const std::string label = job.secondary.label();
    const std::string key = label + "/teleporter";

    const auto& blob = mainData.backup();
    const auto& digest = mainData.backupDigest();
    if (!m_digests.hasChanged(key, digest)) {
        spdlog::info("[{}] backup unchanged since the last import, skipping", label);
        outcome.reason = "backup unchanged";
        return;
    }

    spdlog::info("[{}] uploading backup", label);
    m_teleporter.importBackup(session, blob, job.secondary.importOptions);
    m_digests.update(key, digest);
    m_metrics.recordMetric("backup_imported", label);

    if (job.secondary.updateGravity) {
        try {
            m_configApi.updateGravity(session);
        } catch (const TransportError& e) {
            outcome.status = OutcomeStatus::DEGRADED;
            outcome.error = ErrorKind::TRANSPORT;
            outcome.reason = std::string("gravity update failed: ") + e.what();
        }
    }
}

void SyncOrchestrator::syncApi(const SyncJob& job, const Session& session, MainData& mainData,
                               SecondaryOutcome& outcome, const std::atomic<bool>* stop) {
    const std::string label = job.secondary.label();
    if (!job.secondary.apiSyncOptions) {
        spdlog::warn("[{}] sync_mode is api but api_sync_options is missing; nothing to sync", label);
        outcome.warnings.push_back("no api_sync_options configured");
        return;
    }
    const ApiSyncOptions& options = *job.secondary.apiSyncOptions;

    if (options.config) {
        const Json::Value filtered = applyFilter(mainData.config(), *options.config);
        const std::string key = label + "/config";
        const std::string digest = digest::ofJson(filtered);

        if (!m_digests.hasChanged(key, digest)) {
            spdlog::info("[{}] filtered config unchanged since the last push, skipping", label);
        } else {
            spdlog::info("[{}] syncing config via API", label);
            const PushResult push = m_configApi.pushConfig(session, filtered);
            if (push.degraded()) {
                outcome.status = OutcomeStatus::DEGRADED;
                outcome.error = ErrorKind::TRANSPORT;
                outcome.rejectedKeys = push.rejectedKeys;
                outcome.reason = std::to_string(push.rejectedKeys.size()) + " config key(s) rejected";
            } else {
                // a partial push is retried in full next cycle
                m_digests.update(key, digest);
            }

            // FTL may restart to apply the new config
            if (!push.appliedKeys.empty() &&
                m_prober.waitReady(job.secondary, m_config.sync.readinessTimeout(), stop) != Readiness::READY) {
                outcome.status = OutcomeStatus::DEGRADED;
                outcome.error = ErrorKind::READINESS;
                outcome.reason = "API not ready after config push";
                return;
            }
        }
    }

    const GroupsListsPolicy& policy = options.groupsLists;
    if (!policy.syncGroups && !policy.syncLists) {
        return;
    }

    GroupListSync groupListSync(m_configApi);
    if (policy.syncGroups) {
        groupListSync.syncGroups(session, mainData.groups());
    }
    if (policy.syncLists) {
        // main groups are needed for the id -> name mapping even without group sync
        const bool listsChanged = groupListSync.syncLists(session, mainData.lists(), mainData.groups(),
                                                          policy.syncGroups, outcome.warnings);
        if (listsChanged && job.secondary.updateGravity) {
            spdlog::info("[{}] lists changed, triggering gravity update", label);
            try {
                m_configApi.updateGravity(session);
            } catch (const TransportError& e) {
                outcome.status = OutcomeStatus::DEGRADED;
                outcome.error = ErrorKind::TRANSPORT;
                outcome.reason = std::string("gravity update failed: ") + e.what();
            }
        }
    }
}

void SyncOrchestrator::record(const SecondaryOutcome& outcome) {
    switch (outcome.status) {
        case OutcomeStatus::SUCCEEDED:
            spdlog::info("[{}] sync succeeded ({}){}", outcome.instance, toString(outcome.mode),
                         outcome.reason.empty() ? "" : ": " + outcome.reason);
            m_metrics.recordMetric("secondary_synced", outcome.instance);
            break;
        case OutcomeStatus::DEGRADED:
            spdlog::warn("[{}] sync degraded: {}", outcome.instance, outcome.reason);
            m_metrics.recordMetric("secondary_degraded", outcome.instance);
            break;
        case OutcomeStatus::FAILED:
            spdlog::error("[{}] sync failed: {}", outcome.instance, outcome.reason);
            m_metrics.recordMetric("secondary_failed", outcome.instance);
            break;
        case OutcomeStatus::SKIPPED:
            spdlog::warn("[{}] sync skipped: {}", outcome.instance, outcome.reason);
            m_metrics.recordMetric("secondary_skipped", outcome.instance);
            break;
    }
}
