#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <json/json.h>

enum class SyncMode {
    TELEPORTER,  // full backup export/import
    API          // filtered config tree, groups and lists over the REST API
};

enum class FilterMode {
    INCLUDE,  // only the listed key paths are synced
    EXCLUDE   // everything except the listed key paths is synced
};

enum class TriggerKind {
    INTERVAL,
    WATCH_CONFIG_FILE,
    WATCH_CONFIG_API
};

const char* toString(SyncMode mode);
const char* toString(TriggerKind kind);

/// Include/exclude policy over dotted `/config` key paths
struct ConfigFilterPolicy {
    FilterMode mode = FilterMode::INCLUDE;
    std::set<std::string> keys;
};

struct GroupsListsPolicy {
    bool syncGroups = false;
    bool syncLists = false;
};

struct ApiSyncOptions {
    std::optional<ConfigFilterPolicy> config;  // absent: /config is not synced
    GroupsListsPolicy groupsLists;
};

/// One Pi-hole node. Immutable once loaded; session tokens live in Session.
struct InstanceConfig {
    std::string host;
    std::string schema = "https";
    uint16_t port = 443;
    std::string apiKey;
    bool updateGravity = false;

    // secondaries only
    SyncMode syncMode = SyncMode::TELEPORTER;
    std::optional<Json::Value> importOptions;
    std::optional<ApiSyncOptions> apiSyncOptions;

    /// host:port, used as the instance identity in logs and results
    std::string label() const;
};

struct SyncSettings {
    TriggerKind triggerMode = TriggerKind::INTERVAL;
    int intervalMinutes = 60;
    std::optional<int> apiPollIntervalMinutes;
    std::string configPath = "/etc/pihole/pihole.toml";
    int readinessTimeoutSecs = 60;
    std::string cacheLocation = "/var/cache/pihole-sync";
    int httpTimeoutSecs = 30;
    int apiWriteThrottleMs = 250;

    std::chrono::minutes interval() const { return std::chrono::minutes(intervalMinutes); }
    /// poll interval for watch_config_api, falling back to the sync interval
    std::chrono::minutes apiPollInterval() const;
    std::chrono::seconds readinessTimeout() const { return std::chrono::seconds(readinessTimeoutSecs); }
};

class Configuration {
public:

    Configuration();

    SyncSettings sync;
    InstanceConfig main;
    std::vector<InstanceConfig> secondaries;

    /// Parse a YAML document. Throws ConfigurationError or FilterConfigError.
    static Configuration fromYaml(const std::string& document);

    /// Load and validate a YAML file
    static Configuration loadFile(const std::string& path);

    /// Throws ConfigurationError / FilterConfigError on the first problem found
    void validate() const;

    bool hasTeleporterSecondaries() const;
};

inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/pihole-sync/config.yaml";

#endif //CONFIGURATION_HPP
