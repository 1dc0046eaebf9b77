#include "configuration.hpp"
#include "config_filter.hpp"
#include "sync_errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <limits>

namespace {

template <typename T>
T valueOr(const YAML::Node& node, const char* key, const std::string& context, T fallback) {
    const YAML::Node child = node[key];
    if (!child || child.IsNull()) {
        return fallback;
    }
    try {
        return child.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(context + "." + key + ": invalid value (" + e.msg + ")");
    }
}

template <typename T>
T required(const YAML::Node& node, const char* key, const std::string& context) {
    const YAML::Node child = node[key];
    if (!child || child.IsNull()) {
        throw ConfigurationError(context + "." + key + " is required");
    }
    try {
        return child.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(context + "." + key + ": invalid value (" + e.msg + ")");
    }
}

// import_options is forwarded verbatim to the teleporter endpoint, so keep it
// as a JSON document rather than a typed struct.
Json::Value toJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            Json::Value object(Json::objectValue);
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = toJson(entry.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            Json::Value array(Json::arrayValue);
            for (const auto& element : node) {
                array.append(toJson(element));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            bool flag;
            if (YAML::convert<bool>::decode(node, flag)) {
                return Json::Value(flag);
            }
            Json::Int64 integer;
            if (YAML::convert<Json::Int64>::decode(node, integer)) {
                return Json::Value(integer);
            }
            double number;
            if (YAML::convert<double>::decode(node, number)) {
                return Json::Value(number);
            }
            return Json::Value(node.Scalar());
        }
        default:
            return Json::Value(Json::nullValue);
    }
}

TriggerKind parseTriggerKind(const std::string& value) {
    if (value == "interval") return TriggerKind::INTERVAL;
    if (value == "watch_config_file") return TriggerKind::WATCH_CONFIG_FILE;
    if (value == "watch_config_api") return TriggerKind::WATCH_CONFIG_API;
    throw ConfigurationError("sync.trigger_mode: unknown trigger mode '" + value + "'");
}

SyncMode parseSyncMode(const std::string& value, const std::string& context) {
    if (value == "teleporter") return SyncMode::TELEPORTER;
    if (value == "api") return SyncMode::API;
    throw ConfigurationError(context + ".sync_mode: unknown sync mode '" + value + "'");
}

ConfigFilterPolicy parseFilterPolicy(const YAML::Node& node, const std::string& context) {
    ConfigFilterPolicy policy;
    if (!node.IsMap()) {
        throw FilterConfigError(context + ": sync_config must be a mapping");
    }

    const auto mode = valueOr<std::string>(node, "mode", context, "include");
    if (mode == "include") {
        policy.mode = FilterMode::INCLUDE;
    } else if (mode == "exclude") {
        policy.mode = FilterMode::EXCLUDE;
    } else {
        throw FilterConfigError(context + ".mode: unknown filter mode '" + mode + "'");
    }

    const YAML::Node keys = node["filter_keys"];
    if (keys && !keys.IsNull()) {
        if (!keys.IsSequence()) {
            throw FilterConfigError(context + ".filter_keys must be a list of dotted key paths");
        }
        for (const auto& key : keys) {
            if (!key.IsScalar()) {
                throw FilterConfigError(context + ".filter_keys: entries must be strings");
            }
            policy.keys.insert(key.Scalar());
        }
    }

    validatePolicy(policy);
    return policy;
}

ApiSyncOptions parseApiSyncOptions(const YAML::Node& node, const std::string& context) {
    ApiSyncOptions options;
    const YAML::Node syncConfig = node["sync_config"];
    if (syncConfig && !syncConfig.IsNull()) {
        options.config = parseFilterPolicy(syncConfig, context + ".sync_config");
    }
    options.groupsLists.syncGroups = valueOr<bool>(node, "sync_groups", context, false);
    options.groupsLists.syncLists = valueOr<bool>(node, "sync_lists", context, false);
    return options;
}

InstanceConfig parseInstance(const YAML::Node& node, const std::string& context, bool secondary) {
    if (!node || !node.IsMap()) {
        throw ConfigurationError(context + " must be a mapping");
    }

    InstanceConfig instance;
    instance.host = required<std::string>(node, "host", context);
    instance.schema = valueOr<std::string>(node, "schema", context, "https");
    const int defaultPort = instance.schema == "http" ? 80 : 443;
    const int port = valueOr<int>(node, "port", context, defaultPort);
    if (port < 1 || port > std::numeric_limits<uint16_t>::max()) {
        throw ConfigurationError(context + ".port: " + std::to_string(port) + " is out of range");
    }
    instance.port = static_cast<uint16_t>(port);
    instance.apiKey = required<std::string>(node, "api_key", context);
    instance.updateGravity = valueOr<bool>(node, "update_gravity", context, false);

    if (!secondary) {
        return instance;
    }

    instance.syncMode = parseSyncMode(valueOr<std::string>(node, "sync_mode", context, "teleporter"), context);

    const YAML::Node importOptions = node["import_options"];
    if (importOptions && !importOptions.IsNull()) {
        if (!importOptions.IsMap()) {
            throw ConfigurationError(context + ".import_options must be a mapping");
        }
        instance.importOptions = toJson(importOptions);
    }

    const YAML::Node apiOptions = node["api_sync_options"];
    if (apiOptions && !apiOptions.IsNull()) {
        if (!apiOptions.IsMap()) {
            throw ConfigurationError(context + ".api_sync_options must be a mapping");
        }
        instance.apiSyncOptions = parseApiSyncOptions(apiOptions, context + ".api_sync_options");
    }
    return instance;
}

SyncSettings parseSyncSettings(const YAML::Node& node) {
    SyncSettings settings;
    if (!node || node.IsNull()) {
        return settings;
    }
    if (!node.IsMap()) {
        throw ConfigurationError("sync must be a mapping");
    }

    settings.triggerMode = parseTriggerKind(valueOr<std::string>(node, "trigger_mode", "sync", "interval"));
    settings.intervalMinutes = valueOr<int>(node, "interval", "sync", settings.intervalMinutes);
    if (node["api_poll_interval"] && !node["api_poll_interval"].IsNull()) {
        settings.apiPollIntervalMinutes = required<int>(node, "api_poll_interval", "sync");
    }
    settings.configPath = valueOr<std::string>(node, "config_path", "sync", settings.configPath);
    settings.readinessTimeoutSecs = valueOr<int>(node, "trigger_api_readiness_timeout_secs", "sync",
                                                 settings.readinessTimeoutSecs);
    settings.cacheLocation = valueOr<std::string>(node, "cache_location", "sync", settings.cacheLocation);
    settings.httpTimeoutSecs = valueOr<int>(node, "http_timeout_secs", "sync", settings.httpTimeoutSecs);
    settings.apiWriteThrottleMs = valueOr<int>(node, "api_write_throttle_ms", "sync", settings.apiWriteThrottleMs);
    return settings;
}

void validateInstance(const InstanceConfig& instance, const std::string& context) {
    if (instance.host.empty()) {
        throw ConfigurationError(context + ".host must not be empty");
    }
    if (instance.schema != "http" && instance.schema != "https") {
        throw ConfigurationError(context + ".schema must be http or https, got '" + instance.schema + "'");
    }
    if (instance.port == 0) {
        throw ConfigurationError(context + ".port must be in 1..65535");
    }
    if (instance.apiKey.empty()) {
        throw ConfigurationError(context + ".api_key must not be empty");
    }
    if (instance.apiSyncOptions && instance.apiSyncOptions->config) {
        validatePolicy(*instance.apiSyncOptions->config);
    }
}

Configuration fromNode(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigurationError("configuration root must be a mapping");
    }

    Configuration config;
    config.sync = parseSyncSettings(root["sync"]);
    config.main = parseInstance(root["main"], "main", false);

    const YAML::Node secondaries = root["secondary"];
    if (secondaries && !secondaries.IsNull()) {
        if (!secondaries.IsSequence()) {
            throw ConfigurationError("secondary must be a list of instances");
        }
        for (std::size_t i = 0; i < secondaries.size(); ++i) {
            config.secondaries.push_back(
                parseInstance(secondaries[i], "secondary[" + std::to_string(i) + "]", true));
        }
    }

    config.validate();
    return config;
}

} // namespace

const char* toString(SyncMode mode) {
    return mode == SyncMode::API ? "api" : "teleporter";
}

const char* toString(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::INTERVAL: return "interval";
        case TriggerKind::WATCH_CONFIG_FILE: return "watch_config_file";
        case TriggerKind::WATCH_CONFIG_API: return "watch_config_api";
    }
    return "interval";
}

std::string InstanceConfig::label() const {
    return host + ":" + std::to_string(port);
}

std::chrono::minutes SyncSettings::apiPollInterval() const {
    return std::chrono::minutes(apiPollIntervalMinutes.value_or(intervalMinutes));
}

Configuration::Configuration() = default;

Configuration Configuration::fromYaml(const std::string& document) {
    YAML::Node root;
    try {
        root = YAML::Load(document);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("malformed YAML: ") + e.what());
    }
    return fromNode(root);
}

Configuration Configuration::loadFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigurationError("cannot read configuration file " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
    return fromNode(root);
}

void Configuration::validate() const {
    if (sync.intervalMinutes <= 0) {
        throw ConfigurationError("sync.interval must be greater than zero");
    }
    if (sync.apiPollIntervalMinutes && *sync.apiPollIntervalMinutes <= 0) {
        throw ConfigurationError("sync.api_poll_interval must be greater than zero");
    }
    if (sync.readinessTimeoutSecs <= 0) {
        throw ConfigurationError("sync.trigger_api_readiness_timeout_secs must be greater than zero");
    }
    if (sync.httpTimeoutSecs <= 0) {
        throw ConfigurationError("sync.http_timeout_secs must be greater than zero");
    }
    if (sync.apiWriteThrottleMs < 0) {
        throw ConfigurationError("sync.api_write_throttle_ms must not be negative");
    }
    if (sync.triggerMode == TriggerKind::WATCH_CONFIG_FILE && sync.configPath.empty()) {
        throw ConfigurationError("sync.config_path is required for watch_config_file");
    }
    if (hasTeleporterSecondaries() && sync.cacheLocation.empty()) {
        throw ConfigurationError("sync.cache_location is required for teleporter secondaries");
    }

    validateInstance(main, "main");
    for (std::size_t i = 0; i < secondaries.size(); ++i) {
        validateInstance(secondaries[i], "secondary[" + std::to_string(i) + "]");
    }
}

bool Configuration::hasTeleporterSecondaries() const {
    return std::any_of(secondaries.begin(), secondaries.end(), [](const InstanceConfig& instance) {
        return instance.syncMode == SyncMode::TELEPORTER;
    });
}
