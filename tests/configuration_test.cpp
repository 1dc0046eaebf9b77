#include <gtest/gtest.h>
#include "configuration.hpp"
#include "sync_errors.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace {

const char* MINIMAL = R"(
main:
  host: pi1.lan
  api_key: main-secret
secondary:
  - host: pi2.lan
    api_key: second-secret
)";

} // namespace

// Test default configuration values
TEST(ConfigurationTest, DefaultValues) {
    const Configuration config = Configuration::fromYaml(MINIMAL);

    EXPECT_EQ(config.sync.triggerMode, TriggerKind::INTERVAL);
    EXPECT_EQ(config.sync.intervalMinutes, 60);
    EXPECT_EQ(config.sync.apiPollInterval(), std::chrono::minutes(60));
    EXPECT_EQ(config.sync.readinessTimeout(), std::chrono::seconds(60));
    EXPECT_EQ(config.sync.configPath, "/etc/pihole/pihole.toml");
    EXPECT_EQ(config.sync.cacheLocation, "/var/cache/pihole-sync");
    EXPECT_EQ(config.sync.apiWriteThrottleMs, 250);

    EXPECT_EQ(config.main.schema, "https");
    EXPECT_EQ(config.main.port, 443);
    EXPECT_EQ(config.main.label(), "pi1.lan:443");
    EXPECT_FALSE(config.main.updateGravity);

    ASSERT_EQ(config.secondaries.size(), 1u);
    EXPECT_EQ(config.secondaries[0].syncMode, SyncMode::TELEPORTER);
    EXPECT_FALSE(config.secondaries[0].importOptions.has_value());
    EXPECT_FALSE(config.secondaries[0].apiSyncOptions.has_value());
    EXPECT_TRUE(config.hasTeleporterSecondaries());
}

TEST(ConfigurationTest, FullDocument) {
    const Configuration config = Configuration::fromYaml(R"(
sync:
  trigger_mode: watch_config_api
  interval: 15
  api_poll_interval: 2
  trigger_api_readiness_timeout_secs: 30
  cache_location: /tmp/pihole-sync
  api_write_throttle_ms: 0
main:
  host: 192.168.1.2
  schema: http
  api_key: main-secret
secondary:
  - host: 192.168.1.3
    port: 8443
    api_key: s1
    update_gravity: true
    import_options:
      config: true
      gravity:
        group: true
        adlist: false
  - host: 192.168.1.4
    api_key: s2
    sync_mode: api
    api_sync_options:
      sync_config:
        mode: exclude
        filter_keys: [dns.interface, webserver]
      sync_groups: true
      sync_lists: true
)");

    EXPECT_EQ(config.sync.triggerMode, TriggerKind::WATCH_CONFIG_API);
    EXPECT_EQ(config.sync.interval(), std::chrono::minutes(15));
    EXPECT_EQ(config.sync.apiPollInterval(), std::chrono::minutes(2));
    EXPECT_EQ(config.sync.readinessTimeoutSecs, 30);
    EXPECT_EQ(config.sync.apiWriteThrottleMs, 0);

    EXPECT_EQ(config.main.port, 80);
    EXPECT_EQ(config.main.label(), "192.168.1.2:80");

    const auto& teleporter = config.secondaries[0];
    EXPECT_EQ(teleporter.port, 8443);
    EXPECT_TRUE(teleporter.updateGravity);
    ASSERT_TRUE(teleporter.importOptions.has_value());
    EXPECT_TRUE((*teleporter.importOptions)["config"].asBool());
    EXPECT_TRUE((*teleporter.importOptions)["gravity"]["group"].asBool());
    EXPECT_FALSE((*teleporter.importOptions)["gravity"]["adlist"].asBool());

    const auto& api = config.secondaries[1];
    EXPECT_EQ(api.syncMode, SyncMode::API);
    ASSERT_TRUE(api.apiSyncOptions.has_value());
    ASSERT_TRUE(api.apiSyncOptions->config.has_value());
    EXPECT_EQ(api.apiSyncOptions->config->mode, FilterMode::EXCLUDE);
    EXPECT_EQ(api.apiSyncOptions->config->keys, (std::set<std::string>{"dns.interface", "webserver"}));
    EXPECT_TRUE(api.apiSyncOptions->groupsLists.syncGroups);
    EXPECT_TRUE(api.apiSyncOptions->groupsLists.syncLists);
}

TEST(ConfigurationTest, ApiPollIntervalFallsBackToInterval) {
    const Configuration config = Configuration::fromYaml(R"(
sync:
  trigger_mode: watch_config_api
  interval: 5
main: {host: pi1, api_key: k}
)");
    EXPECT_EQ(config.sync.apiPollInterval(), std::chrono::minutes(5));
    EXPECT_TRUE(config.secondaries.empty());
}

TEST(ConfigurationTest, MissingRequiredFields) {
    EXPECT_THROW(Configuration::fromYaml("secondary: []"), ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("main: {api_key: k}"), ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("main: {host: pi1}"), ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("main: {host: pi1, api_key: ''}"), ConfigurationError);
}

TEST(ConfigurationTest, InvalidValues) {
    EXPECT_THROW(Configuration::fromYaml("main: {host: pi1, api_key: k, schema: ftp}"), ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("main: {host: pi1, api_key: k, port: 70000}"), ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("main: {host: pi1, api_key: k, port: abc}"), ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("sync: {trigger_mode: cron}\nmain: {host: pi1, api_key: k}"),
                 ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("sync: {interval: 0}\nmain: {host: pi1, api_key: k}"),
                 ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("sync: {api_write_throttle_ms: -1}\nmain: {host: pi1, api_key: k}"),
                 ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml(R"(
main: {host: pi1, api_key: k}
secondary:
  - {host: pi2, api_key: k, sync_mode: rsync}
)"), ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("main: {host: pi1, api_key: k}\nsecondary: pi2"), ConfigurationError);
}

TEST(ConfigurationTest, MalformedYaml) {
    EXPECT_THROW(Configuration::fromYaml("main: [unclosed"), ConfigurationError);
    EXPECT_THROW(Configuration::fromYaml("just a string"), ConfigurationError);
}

TEST(ConfigurationTest, MalformedFilterPolicy) {
    const char* badMode = R"(
main: {host: pi1, api_key: k}
secondary:
  - host: pi2
    api_key: k
    sync_mode: api
    api_sync_options:
      sync_config: {mode: only, filter_keys: [dns]}
)";
    EXPECT_THROW(Configuration::fromYaml(badMode), FilterConfigError);

    const char* badKey = R"(
main: {host: pi1, api_key: k}
secondary:
  - host: pi2
    api_key: k
    sync_mode: api
    api_sync_options:
      sync_config: {mode: include, filter_keys: ["dns..upstreams"]}
)";
    EXPECT_THROW(Configuration::fromYaml(badKey), FilterConfigError);

    const char* notAList = R"(
main: {host: pi1, api_key: k}
secondary:
  - host: pi2
    api_key: k
    sync_mode: api
    api_sync_options:
      sync_config: {mode: include, filter_keys: dns.upstreams}
)";
    EXPECT_THROW(Configuration::fromYaml(notAList), FilterConfigError);
}

TEST(ConfigurationTest, LoadFile) {
    const auto path = std::filesystem::temp_directory_path() / ("pihole_sync_config_" + std::to_string(::getpid()) + ".yaml");
    {
        std::ofstream file(path);
        file << MINIMAL;
    }

    const Configuration config = Configuration::loadFile(path.string());
    EXPECT_EQ(config.main.host, "pi1.lan");
    std::filesystem::remove(path);

    EXPECT_THROW(Configuration::loadFile(path.string()), ConfigurationError);
}
