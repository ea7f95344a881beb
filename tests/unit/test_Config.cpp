#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/util.hpp"

#include <cstdlib>
#include <optional>
#include <nlohmann/json.hpp>

using namespace std::chrono_literals;
using namespace wsync::config;

namespace {

// Sets or clears an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(std::string name, const char* value) : name_(std::move(name)) {
        if (const char* old = std::getenv(name_.c_str())) old_ = old;
        if (value) ::setenv(name_.c_str(), value, 1);
        else ::unsetenv(name_.c_str());
    }
    ~EnvGuard() {
        if (old_) ::setenv(name_.c_str(), old_->c_str(), 1);
        else ::unsetenv(name_.c_str());
    }

private:
    std::string name_;
    std::optional<std::string> old_;
};

}

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    const EnvGuard bucket("AWS_S3_BUCKET", nullptr);
    const auto cfg = loadConfigFromString("");

    EXPECT_EQ(cfg.watcher.min_debounce, 2000ms);
    EXPECT_EQ(cfg.watcher.max_debounce, 30000ms);
    EXPECT_DOUBLE_EQ(cfg.watcher.burst_threshold, 10.0);
    EXPECT_EQ(cfg.watcher.poll_interval, 500ms);
    EXPECT_DOUBLE_EQ(cfg.watcher.growth_factor, 1.5);
    EXPECT_DOUBLE_EQ(cfg.watcher.decay_factor, 0.9);
    EXPECT_EQ(cfg.workspace.backup_interval, 300s);
    EXPECT_EQ(cfg.workspace.final_sync_timeout, 30s);
    EXPECT_EQ(cfg.workspace.root_path.string(), "/workspace");
    EXPECT_EQ(cfg.storage.max_concurrent_transfers, 10u);
    EXPECT_EQ(cfg.storage.max_retry_attempts, 3u);
    EXPECT_TRUE(cfg.storage.bucket.empty());
    EXPECT_THROW(cfg.storage.validate(), std::invalid_argument);
}

TEST(ConfigTest, YamlOverridesFields) {
    const auto cfg = loadConfigFromString(R"(
storage:
  bucket: workspaces
  endpoint: minio:9000
  secure: false
  max_concurrent_transfers: 4
  multipart_threshold: 128MB
watcher:
  min_debounce: 500ms
  max_debounce: 1m
  extra_ignore_patterns: ["*.log"]
workspace:
  root_path: /srv/ws
  backup_interval: 10m
  git_enabled: false
logging:
  log_dir: /var/log/wsync
  log_levels:
    subsystem_levels:
      watcher: debug
)");

    EXPECT_EQ(cfg.storage.bucket, "workspaces");
    EXPECT_EQ(cfg.storage.effectiveEndpoint(), "http://minio:9000");
    EXPECT_EQ(cfg.storage.max_concurrent_transfers, 4u);
    EXPECT_EQ(cfg.storage.multipart_threshold, 128u * 1024 * 1024);
    EXPECT_EQ(cfg.watcher.min_debounce, 500ms);
    EXPECT_EQ(cfg.watcher.max_debounce, 60000ms);
    EXPECT_EQ(cfg.watcher.ignore_patterns.back(), "*.log");
    EXPECT_EQ(cfg.workspace.root_path.string(), "/srv/ws");
    EXPECT_EQ(cfg.workspace.backup_interval, 600s);
    EXPECT_FALSE(cfg.workspace.git_enabled);
    EXPECT_EQ(cfg.logging.log_dir.string(), "/var/log/wsync");
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.watcher, spdlog::level::debug);
    EXPECT_NO_THROW(cfg.storage.validate());
}

TEST(ConfigTest, EnvironmentFillsStorageAndFileWins) {
    const EnvGuard bucket("AWS_S3_BUCKET", "from-env");
    const EnvGuard region("AWS_DEFAULT_REGION", "eu-west-1");
    const EnvGuard key("AWS_ACCESS_KEY_ID", "AKIA-ENV");
    const EnvGuard secure("AWS_S3_SECURE", "false");
    const EnvGuard endpoint("AWS_S3_ENDPOINT", nullptr);

    const auto envOnly = loadConfigFromString("");
    EXPECT_EQ(envOnly.storage.bucket, "from-env");
    EXPECT_EQ(envOnly.storage.region, "eu-west-1");
    EXPECT_EQ(envOnly.storage.access_key, "AKIA-ENV");
    EXPECT_FALSE(envOnly.storage.secure);
    EXPECT_EQ(envOnly.storage.effectiveEndpoint(), "https://s3.eu-west-1.amazonaws.com");

    const auto fileWins = loadConfigFromString("storage:\n  bucket: from-file\n");
    EXPECT_EQ(fileWins.storage.bucket, "from-file");
    EXPECT_EQ(fileWins.storage.region, "eu-west-1");
}

TEST(ConfigTest, SecureForcesEndpointScheme) {
    S3Config s3;
    s3.endpoint = "http://storage.local:9000/";
    s3.secure = true;
    EXPECT_EQ(s3.effectiveEndpoint(), "https://storage.local:9000");
    s3.secure = false;
    s3.endpoint = "https://storage.local";
    EXPECT_EQ(s3.effectiveEndpoint(), "http://storage.local");
}

TEST(ConfigTest, InvalidWatcherBoundsAreRejected) {
    EXPECT_THROW(loadConfigFromString("watcher:\n  min_debounce: 10s\n  max_debounce: 2s\n"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString("watcher:\n  decay_factor: 1.5\n"), std::invalid_argument);
    EXPECT_THROW(loadConfigFromString("- just\n- a list\n"), std::invalid_argument);
}

TEST(ConfigTest, DurationHelpers) {
    EXPECT_EQ(parseDuration("250ms"), 250ms);
    EXPECT_EQ(parseDuration("1.5s"), 1500ms);
    EXPECT_EQ(parseDuration("2m"), 120000ms);
    EXPECT_EQ(parseDuration("3"), 3000ms);
    EXPECT_THROW(parseDuration("soon"), std::invalid_argument);
    EXPECT_THROW(parseDuration(""), std::invalid_argument);
    EXPECT_EQ(durationToStr(120000ms), "2m");
    EXPECT_EQ(durationToStr(1500ms), "1500ms");
    EXPECT_TRUE(parseBool("YES", false));
    EXPECT_FALSE(parseBool("off", true));
    EXPECT_TRUE(parseBool("maybe", true));
}

TEST(ConfigTest, JsonNeverContainsSecrets) {
    Config cfg;
    cfg.storage.bucket = "b";
    cfg.storage.access_key = "AKIA-SECRET-ID";
    cfg.storage.secret_key = "very-secret";

    const auto dumped = nlohmann::json(cfg).dump();
    EXPECT_EQ(dumped.find("very-secret"), std::string::npos);
    EXPECT_EQ(dumped.find("AKIA-SECRET-ID"), std::string::npos);
    EXPECT_NE(dumped.find("\"access_key_set\":true"), std::string::npos);

    const auto yaml = YAML::convert<S3Config>::encode(cfg.storage);
    EXPECT_FALSE(yaml["secret_key"]);
    EXPECT_FALSE(yaml["access_key"]);
}
