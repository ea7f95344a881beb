#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace wsync::config {

constexpr static uintmax_t DEFAULT_MULTIPART_THRESHOLD = static_cast<uintmax_t>(64) * 1024 * 1024; // 64MiB
constexpr static uintmax_t DEFAULT_MULTIPART_PART_SIZE = static_cast<uintmax_t>(16) * 1024 * 1024; // 16MiB

struct S3Config {
    std::string bucket;
    std::string endpoint;            // empty = AWS virtual endpoint for region
    std::string region = "us-east-1";
    std::string access_key;
    std::string secret_key;
    bool secure = true;
    bool verify_ssl = true;
    std::chrono::seconds request_timeout{60};
    unsigned int max_concurrent_transfers = 10;
    unsigned int max_retry_attempts = 3;
    std::chrono::milliseconds initial_backoff{200};
    std::chrono::milliseconds max_backoff{5000};
    uintmax_t multipart_threshold = DEFAULT_MULTIPART_THRESHOLD;
    uintmax_t multipart_part_size = DEFAULT_MULTIPART_PART_SIZE;

    // Overwrite fields with the AWS_* environment variables that are set.
    // loadConfig() applies this before decoding YAML, so the file wins.
    void applyEnvironment();

    // Endpoint with its scheme forced to match `secure`.
    [[nodiscard]] std::string effectiveEndpoint() const;

    // Throws std::invalid_argument when the bucket is missing or limits are zero.
    void validate() const;
};

struct WatcherConfig {
    std::chrono::milliseconds min_debounce{2000};
    std::chrono::milliseconds max_debounce{30000};
    double burst_threshold = 10.0;                  // changes per second
    std::chrono::milliseconds poll_interval{500};
    double growth_factor = 1.5;
    double decay_factor = 0.9;
    std::vector<std::string> ignore_patterns = defaultIgnorePatterns();
    bool ignore_hidden = true;

    static std::vector<std::string> defaultIgnorePatterns();

    void validate() const;
};

struct WorkspaceConfig {
    std::filesystem::path root_path = "/workspace";
    std::chrono::seconds backup_interval{300};
    std::chrono::seconds final_sync_timeout{30};
    bool git_enabled = true;
    std::string git_executable = "git";
    std::string tar_executable = "tar";
    std::vector<std::string> backup_excludes = defaultBackupExcludes();

    static std::vector<std::string> defaultBackupExcludes();
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum wsync   = spdlog::level::info;   // Startup, shutdown, lifecycle transitions
    spdlog::level::level_enum watcher = spdlog::level::info;   // Scan results, debounce adjustments
    spdlog::level::level_enum cloud   = spdlog::level::info;   // S3 requests that fail or retry
    spdlog::level::level_enum sync    = spdlog::level::info;   // Batches uploaded or deleted
    spdlog::level::level_enum backup  = spdlog::level::info;   // Archive creation and upload
    spdlog::level::level_enum git     = spdlog::level::info;   // Bundle create / restore
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/tmp/wsync/logs";
    LogLevelsConfig levels;
};

struct Config {
    S3Config storage;
    WatcherConfig watcher;
    WorkspaceConfig workspace;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);
Config loadConfigFromString(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const S3Config& c);
void to_json(nlohmann::json& j, const WatcherConfig& c);
void to_json(nlohmann::json& j, const WorkspaceConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace wsync::config
