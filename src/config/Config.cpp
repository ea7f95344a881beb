#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/util.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

namespace wsync::config {

static std::optional<std::string> envValue(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

void S3Config::applyEnvironment() {
    if (const auto v = envValue("AWS_S3_BUCKET")) bucket = *v;
    if (const auto v = envValue("AWS_DEFAULT_REGION")) region = *v;
    if (const auto v = envValue("AWS_S3_ENDPOINT")) endpoint = *v;
    if (const auto v = envValue("AWS_ACCESS_KEY_ID")) access_key = *v;
    if (const auto v = envValue("AWS_SECRET_ACCESS_KEY")) secret_key = *v;
    if (const auto v = envValue("AWS_S3_SECURE")) secure = parseBool(*v, secure);
    if (const auto v = envValue("AWS_S3_VERIFY_SSL")) verify_ssl = parseBool(*v, verify_ssl);
}

std::string S3Config::effectiveEndpoint() const {
    const auto r = region.empty() ? std::string("us-east-1") : region;
    if (endpoint.empty()) return fmt::format("https://s3.{}.amazonaws.com", r);

    static constexpr std::string_view http = "http://";
    static constexpr std::string_view https = "https://";

    std::string host = endpoint;
    if (host.starts_with(https)) host = host.substr(https.size());
    else if (host.starts_with(http)) host = host.substr(http.size());
    while (!host.empty() && host.back() == '/') host.pop_back();

    return std::string(secure ? https : http) + host;
}

void S3Config::validate() const {
    if (bucket.empty())
        throw std::invalid_argument("S3 bucket is not configured (storage.bucket or AWS_S3_BUCKET)");
    if (max_concurrent_transfers == 0)
        throw std::invalid_argument("storage.max_concurrent_transfers must be at least 1");
    if (max_retry_attempts == 0)
        throw std::invalid_argument("storage.max_retry_attempts must be at least 1");
    if (multipart_part_size < 5 * 1024 * 1024)
        throw std::invalid_argument("storage.multipart_part_size must be at least 5MB");
}

std::vector<std::string> WatcherConfig::defaultIgnorePatterns() {
    return {
        ".git/index.lock", ".git/FETCH_HEAD", ".git/HEAD.lock", ".git/refs/heads/",
        "__pycache__", ".pytest_cache", "node_modules", ".DS_Store", ".vscode", ".idea",
        "*.pyc", "*.pyo", "*.tmp", "*.swp", "*.swo", "*~"
    };
}

void WatcherConfig::validate() const {
    if (min_debounce.count() <= 0) throw std::invalid_argument("watcher.min_debounce must be positive");
    if (max_debounce < min_debounce) throw std::invalid_argument("watcher.max_debounce must be >= min_debounce");
    if (poll_interval.count() <= 0) throw std::invalid_argument("watcher.poll_interval must be positive");
    if (burst_threshold <= 0) throw std::invalid_argument("watcher.burst_threshold must be positive");
    if (growth_factor < 1.0) throw std::invalid_argument("watcher.growth_factor must be >= 1.0");
    if (decay_factor <= 0.0 || decay_factor > 1.0) throw std::invalid_argument("watcher.decay_factor must be in (0, 1]");
}

std::vector<std::string> WorkspaceConfig::defaultBackupExcludes() {
    return {
        "node_modules", "__pycache__", ".pytest_cache", ".git/objects",
        ".git/refs", ".git/logs", ".vscode", ".idea"
    };
}

static Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    cfg.storage.applyEnvironment();

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::invalid_argument("Config root must be a YAML mapping");

    if (auto node = root["storage"]) YAML::convert<S3Config>::decode(node, cfg.storage);
    if (auto node = root["watcher"]) YAML::convert<WatcherConfig>::decode(node, cfg.watcher);
    if (auto node = root["workspace"]) YAML::convert<WorkspaceConfig>::decode(node, cfg.workspace);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    cfg.watcher.validate();
    return cfg;
}

Config loadConfig(const std::string& path) {
    return decodeRoot(YAML::LoadFile(path));
}

Config loadConfigFromString(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"storage", c.storage},
        {"watcher", c.watcher},
        {"workspace", c.workspace},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const S3Config& c) {
    j = {
        {"bucket", c.bucket},
        {"endpoint", c.effectiveEndpoint()},
        {"region", c.region},
        {"access_key_set", !c.access_key.empty()},
        {"secure", c.secure},
        {"verify_ssl", c.verify_ssl},
        {"request_timeout_s", c.request_timeout.count()},
        {"max_concurrent_transfers", c.max_concurrent_transfers},
        {"max_retry_attempts", c.max_retry_attempts},
        {"initial_backoff_ms", c.initial_backoff.count()},
        {"max_backoff_ms", c.max_backoff.count()},
        {"multipart_threshold", c.multipart_threshold},
        {"multipart_part_size", c.multipart_part_size}
    };
}

void to_json(nlohmann::json& j, const WatcherConfig& c) {
    j = {
        {"min_debounce_ms", c.min_debounce.count()},
        {"max_debounce_ms", c.max_debounce.count()},
        {"burst_threshold", c.burst_threshold},
        {"poll_interval_ms", c.poll_interval.count()},
        {"growth_factor", c.growth_factor},
        {"decay_factor", c.decay_factor},
        {"ignore_hidden", c.ignore_hidden},
        {"ignore_patterns", c.ignore_patterns}
    };
}

void to_json(nlohmann::json& j, const WorkspaceConfig& c) {
    j = {
        {"root_path", c.root_path.string()},
        {"backup_interval_s", c.backup_interval.count()},
        {"final_sync_timeout_s", c.final_sync_timeout.count()},
        {"git_enabled", c.git_enabled},
        {"git_executable", c.git_executable},
        {"tar_executable", c.tar_executable},
        {"backup_excludes", c.backup_excludes}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

static std::string levelName(const spdlog::level::level_enum l) {
    const auto sv = spdlog::level::to_string_view(l);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"wsync", levelName(c.wsync)},
        {"watcher", levelName(c.watcher)},
        {"cloud", levelName(c.cloud)},
        {"sync", levelName(c.sync)},
        {"backup", levelName(c.backup)},
        {"git", levelName(c.git)}
    };
}

} // namespace wsync::config
