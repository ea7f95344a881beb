#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace wsync::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static std::chrono::milliseconds durationOr(const Node& node, const std::chrono::milliseconds def) {
    if (!node) return def;
    return parseDuration(node.as<std::string>());
}

template<>
struct convert<S3Config> {
    static Node encode(const S3Config& rhs) {
        Node node;
        node["bucket"] = rhs.bucket;
        node["endpoint"] = rhs.endpoint;
        node["region"] = rhs.region;
        node["secure"] = rhs.secure;
        node["verify_ssl"] = rhs.verify_ssl;
        node["request_timeout"] = durationToStr(rhs.request_timeout);
        node["max_concurrent_transfers"] = rhs.max_concurrent_transfers;
        node["max_retry_attempts"] = rhs.max_retry_attempts;
        node["initial_backoff"] = durationToStr(rhs.initial_backoff);
        node["max_backoff"] = durationToStr(rhs.max_backoff);
        node["multipart_threshold"] = bytesToMbOrGbStr(rhs.multipart_threshold);
        node["multipart_part_size"] = bytesToMbOrGbStr(rhs.multipart_part_size);
        // credentials are never written back out
        return node;
    }

    static bool decode(const Node& node, S3Config& rhs) {
        if (!node.IsMap()) return false;
        // current values (defaults or environment) are the fallback for absent keys
        rhs.bucket = node["bucket"].as<std::string>(rhs.bucket);
        rhs.endpoint = node["endpoint"].as<std::string>(rhs.endpoint);
        rhs.region = node["region"].as<std::string>(rhs.region);
        rhs.access_key = node["access_key"].as<std::string>(rhs.access_key);
        rhs.secret_key = node["secret_key"].as<std::string>(rhs.secret_key);
        rhs.secure = node["secure"].as<bool>(rhs.secure);
        rhs.verify_ssl = node["verify_ssl"].as<bool>(rhs.verify_ssl);
        rhs.request_timeout = std::chrono::duration_cast<std::chrono::seconds>(
            durationOr(node["request_timeout"], std::chrono::seconds(60)));
        rhs.max_concurrent_transfers = node["max_concurrent_transfers"].as<unsigned int>(10);
        rhs.max_retry_attempts = node["max_retry_attempts"].as<unsigned int>(3);
        rhs.initial_backoff = durationOr(node["initial_backoff"], std::chrono::milliseconds(200));
        rhs.max_backoff = durationOr(node["max_backoff"], std::chrono::milliseconds(5000));
        if (const auto n = node["multipart_threshold"]) rhs.multipart_threshold = parseMbOrGbToByte(n.as<std::string>());
        if (const auto n = node["multipart_part_size"]) rhs.multipart_part_size = parseMbOrGbToByte(n.as<std::string>());
        return true;
    }
};

template<>
struct convert<WatcherConfig> {
    static Node encode(const WatcherConfig& rhs) {
        Node node;
        node["min_debounce"] = durationToStr(rhs.min_debounce);
        node["max_debounce"] = durationToStr(rhs.max_debounce);
        node["burst_threshold"] = rhs.burst_threshold;
        node["poll_interval"] = durationToStr(rhs.poll_interval);
        node["growth_factor"] = rhs.growth_factor;
        node["decay_factor"] = rhs.decay_factor;
        node["ignore_hidden"] = rhs.ignore_hidden;
        node["ignore_patterns"] = rhs.ignore_patterns;
        return node;
    }

    static bool decode(const Node& node, WatcherConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.min_debounce = durationOr(node["min_debounce"], std::chrono::milliseconds(2000));
        rhs.max_debounce = durationOr(node["max_debounce"], std::chrono::milliseconds(30000));
        rhs.burst_threshold = node["burst_threshold"].as<double>(10.0);
        rhs.poll_interval = durationOr(node["poll_interval"], std::chrono::milliseconds(500));
        rhs.growth_factor = node["growth_factor"].as<double>(1.5);
        rhs.decay_factor = node["decay_factor"].as<double>(0.9);
        rhs.ignore_hidden = node["ignore_hidden"].as<bool>(true);
        if (const auto n = node["ignore_patterns"]) rhs.ignore_patterns = n.as<std::vector<std::string>>();
        if (const auto n = node["extra_ignore_patterns"])
            for (const auto& p : n.as<std::vector<std::string>>()) rhs.ignore_patterns.push_back(p);
        return true;
    }
};

template<>
struct convert<WorkspaceConfig> {
    static Node encode(const WorkspaceConfig& rhs) {
        Node node;
        node["root_path"] = rhs.root_path.string();
        node["backup_interval"] = durationToStr(rhs.backup_interval);
        node["final_sync_timeout"] = durationToStr(rhs.final_sync_timeout);
        node["git_enabled"] = rhs.git_enabled;
        node["git_executable"] = rhs.git_executable;
        node["tar_executable"] = rhs.tar_executable;
        node["backup_excludes"] = rhs.backup_excludes;
        return node;
    }

    static bool decode(const Node& node, WorkspaceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root_path = node["root_path"].as<std::string>("/workspace");
        rhs.backup_interval = std::chrono::duration_cast<std::chrono::seconds>(
            durationOr(node["backup_interval"], std::chrono::seconds(300)));
        rhs.final_sync_timeout = std::chrono::duration_cast<std::chrono::seconds>(
            durationOr(node["final_sync_timeout"], std::chrono::seconds(30)));
        rhs.git_enabled = node["git_enabled"].as<bool>(true);
        rhs.git_executable = node["git_executable"].as<std::string>("git");
        rhs.tar_executable = node["tar_executable"].as<std::string>("tar");
        if (const auto n = node["backup_excludes"]) rhs.backup_excludes = n.as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["wsync"]   = to_std_string(spdlog::level::to_string_view(rhs.wsync));
        node["watcher"] = to_std_string(spdlog::level::to_string_view(rhs.watcher));
        node["cloud"]   = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["sync"]    = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["backup"]  = to_std_string(spdlog::level::to_string_view(rhs.backup));
        node["git"]     = to_std_string(spdlog::level::to_string_view(rhs.git));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.wsync = spdlog::level::from_str(node["wsync"].as<std::string>("info"));
        rhs.watcher = spdlog::level::from_str(node["watcher"].as<std::string>("info"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.backup = spdlog::level::from_str(node["backup"].as<std::string>("info"));
        rhs.git = spdlog::level::from_str(node["git"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto n = node["subsystem_levels"]) rhs.subsystem_levels = n.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/tmp/wsync/logs");
        if (const auto n = node["log_levels"]) rhs.levels = n.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
