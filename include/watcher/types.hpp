#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace wsync::watcher {

// Last observed mtime per workspace-relative path.
using FileState = std::unordered_map<std::string, std::filesystem::file_time_type>;

struct DebounceState {
    std::chrono::milliseconds current_debounce{2000};
    double changes_per_second = 0.0;
    std::optional<std::chrono::steady_clock::time_point> last_change_time;
};

struct ScanResult {
    std::vector<std::string> created;
    std::vector<std::string> modified;
    std::vector<std::string> deleted;
    bool root_missing = false;

    [[nodiscard]] size_t total() const { return created.size() + modified.size() + deleted.size(); }
    [[nodiscard]] bool empty() const { return total() == 0; }
};

struct WatcherStatus {
    bool running = false;
    size_t pending_changes = 0;
    double current_debounce = 0.0;     // seconds
    double changes_per_second = 0.0;
    size_t tracked_files = 0;
    std::string watch_directory;
};

void to_json(nlohmann::json& j, const WatcherStatus& s);

}
