#include "storage/WorkspaceStorage.hpp"
#include "util/TempFile.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace wsync::storage;
using namespace wsync::logging;
namespace fs = std::filesystem;

void WorkspaceStorage::createBackupArchive(const fs::path& localDir, const std::string& remoteArchive,
                                           const BackupArchiver& archiver) {
    if (!fs::is_directory(localDir))
        throw StorageError(StorageError::Kind::NotFound, "Backup source is not a directory: " + localDir.string());

    const util::TempFile archive(".tar.gz");
    archiver.createArchive(localDir, archive.path());

    const auto size = fs::file_size(archive.path());
    uploadFile(archive.path(), remoteArchive);

    LogRegistry::backup()->info("[WorkspaceStorage] Uploaded backup archive {} ({} bytes)", remoteArchive, size);
}

std::vector<std::string> WorkspaceStorage::listLocalFiles(const fs::path& dir, const PathFilter& filter) {
    std::vector<std::string> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) throw StorageError(StorageError::Kind::NotFound,
                               "Cannot read local directory " + dir.string() + ": " + ec.message());

    while (it != fs::recursive_directory_iterator()) {
        if (it->is_regular_file(ec)) {
            auto rel = it->path().lexically_relative(dir).generic_string();
            if (!rel.empty() && (!filter || filter(rel))) out.push_back(std::move(rel));
        }
        ec.clear();

        it.increment(ec);
        if (ec) {
            LogRegistry::sync()->warn("[WorkspaceStorage] Stopped walking {}: {}", dir.string(), ec.message());
            break;
        }
    }

    std::ranges::sort(out);
    return out;
}

std::string WorkspaceStorage::joinKey(const std::string& prefix, const std::string& rel) {
    std::string p = prefix;
    while (!p.empty() && p.back() == '/') p.pop_back();
    size_t start = 0;
    while (start < rel.size() && rel[start] == '/') ++start;
    if (p.empty()) return rel.substr(start);
    if (start >= rel.size()) return p;
    return p + "/" + rel.substr(start);
}

std::optional<std::string> WorkspaceStorage::relativeKey(const std::string& prefix, const std::string& key) {
    std::string p = prefix;
    while (!p.empty() && p.back() == '/') p.pop_back();
    if (!p.empty()) p += '/';

    if (!key.starts_with(p) || key.size() == p.size()) return std::nullopt;
    auto rel = key.substr(p.size());
    if (rel.ends_with('/')) return std::nullopt; // directory marker

    const fs::path relPath(rel);
    if (relPath.is_absolute()) return std::nullopt;
    for (const auto& part : relPath)
        if (part == "..") return std::nullopt;

    return rel;
}
