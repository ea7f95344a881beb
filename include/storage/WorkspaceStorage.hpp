#pragma once

#include "storage/BackupArchiver.hpp"
#include "storage/StorageError.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wsync::storage {

// Receives a workspace-relative path with '/' separators; false skips the file.
using PathFilter = std::function<bool(const std::string&)>;

// Remote object-store capability used by the workspace manager.
// Errors are StorageError; absence is never an error for deletes or queries.
class WorkspaceStorage {
public:
    virtual ~WorkspaceStorage() = default;

    // NotFound if `local` is missing.
    virtual void uploadFile(const std::filesystem::path& local, const std::string& remote) = 0;

    // Creates parent directories. NotFound if the key is absent.
    virtual void downloadFile(const std::string& remote, const std::filesystem::path& local) = 0;

    // Every regular file under localDir passing `filter`. Failures are collected into one TransferError.
    virtual void uploadDirectory(const std::filesystem::path& localDir, const std::string& remoteDir,
                                 const PathFilter& filter = {}) = 0;

    virtual void downloadDirectory(const std::string& remoteDir, const std::filesystem::path& localDir) = 0;

    virtual void deleteFile(const std::string& remote) = 0;

    virtual void deleteDirectory(const std::string& remoteDir) = 0;

    virtual std::vector<std::string> listFiles(const std::string& prefix) = 0;

    // Exact key or any key below `remote` as a virtual directory.
    virtual bool exists(const std::string& remote) = 0;

    virtual std::optional<uintmax_t> getFileSize(const std::string& remote) = 0;

    // tar.gz of localDir into a temp file, uploaded to remoteArchive, temp file removed.
    virtual void createBackupArchive(const std::filesystem::path& localDir, const std::string& remoteArchive,
                                     const BackupArchiver& archiver = BackupArchiver{});

    // Regular files below `dir` as sorted relative generic paths.
    static std::vector<std::string> listLocalFiles(const std::filesystem::path& dir, const PathFilter& filter = {});

    // "a/b" + "c/d.txt" -> "a/b/c/d.txt", tolerant of stray slashes on either side.
    static std::string joinKey(const std::string& prefix, const std::string& rel);

    // Key relative to `prefix`, or nullopt if it is not strictly below it or would escape the target directory.
    static std::optional<std::string> relativeKey(const std::string& prefix, const std::string& key);
};

}
