#pragma once

#include "storage/WorkspaceStorage.hpp"
#include "storage/RetryPolicy.hpp"
#include "config/Config.hpp"
#include "concurrency/types.hpp"

#include <memory>

namespace wsync::cloud { class S3Controller; }
namespace wsync::concurrency { class ThreadPool; }

namespace wsync::storage {

class S3WorkspaceStorage : public WorkspaceStorage {
public:
    // Throws StorageError(Configuration) if the bucket is missing or limits are invalid.
    explicit S3WorkspaceStorage(config::S3Config cfg);

    ~S3WorkspaceStorage() override;

    void uploadFile(const std::filesystem::path& local, const std::string& remote) override;
    void downloadFile(const std::string& remote, const std::filesystem::path& local) override;
    void uploadDirectory(const std::filesystem::path& localDir, const std::string& remoteDir,
                         const PathFilter& filter = {}) override;
    void downloadDirectory(const std::string& remoteDir, const std::filesystem::path& localDir) override;
    void deleteFile(const std::string& remote) override;
    void deleteDirectory(const std::string& remoteDir) override;
    std::vector<std::string> listFiles(const std::string& prefix) override;
    bool exists(const std::string& remote) override;
    std::optional<uintmax_t> getFileSize(const std::string& remote) override;

    [[nodiscard]] const config::S3Config& config() const { return cfg_; }

    [[nodiscard]] const RetryPolicy& retryPolicy() const { return retry_; }
    void setRetryPolicy(RetryPolicy policy) { retry_ = std::move(policy); }

    static constexpr size_t DELETE_BATCH_SIZE = 1000;

private:
    config::S3Config cfg_;
    std::unique_ptr<cloud::S3Controller> s3_;
    RetryPolicy retry_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    // Surfaces the first PermissionDenied/Configuration error, otherwise one TransferError.
    static void raiseBatchFailures(const std::string& operation, const std::vector<concurrency::TaskOutcome>& outcomes);
};

}
