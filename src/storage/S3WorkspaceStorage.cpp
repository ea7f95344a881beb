#include "storage/S3WorkspaceStorage.hpp"
#include "storage/s3/S3Controller.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/TransferBatch.hpp"
#include "util/TempFile.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace wsync::storage;
using namespace wsync::concurrency;
using namespace wsync::logging;
namespace fs = std::filesystem;

static wsync::config::S3Config validated(wsync::config::S3Config cfg) {
    try {
        cfg.validate();
    } catch (const std::invalid_argument& e) {
        throw StorageError(StorageError::Kind::Configuration, e.what());
    }
    return cfg;
}

S3WorkspaceStorage::S3WorkspaceStorage(config::S3Config cfg)
    : cfg_(validated(std::move(cfg))),
      s3_(std::make_unique<cloud::S3Controller>(cfg_)),
      pool_(std::make_unique<ThreadPool>(cfg_.max_concurrent_transfers, "S3TransferPool")) {
    retry_.max_attempts = cfg_.max_retry_attempts;
    retry_.initial_backoff = cfg_.initial_backoff;
    retry_.max_backoff = cfg_.max_backoff;

    if (cfg_.access_key.empty() || cfg_.secret_key.empty())
        LogRegistry::cloud()->warn("[S3WorkspaceStorage] No S3 credentials configured; requests will likely be rejected");

    LogRegistry::cloud()->info("[S3WorkspaceStorage] Using bucket '{}' at {} ({} concurrent transfers)",
                               cfg_.bucket, s3_->endpoint(), cfg_.max_concurrent_transfers);
}

S3WorkspaceStorage::~S3WorkspaceStorage() {
    pool_->stop();
}

void S3WorkspaceStorage::uploadFile(const fs::path& local, const std::string& remote) {
    std::error_code ec;
    const auto size = fs::file_size(local, ec);
    if (ec || !fs::is_regular_file(local))
        throw StorageError(StorageError::Kind::NotFound, "Local file not found: " + local.string());

    retry_.run("upload " + remote, [&] {
        if (size >= cfg_.multipart_threshold) s3_->uploadLargeObject(remote, local, cfg_.multipart_part_size);
        else s3_->uploadObject(remote, local);
    });
}

void S3WorkspaceStorage::downloadFile(const std::string& remote, const fs::path& local) {
    const auto parent = local.has_parent_path() ? local.parent_path() : fs::current_path();
    fs::create_directories(parent);

    // hidden sibling so the watcher ignores it while in flight
    util::TempFile part(".part", parent, "." + local.filename().string() + ".");
    retry_.run("download " + remote, [&] { s3_->downloadObject(remote, part.path()); });

    fs::rename(part.path(), local);
    part.release();
}

void S3WorkspaceStorage::uploadDirectory(const fs::path& localDir, const std::string& remoteDir, const PathFilter& filter) {
    if (!fs::is_directory(localDir))
        throw StorageError(StorageError::Kind::NotFound, "Local directory not found: " + localDir.string());

    const auto files = listLocalFiles(localDir, filter);

    TransferBatch batch(*pool_);
    for (const auto& rel : files)
        batch.add(rel, [this, &localDir, &remoteDir, rel] { uploadFile(localDir / rel, joinKey(remoteDir, rel)); });

    const auto outcomes = batch.wait();
    raiseBatchFailures(fmt::format("uploadDirectory {} -> {}", localDir.string(), remoteDir), outcomes);

    LogRegistry::sync()->debug("[S3WorkspaceStorage] Uploaded {} files from {} to {}", files.size(), localDir.string(), remoteDir);
}

void S3WorkspaceStorage::downloadDirectory(const std::string& remoteDir, const fs::path& localDir) {
    const auto keys = listFiles(remoteDir);
    fs::create_directories(localDir);

    TransferBatch batch(*pool_);
    for (const auto& key : keys) {
        const auto rel = relativeKey(remoteDir, key);
        if (!rel) {
            if (!key.ends_with('/'))
                LogRegistry::sync()->warn("[S3WorkspaceStorage] Skipping key outside {}: {}", remoteDir, key);
            continue;
        }
        batch.add(*rel, [this, &localDir, key, rel = *rel] { downloadFile(key, localDir / rel); });
    }

    const auto attempted = batch.size();
    const auto outcomes = batch.wait();
    raiseBatchFailures(fmt::format("downloadDirectory {} -> {}", remoteDir, localDir.string()), outcomes);

    LogRegistry::sync()->debug("[S3WorkspaceStorage] Downloaded {} files from {} to {}", attempted, remoteDir, localDir.string());
}

void S3WorkspaceStorage::deleteFile(const std::string& remote) {
    try {
        retry_.run("delete " + remote, [&] { s3_->deleteObject(remote); });
    } catch (const StorageError& e) {
        if (!e.isNotFound()) throw;
        LogRegistry::cloud()->debug("[S3WorkspaceStorage] {} already absent", remote);
    }
}

void S3WorkspaceStorage::deleteDirectory(const std::string& remoteDir) {
    const auto keys = listFiles(remoteDir);
    for (size_t i = 0; i < keys.size(); i += DELETE_BATCH_SIZE) {
        const auto last = std::min(keys.size(), i + DELETE_BATCH_SIZE);
        const std::vector chunk(keys.begin() + static_cast<std::ptrdiff_t>(i), keys.begin() + static_cast<std::ptrdiff_t>(last));
        retry_.run("delete batch under " + remoteDir, [&] { s3_->deleteObjects(chunk); });
    }
    LogRegistry::cloud()->debug("[S3WorkspaceStorage] Deleted {} objects under {}", keys.size(), remoteDir);
}

std::vector<std::string> S3WorkspaceStorage::listFiles(const std::string& prefix) {
    auto p = prefix;
    if (!p.empty() && !p.ends_with('/')) p += '/';

    const auto objects = retry_.run("list " + p, [&] { return s3_->listObjects(p); });

    std::vector<std::string> keys;
    keys.reserve(objects.size());
    for (const auto& o : objects) keys.push_back(o.key);
    return keys;
}

bool S3WorkspaceStorage::exists(const std::string& remote) {
    if (retry_.run("head " + remote, [&] { return s3_->headObject(remote); })) return true;

    auto dirPrefix = remote;
    if (!dirPrefix.ends_with('/')) dirPrefix += '/';
    return !retry_.run("list " + dirPrefix, [&] { return s3_->listObjects(dirPrefix, 1); }).empty();
}

std::optional<uintmax_t> S3WorkspaceStorage::getFileSize(const std::string& remote) {
    const auto head = retry_.run("head " + remote, [&] { return s3_->headObject(remote); });
    if (!head) return std::nullopt;
    return head->size;
}

void S3WorkspaceStorage::raiseBatchFailures(const std::string& operation, const std::vector<TaskOutcome>& outcomes) {
    bool anyFailed = false;
    for (const auto& o : outcomes) {
        if (o.ok()) continue;
        anyFailed = true;
        try {
            std::rethrow_exception(o.error);
        } catch (const StorageError& e) {
            if (e.isFatal()) throw;
        } catch (const std::exception&) {
            // reported in the aggregate below
        }
    }
    if (!anyFailed) return;

    auto failures = TransferBatch::describeFailures(outcomes);
    for (const auto& f : failures) LogRegistry::sync()->error("[S3WorkspaceStorage] {} failed: {}", operation, f);
    throw TransferError(operation, std::move(failures), outcomes.size());
}
