#pragma once

#include "config/Config.hpp"
#include "storage/StorageError.hpp"
#include "util/curlWrappers.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace wsync::cloud {

struct HeadResult {
    uintmax_t size = 0;
    std::string etag;
};

// One signed request per call against a path-style S3 endpoint.
// Every failure is raised as a classified storage::StorageError; retries are the caller's job.
class S3Controller {
public:
    explicit S3Controller(const config::S3Config& cfg);

    ~S3Controller();

    void uploadObject(const std::string& key, const std::filesystem::path& filePath) const;

    void uploadLargeObject(const std::string& key,
                           const std::filesystem::path& filePath,
                           uintmax_t partSize) const;

    // Writes the body to outputPath only on a 2xx response.
    void downloadObject(const std::string& key, const std::filesystem::path& outputPath) const;

    void deleteObject(const std::string& key) const;

    // At most 1000 keys (the DeleteObjects limit), Quiet mode.
    void deleteObjects(const std::vector<std::string>& keys) const;

    [[nodiscard]] std::string initiateMultipartUpload(const std::string& key) const;

    void uploadPart(const std::string& key, const std::string& uploadId,
                    int partNumber, const std::string& partData, std::string& etagOut) const;

    void completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                 const std::vector<std::string>& etags) const;

    void abortMultipartUpload(const std::string& key, const std::string& uploadId) const;

    // Follows continuation tokens; with maxKeys set, stops once that many keys are collected.
    [[nodiscard]] std::vector<util::S3ListedObject> listObjects(const std::string& prefix,
                                                                std::optional<unsigned int> maxKeys = std::nullopt) const;

    // nullopt when the key does not exist.
    [[nodiscard]] std::optional<HeadResult> headObject(const std::string& key) const;

    [[nodiscard]] const std::string& bucket() const { return bucket_; }
    [[nodiscard]] const std::string& endpoint() const { return endpoint_; }

    static storage::StorageError::Kind classify(CURLcode curl, long http, const std::string& s3Code);

    // Builds the classified error for a failed response, pulling <Code>/<Message> from the body.
    static storage::StorageError makeError(const std::string& operation, const std::string& key,
                                           const util::HttpResponse& resp);

private:
    std::string bucket_;
    std::string endpoint_;      // scheme://host[:port]
    std::string host_;
    util::S3Credentials creds_;
    long timeoutSeconds_;
    bool verifySsl_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    // {canonical path, url}; query must already be canonical (sorted, escaped, no leading '?').
    std::pair<std::string, std::string> constructPaths(CURL* curl, const std::string& key,
                                                       const std::string& query = "") const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash,
                                             const std::string& query = "",
                                             const std::map<std::string, std::string>& extra = {}) const;

    void applyCommonOptions(CURL* h) const;
};

}
