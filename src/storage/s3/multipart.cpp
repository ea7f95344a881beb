#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "logging/LogRegistry.hpp"

#include <fstream>
#include <fmt/core.h>

using namespace wsync::cloud;
using namespace wsync::util;
using namespace wsync::logging;
using wsync::storage::StorageError;

void S3Controller::uploadLargeObject(const std::string& key,
                                     const std::filesystem::path& filePath,
                                     const uintmax_t partSize) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) throw StorageError(StorageError::Kind::NotFound, "Failed to open file for large upload: " + filePath.string());

    const std::string uploadId = initiateMultipartUpload(key);

    std::vector<std::string> etags;
    int partNo = 1;

    try {
        while (file) {
            std::string part(partSize, '\0');
            file.read(part.data(), static_cast<std::streamsize>(partSize));
            const std::streamsize bytesRead = file.gcount();
            if (bytesRead <= 0) break;

            part.resize(static_cast<size_t>(bytesRead));

            std::string etag;
            uploadPart(key, uploadId, partNo++, part, etag);
            etags.push_back(std::move(etag));
        }

        if (etags.empty()) throw StorageError(StorageError::Kind::Unknown, "Multipart upload read no data from " + filePath.string());

        completeMultipartUpload(key, uploadId, etags);
    } catch (const StorageError& e) {
        LogRegistry::cloud()->error("[S3Controller] uploadLargeObject failed at part {} for {}: {}", partNo - 1, key, e.what());
        try {
            abortMultipartUpload(key, uploadId);
        } catch (const StorageError& abortErr) {
            LogRegistry::cloud()->error("[S3Controller] Failed to abort multipart upload for {} (uploadId={}): {}",
                                        key, uploadId, abortErr.what());
        }
        throw;
    }
}

std::string S3Controller::initiateMultipartUpload(const std::string& key) const {
    CurlEasy tmpHandle;
    const std::string query = "uploads=";
    const auto [canonical, url] = constructPaths(tmpHandle, key, query);

    const std::string payloadHash = sha256Hex("");
    const SList hdrs = makeSigHeaders("POST", canonical, payloadHash, query);

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyCommonOptions(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
    });

    if (!resp.ok()) throw makeError("CreateMultipartUpload", key, resp);

    const auto uploadId = extractXmlTag(resp.body, "UploadId");
    if (!uploadId || uploadId->empty())
        throw StorageError(StorageError::Kind::Unknown,
                           fmt::format("CreateMultipartUpload for '{}' returned no UploadId", key));
    return *uploadId;
}

void S3Controller::uploadPart(const std::string& key, const std::string& uploadId,
                              const int partNumber, const std::string& partData, std::string& etagOut) const {
    CurlEasy tmpHandle;
    const auto query = buildCanonicalQuery(tmpHandle, {{"partNumber", std::to_string(partNumber)}, {"uploadId", uploadId}});
    const auto [canonical, url] = constructPaths(tmpHandle, key, query);

    const std::string payloadHash = sha256Hex(partData);
    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash, query);
    hdrs.add("Content-Type: application/octet-stream");

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyCommonOptions(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, partData.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(partData.size()));
    });

    if (!resp.ok()) throw makeError(fmt::format("UploadPart {}", partNumber), key, resp);

    if (!extractETag(resp.hdr, etagOut))
        throw StorageError(StorageError::Kind::Unknown,
                           fmt::format("Failed to extract ETag for uploaded part {} of '{}'", partNumber, key));
}

void S3Controller::completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                           const std::vector<std::string>& etags) const {
    if (etags.empty()) throw std::invalid_argument("No ETags provided to completeMultipartUpload");

    CurlEasy tmpHandle;
    const auto query = buildCanonicalQuery(tmpHandle, {{"uploadId", uploadId}});
    const auto [canonical, url] = constructPaths(tmpHandle, key, query);

    const auto body = composeMultiPartUploadXMLBody(etags);
    const std::string payloadHash = sha256Hex(body);
    SList hdrs = makeSigHeaders("POST", canonical, payloadHash, query);
    hdrs.add("Content-Type: application/xml");

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyCommonOptions(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    });

    // S3 may report a failed completion as 200 with an <Error> body
    if (!resp.ok() || resp.body.find("<Error>") != std::string::npos) {
        LogRegistry::cloud()->error("[S3Controller] completeMultipartUpload failed: CURL={} HTTP={} Response:\n{}",
                                    static_cast<int>(resp.curl), resp.http, resp.body);
        throw makeError("CompleteMultipartUpload", key, resp);
    }
}

void S3Controller::abortMultipartUpload(const std::string& key, const std::string& uploadId) const {
    CurlEasy tmpHandle;
    const auto query = buildCanonicalQuery(tmpHandle, {{"uploadId", uploadId}});
    const auto [canonical, url] = constructPaths(tmpHandle, key, query);

    const std::string payloadHash = sha256Hex("");
    const SList hdrs = makeSigHeaders("DELETE", canonical, payloadHash, query);

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyCommonOptions(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) throw makeError("AbortMultipartUpload", key, resp);
}
