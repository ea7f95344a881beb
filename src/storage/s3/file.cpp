#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "logging/LogRegistry.hpp"

#include <fstream>
#include <fmt/core.h>

using namespace wsync::cloud;
using namespace wsync::util;
using namespace wsync::logging;
using wsync::storage::StorageError;

namespace {

// Streams a 2xx body into the output file; anything else is kept as error text.
struct DownloadSink {
    CURL* handle = nullptr;
    std::ofstream* file = nullptr;
    std::string errorBody;
    bool writeFailed = false;

    static size_t write(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
        auto* sink = static_cast<DownloadSink*>(userdata);
        const size_t n = size * nmemb;

        long code = 0;
        curl_easy_getinfo(sink->handle, CURLINFO_RESPONSE_CODE, &code);
        if (code / 100 != 2) {
            sink->errorBody.append(ptr, n);
            return n;
        }

        sink->file->write(ptr, static_cast<std::streamsize>(n));
        if (!*sink->file) {
            sink->writeFailed = true;
            return 0; // aborts the transfer with CURLE_WRITE_ERROR
        }
        return n;
    }
};

}

void S3Controller::uploadObject(const std::string& key, const std::filesystem::path& filePath) const {
    std::ifstream fin(filePath, std::ios::binary);
    if (!fin) throw StorageError(StorageError::Kind::NotFound, "Failed to open file for upload: " + filePath.string());

    const std::string fileContents = slurp(fin);
    const std::string payloadHash = sha256Hex(fileContents);

    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);

    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash);
    hdrs.add("Content-Type: application/octet-stream");

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyCommonOptions(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, fileContents.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(fileContents.size()));
    });

    if (!resp.ok()) throw makeError("PutObject", key, resp);

    LogRegistry::cloud()->debug("[S3Controller] Uploaded {} ({} bytes)", key, fileContents.size());
}

void S3Controller::downloadObject(const std::string& key, const std::filesystem::path& outputPath) const {
    std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
    if (!file) throw StorageError(StorageError::Kind::Unknown,
                                  "Failed to open output file for S3 download: " + outputPath.string());

    CurlEasy handle;
    CURL* h = handle;
    const auto [canonical, url] = constructPaths(h, key);

    const std::string payloadHash = "UNSIGNED-PAYLOAD";
    const SList hdrs = makeSigHeaders("GET", canonical, payloadHash);

    DownloadSink sink;
    sink.handle = h;
    sink.file = &file;

    std::string hdrBuf;
    applyCommonOptions(h);
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, DownloadSink::write);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);

    HttpResponse resp;
    resp.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.http);
    resp.body = std::move(sink.errorBody);
    resp.hdr = std::move(hdrBuf);
    file.close();

    if (sink.writeFailed || (resp.ok() && !file))
        throw StorageError(StorageError::Kind::Unknown, "Failed writing S3 download to " + outputPath.string());

    if (!resp.ok()) throw makeError("GetObject", key, resp);
}
