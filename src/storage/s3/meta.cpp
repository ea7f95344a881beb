#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "logging/LogRegistry.hpp"

using namespace wsync::cloud;
using namespace wsync::util;
using namespace wsync::logging;
using wsync::storage::StorageError;

std::optional<HeadResult> S3Controller::headObject(const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);

    const std::string payloadHash = "UNSIGNED-PAYLOAD";
    const SList hdrs = makeSigHeaders("HEAD", canonical, payloadHash);

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyCommonOptions(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);            // HEAD request
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (resp.curl == CURLE_OK && resp.http == 404) return std::nullopt;
    if (!resp.ok()) throw makeError("HeadObject", key, resp);

    HeadResult out;
    if (const auto len = extractHeader(resp.hdr, "Content-Length")) out.size = std::stoull(*len);
    if (const auto etag = extractHeader(resp.hdr, "ETag")) out.etag = *etag;
    return out;
}
