#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>

using namespace wsync::cloud;
using namespace wsync::util;
using namespace wsync::logging;
using wsync::storage::StorageError;

S3Controller::S3Controller(const config::S3Config& cfg)
: bucket_(cfg.bucket),
  endpoint_(cfg.effectiveEndpoint()),
  creds_{cfg.access_key, cfg.secret_key, cfg.region.empty() ? "us-east-1" : cfg.region},
  timeoutSeconds_(static_cast<long>(cfg.request_timeout.count())),
  verifySsl_(cfg.verify_ssl) {
    if (bucket_.empty()) throw StorageError(StorageError::Kind::Configuration, "S3Controller requires a bucket");
    host_ = endpoint_.substr(endpoint_.find("//") + 2);
    ensureCurlGlobalInit();
}

S3Controller::~S3Controller() = default;

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    return {
        {"host", host_},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", getCurrentTimestamp()}
    };
}

SList S3Controller::makeSigHeaders(const std::string& method,
                                   const std::string& canonical,
                                   const std::string& payloadHash,
                                   const std::string& query,
                                   const std::map<std::string, std::string>& extra) const {
    auto base = buildHeaderMap(payloadHash);      // host + dates
    for (const auto& [k, v] : extra) base[k] = v;
    const auto auth = buildAuthorizationHeader(creds_, method, canonical, base, payloadHash, query);

    SList out;
    out.add("Authorization: " + auth);
    for (auto& [k, v] : base) out.add(k + ": " + v);
    return out;  // RAII slist
}

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const std::string& key,
                                                                 const std::string& query) const {
    std::string canonicalPath = "/" + bucket_;
    if (!key.empty()) canonicalPath += "/" + escapeKeyPreserveSlashes(curl, key);
    auto url = endpoint_ + canonicalPath;
    if (!query.empty()) url += "?" + query;
    return {canonicalPath, url};
}

void S3Controller::applyCommonOptions(CURL* h) const {
    curl_easy_setopt(h, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, verifySsl_ ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, verifySsl_ ? 2L : 0L);
}

StorageError::Kind S3Controller::classify(const CURLcode curl, const long http, const std::string& s3Code) {
    using Kind = StorageError::Kind;

    if (curl != CURLE_OK) {
        switch (curl) {
            case CURLE_COULDNT_CONNECT:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
            case CURLE_SSL_CONNECT_ERROR:
                return Kind::Transient;
            default:
                return Kind::Unknown;
        }
    }

    if (s3Code == "NoSuchKey" || s3Code == "NoSuchBucket") return Kind::NotFound;
    if (s3Code == "AccessDenied" || s3Code == "InvalidAccessKeyId" || s3Code == "SignatureDoesNotMatch")
        return Kind::PermissionDenied;
    if (s3Code == "SlowDown" || s3Code == "ServiceUnavailable" || s3Code == "InternalError" ||
        s3Code == "RequestTimeout")
        return Kind::Transient;

    if (http == 404) return Kind::NotFound;
    if (http == 401 || http == 403) return Kind::PermissionDenied;
    if (http == 408 || http == 429 || http / 100 == 5) return Kind::Transient;

    return Kind::Unknown;
}

StorageError S3Controller::makeError(const std::string& operation, const std::string& key, const HttpResponse& resp) {
    const auto code = extractXmlTag(resp.body, "Code").value_or("");
    const auto message = extractXmlTag(resp.body, "Message").value_or("");
    const auto kind = classify(resp.curl, resp.http, code);

    std::string what;
    if (resp.transportFailed())
        what = fmt::format("S3 {} failed for '{}': {} (curl {})", operation, key,
                           resp.transportError(), static_cast<int>(resp.curl));
    else
        what = fmt::format("S3 {} failed for '{}': HTTP {}{}{}", operation, key, resp.http,
                           code.empty() ? "" : " " + code, message.empty() ? "" : ": " + message);

    return {kind, what};
}

void S3Controller::deleteObject(const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);

    const std::string payloadHash = sha256Hex("");
    const SList hdrs = makeSigHeaders("DELETE", canonical, payloadHash);

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyCommonOptions(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) throw makeError("DeleteObject", key, resp);
}

void S3Controller::deleteObjects(const std::vector<std::string>& keys) const {
    if (keys.empty()) return;
    if (keys.size() > 1000) throw std::invalid_argument("deleteObjects accepts at most 1000 keys per request");

    CurlEasy tmpHandle;
    const std::string query = "delete=";
    const auto [canonical, url] = constructPaths(tmpHandle, "", query);

    const std::string body = composeDeleteObjectsXMLBody(keys);
    const std::string payloadHash = sha256Hex(body);
    SList hdrs = makeSigHeaders("POST", canonical, payloadHash, query, {{"content-md5", md5Base64(body)}});
    hdrs.add("Content-Type: application/xml");

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyCommonOptions(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    });

    if (!resp.ok()) throw makeError("DeleteObjects", keys.front(), resp);

    // Quiet mode only reports failures; a key that was already gone is not one.
    std::vector<std::string> failed;
    size_t pos = 0;
    while ((pos = resp.body.find("<Error>", pos)) != std::string::npos) {
        const auto end = resp.body.find("</Error>", pos);
        const auto block = resp.body.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        const auto code = extractXmlTag(block, "Code").value_or("");
        if (code != "NoSuchKey") failed.push_back(extractXmlTag(block, "Key").value_or("?") + " (" + code + ")");
        if (end == std::string::npos) break;
        pos = end;
    }

    if (!failed.empty()) {
        std::string joined;
        for (const auto& f : failed) joined += (joined.empty() ? "" : ", ") + f;
        throw StorageError(StorageError::Kind::Unknown,
                           fmt::format("S3 DeleteObjects could not delete {} keys: {}", failed.size(), joined));
    }
}

std::vector<S3ListedObject> S3Controller::listObjects(const std::string& prefix,
                                                      const std::optional<unsigned int> maxKeys) const {
    std::vector<S3ListedObject> out;
    std::string continuationToken;
    bool moreResults = true;

    while (moreResults) {
        CurlEasy tmpHandle;

        std::map<std::string, std::string> params{{"list-type", "2"}};
        if (!prefix.empty()) params["prefix"] = prefix;
        if (!continuationToken.empty()) params["continuation-token"] = continuationToken;
        if (maxKeys) params["max-keys"] = std::to_string(*maxKeys - std::min<size_t>(*maxKeys, out.size()));

        const auto query = buildCanonicalQuery(tmpHandle, params);
        const auto [canonical, url] = constructPaths(tmpHandle, "", query);

        const std::string payloadHash = "UNSIGNED-PAYLOAD";
        const SList hdrs = makeSigHeaders("GET", canonical, payloadHash, query);

        const HttpResponse resp = performCurl([&](CURL* h) {
            applyCommonOptions(h);
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        });

        if (!resp.ok()) {
            LogRegistry::cloud()->debug("[S3Controller] listObjects failed: CURL={} HTTP={} Response:\n{}",
                                        static_cast<int>(resp.curl), resp.http, resp.body);
            throw makeError("ListObjectsV2", prefix, resp);
        }

        for (auto& obj : parseListObjects(resp.body)) out.push_back(std::move(obj));

        parsePagination(resp.body, continuationToken, moreResults);
        if (maxKeys && out.size() >= *maxKeys) break;
    }

    return out;
}
