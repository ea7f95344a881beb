#include "util/s3Helpers.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/md5.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>
#include <regex>
#include <mutex>
#include <stdexcept>
#include <curl/curl.h>

namespace wsync::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    unsigned char sig[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), rawKey.data(), static_cast<int>(rawKey.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), sig, nullptr);

    std::ostringstream oss;
    for (unsigned char i : sig) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(i);
    return oss.str();
}

std::string md5Base64(const std::string& data) {
    unsigned char digest[MD5_DIGEST_LENGTH];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr) != 1)
        throw std::runtime_error("MD5 digest failed");

    unsigned char b64[4 * ((MD5_DIGEST_LENGTH + 2) / 3) + 1];
    const int n = EVP_EncodeBlock(b64, digest, static_cast<int>(len));
    return {reinterpret_cast<char*>(b64), static_cast<size_t>(n)};
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key) {
    std::ostringstream out;
    size_t start = 0;
    while (true) {
        const auto slash = key.find('/', start);
        const auto seg = key.substr(start, slash == std::string::npos ? std::string::npos : slash - start);

        char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
        if (!esc) throw std::runtime_error("escape failed for key: " + key);
        out << esc;
        curl_free(esc);

        if (slash == std::string::npos) break;
        out << '/';
        start = slash + 1;
    }
    return out.str();
}

std::string buildCanonicalQuery(CURL* curl, const std::map<std::string, std::string>& params) {
    // std::map iterates in key order, which is what SigV4 requires
    std::string q;
    for (const auto& [k, v] : params) {
        if (!q.empty()) q += '&';
        char* ek = curl_easy_escape(curl, k.c_str(), static_cast<int>(k.size()));
        char* ev = curl_easy_escape(curl, v.c_str(), static_cast<int>(v.size()));
        if (!ek || !ev) {
            curl_free(ek);
            curl_free(ev);
            throw std::runtime_error("escape failed for query parameter: " + k);
        }
        q += ek;
        q += '=';
        q += ev;
        curl_free(ek);
        curl_free(ev);
    }
    return q;
}

std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags) {
    std::ostringstream xml;

    xml << "<CompleteMultipartUpload>";

    for (size_t i = 0; i < etags.size(); ++i)
        xml << "<Part><PartNumber>" << (i + 1) << "</PartNumber><ETag>" << etags[i] << "</ETag></Part>";

    xml << "</CompleteMultipartUpload>";

    return xml.str();
}

std::string composeDeleteObjectsXMLBody(const std::vector<std::string>& keys) {
    std::ostringstream xml;
    xml << R"(<?xml version="1.0" encoding="UTF-8"?>)";
    xml << "<Delete><Quiet>true</Quiet>";
    for (const auto& k : keys) xml << "<Object><Key>" << xmlEscape(k) << "</Key></Object>";
    xml << "</Delete>";
    return xml.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

void parsePagination(const std::string& response, std::string& continuationToken, bool& moreResults) {
    moreResults = std::regex_search(response, std::regex("<IsTruncated>true</IsTruncated>"));
    std::smatch tokenMatch;
    if (moreResults && std::regex_search(response, tokenMatch,
                                         std::regex("<NextContinuationToken>([^<]+)</NextContinuationToken>")))
        continuationToken = xmlUnescape(tokenMatch[1].str());
    else moreResults = false;
}

std::optional<std::string> extractXmlTag(const std::string& xml, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    const auto start = xml.find(open);
    if (start == std::string::npos) return std::nullopt;
    const auto end = xml.find(close, start + open.size());
    if (end == std::string::npos) return std::nullopt;
    return xmlUnescape(xml.substr(start + open.size(), end - start - open.size()));
}

std::vector<S3ListedObject> parseListObjects(const std::string& response) {
    std::vector<S3ListedObject> out;
    size_t pos = 0;
    while (true) {
        const auto start = response.find("<Contents>", pos);
        if (start == std::string::npos) break;
        const auto end = response.find("</Contents>", start);
        if (end == std::string::npos) break;

        const auto block = response.substr(start, end - start);
        if (const auto key = extractXmlTag(block, "Key")) {
            S3ListedObject obj{*key, 0};
            if (const auto size = extractXmlTag(block, "Size")) obj.size = std::stoull(*size);
            out.push_back(std::move(obj));
        }
        pos = end + 11; // strlen("</Contents>")
    }
    return out;
}

bool extractETag(const std::string& respHdr, std::string& etagOut) {
    const auto v = extractHeader(respHdr, "ETag");
    if (!v) return false;
    etagOut = *v;
    return !etagOut.empty();
}

std::optional<std::string> extractHeader(const std::string& respHdr, const std::string& name) {
    std::string lowerName = name;
    std::ranges::transform(lowerName, lowerName.begin(), [](unsigned char c) { return std::tolower(c); });

    std::istringstream in(respHdr);
    std::string line;
    std::optional<std::string> found;
    // with redirects or 100-continue several header blocks arrive; the last one wins
    while (std::getline(in, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = line.substr(0, colon);
        std::ranges::transform(key, key.begin(), [](unsigned char c) { return std::tolower(c); });
        if (key != lowerName) continue;
        std::string value = line.substr(colon + 1);
        trimInPlace(value);
        found = value;
    }
    return found;
}

std::string xmlEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string xmlUnescape(const std::string& s) {
    static const std::pair<std::string_view, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}
    };

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        bool replaced = false;
        if (s[i] == '&') {
            for (const auto& [ent, ch] : entities) {
                if (s.compare(i, ent.size(), ent) == 0) {
                    out += ch;
                    i += ent.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) out += s[i++];
    }
    return out;
}

std::string buildAuthorizationHeader(const S3Credentials& creds,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery /* = "" */) {
    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD

    // Build canonical headers and signed headers
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        std::string value = it->second;
        trimInPlace(value);
        canonicalHeaders += it->first + ":" + value + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    // Canonical request block
    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << canonicalQuery << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;
    const std::string hashedCanonicalRequest = sha256Hex(canonicalRequestStream.str());

    // String to sign
    const std::string credentialScope = dateStamp + "/" + creds.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSignStream;
    stringToSignStream << algorithm << "\n"
                       << amzDate << "\n"
                       << credentialScope << "\n"
                       << hashedCanonicalRequest;

    // Key derivation
    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, creds.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << creds.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

void trimInPlace(std::string& s) {
    s.erase(s.begin(), std::ranges::find_if(s.begin(), s.end(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }));

    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

}
