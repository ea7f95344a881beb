#pragma once

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace wsync::util {

struct S3Credentials {
    std::string access_key;
    std::string secret_key;
    std::string region;
};

struct S3ListedObject {
    std::string key;
    uintmax_t size = 0;
};

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);
std::string md5Base64(const std::string& data);

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key);
std::string buildCanonicalQuery(CURL* curl, const std::map<std::string, std::string>& params);

std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags);
std::string composeDeleteObjectsXMLBody(const std::vector<std::string>& keys);

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

void parsePagination(const std::string& response, std::string& continuationToken, bool& moreResults);
std::vector<S3ListedObject> parseListObjects(const std::string& response);
std::optional<std::string> extractXmlTag(const std::string& xml, const std::string& tag);

[[nodiscard]] bool extractETag(const std::string& respHdr, std::string& etagOut);
std::optional<std::string> extractHeader(const std::string& respHdr, const std::string& name);

std::string xmlEscape(const std::string& s);
std::string xmlUnescape(const std::string& s);

// amzDate is "YYYYMMDDTHHMMSSZ"; the date stamp is taken from it so both always agree.
std::string buildAuthorizationHeader(const S3Credentials& creds,
                                     const std::string& method, const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");
void trimInPlace(std::string& s);

void ensureCurlGlobalInit();

inline std::string slurp(const std::istream& in) {
    std::ostringstream oss;
    oss << in.rdbuf();          // copy entire buffer
    return oss.str();
}

}
