#include "sigv4.hpp"
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string Trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::string CredentialScope(const SigningCredentials& creds, const std::string& date_ymd) {
    return date_ymd + "/" + creds.region + "/" + creds.service + "/aws4_request";
}

void CanonicalHeaders(const std::map<std::string, std::string>& headers,
                      std::string& canonical, std::string& signed_headers) {
    // std::map keeps lowercase names sorted as SigV4 requires.
    for (const auto& header : headers) {
        canonical += header.first + ":" + Trim(header.second) + "\n";
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += header.first;
    }
}

std::string Signature(const SigningCredentials& creds, const std::string& date_ymd,
                      const std::string& canonical_request, const std::string& amz_date) {
    std::stringstream string_to_sign;
    string_to_sign << "AWS4-HMAC-SHA256\n"
                   << amz_date << "\n"
                   << CredentialScope(creds, date_ymd) << "\n"
                   << Sha256Hex(canonical_request);

    std::string kDate = HmacSha256("AWS4" + creds.secret_key, date_ymd);
    std::string kRegion = HmacSha256(kDate, creds.region);
    std::string kService = HmacSha256(kRegion, creds.service);
    std::string kSigning = HmacSha256(kService, "aws4_request");
    std::string raw = HmacSha256(kSigning, string_to_sign.str());
    return HexEncode(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}

} // namespace

StoreEndpoint ParseEndpoint(const std::string& endpoint) {
    StoreEndpoint parsed;
    std::string rest = endpoint;

    size_t scheme_end = rest.find("://");
    if (scheme_end == std::string::npos) {
        parsed.scheme = "https";
    } else {
        parsed.scheme = ToLower(rest.substr(0, scheme_end));
        rest = rest.substr(scheme_end + 3);
    }
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported endpoint scheme: " + endpoint);
    }

    size_t path_start = rest.find('/');
    if (path_start != std::string::npos) {
        if (rest.find_first_not_of('/', path_start) != std::string::npos) {
            throw std::invalid_argument("Endpoint must not contain a path: " + endpoint);
        }
        rest = rest.substr(0, path_start);
    }
    if (rest.empty()) throw std::invalid_argument("Endpoint has no host: " + endpoint);

    size_t colon = rest.rfind(':');
    if (colon != std::string::npos && rest.find(']', colon) == std::string::npos) {
        std::string port = rest.substr(colon + 1);
        if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Invalid endpoint port: " + endpoint);
        }
        if ((parsed.scheme == "http" && port == "80") || (parsed.scheme == "https" && port == "443")) {
            rest = rest.substr(0, colon);
        }
    }

    parsed.host = ToLower(rest);
    return parsed;
}

std::string HmacSha256(const std::string& key, const std::string& msg) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
         hash, nullptr);
    return std::string(reinterpret_cast<char*>(hash), SHA256_DIGEST_LENGTH);
}

std::string HexEncode(const unsigned char* data, size_t len) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string Sha256Hex(const std::string& str) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(str.data()), str.size(), hash);
    return HexEncode(hash, SHA256_DIGEST_LENGTH);
}

std::string UriEncode(const std::string& value, bool encode_slash) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string ObjectPath(const std::string& bucket, const std::string& key) {
    return "/" + UriEncode(bucket, true) + "/" + UriEncode(key, false);
}

std::string AmzDate(std::time_t when) {
    std::tm gmt{};
    gmtime_r(&when, &gmt);
    char buffer[17];
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &gmt);
    return buffer;
}

std::string CanonicalQuery(const std::map<std::string, std::string>& params) {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(params.size());
    for (const auto& param : params) {
        encoded.emplace_back(UriEncode(param.first, true), UriEncode(param.second, true));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string query;
    for (const auto& pair : encoded) {
        if (!query.empty()) query += "&";
        query += pair.first + "=" + pair.second;
    }
    return query;
}

std::string BuildAuthorizationHeader(const SigningCredentials& creds,
                                     const std::string& method,
                                     const std::string& canonical_uri,
                                     const std::map<std::string, std::string>& query,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payload_hash,
                                     const std::string& amz_date) {
    std::string date_ymd = amz_date.substr(0, 8);

    std::string canonical_headers;
    std::string signed_headers;
    CanonicalHeaders(headers, canonical_headers, signed_headers);

    // 1. Canonical Request
    std::stringstream canonical_req;
    canonical_req << method << "\n"
                  << canonical_uri << "\n"
                  << CanonicalQuery(query) << "\n"
                  << canonical_headers << "\n"
                  << signed_headers << "\n"
                  << payload_hash;

    // 2. Signature over the string to sign
    std::string signature = Signature(creds, date_ymd, canonical_req.str(), amz_date);

    // 3. Header
    std::stringstream auth_header;
    auth_header << "AWS4-HMAC-SHA256 Credential=" << creds.access_key << "/" << CredentialScope(creds, date_ymd)
                << ", SignedHeaders=" << signed_headers << ", Signature=" << signature;
    return auth_header.str();
}

std::string PresignQuery(const SigningCredentials& creds,
                         const std::string& method,
                         const std::string& canonical_uri,
                         const std::map<std::string, std::string>& headers,
                         int64_t expires_in,
                         const std::string& amz_date) {
    std::string date_ymd = amz_date.substr(0, 8);

    std::string canonical_headers;
    std::string signed_headers;
    CanonicalHeaders(headers, canonical_headers, signed_headers);

    std::map<std::string, std::string> query;
    query["X-Amz-Algorithm"] = "AWS4-HMAC-SHA256";
    query["X-Amz-Credential"] = creds.access_key + "/" + CredentialScope(creds, date_ymd);
    query["X-Amz-Date"] = amz_date;
    query["X-Amz-Expires"] = std::to_string(expires_in);
    query["X-Amz-SignedHeaders"] = signed_headers;
    std::string canonical_query = CanonicalQuery(query);

    std::stringstream canonical_req;
    canonical_req << method << "\n"
                  << canonical_uri << "\n"
                  << canonical_query << "\n"
                  << canonical_headers << "\n"
                  << signed_headers << "\n"
                  << "UNSIGNED-PAYLOAD";

    return canonical_query + "&X-Amz-Signature=" + Signature(creds, date_ymd, canonical_req.str(), amz_date);
}
