#ifndef SIGV4_HPP
#define SIGV4_HPP

#include <cstdint>
#include <ctime>
#include <map>
#include <string>

struct SigningCredentials {
    std::string access_key;
    std::string secret_key;
    std::string region = "us-east-1";
    std::string service = "s3";
};

// scheme://host[:port] with default ports removed and no path.
struct StoreEndpoint {
    std::string scheme;
    std::string host; // exactly what goes into the Host header
    std::string BaseUrl() const { return scheme + "://" + host; }
};

// Accepts "http://minio:9000", "https://s3.amazonaws.com/" or a bare "host:port" (https).
// Throws std::invalid_argument on anything else.
StoreEndpoint ParseEndpoint(const std::string& endpoint);

std::string HmacSha256(const std::string& key, const std::string& msg);
std::string HexEncode(const unsigned char* data, size_t len);
std::string Sha256Hex(const std::string& str);

// RFC 3986 unreserved characters pass through; '/' is kept unless encode_slash.
std::string UriEncode(const std::string& value, bool encode_slash);

// "/bucket/key" with each key segment encoded once.
std::string ObjectPath(const std::string& bucket, const std::string& key);

// YYYYMMDD'T'HHMMSS'Z'
std::string AmzDate(std::time_t when);

// Sorted, encoded key=value pairs joined by '&'.
std::string CanonicalQuery(const std::map<std::string, std::string>& params);

// Value for the Authorization header. `headers` must use lowercase names and
// contain every header that should be signed (host, x-amz-date, x-amz-content-sha256, ...).
std::string BuildAuthorizationHeader(const SigningCredentials& creds,
                                     const std::string& method,
                                     const std::string& canonical_uri,
                                     const std::map<std::string, std::string>& query,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payload_hash,
                                     const std::string& amz_date);

// Query-string authentication. Returns the full canonical query including
// X-Amz-Signature. `headers` must contain at least "host".
std::string PresignQuery(const SigningCredentials& creds,
                         const std::string& method,
                         const std::string& canonical_uri,
                         const std::map<std::string, std::string>& headers,
                         int64_t expires_in,
                         const std::string& amz_date);

#endif // SIGV4_HPP
