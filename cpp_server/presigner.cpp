#include "presigner.hpp"
#include "object_key.hpp"
#include "s3_wire.hpp"
#include "store_error.hpp"
#include <utility>

Presigner::Presigner(const Config::ServerConfig& config, Clock clock)
    : endpoint_(ParseEndpoint(config.PresignEndpoint())),
      bucket_(config.s3_bucket),
      creds_{config.s3_access_key, config.s3_secret_key, config.s3_region, "s3"},
      default_expiry_(config.presign_default_expiry),
      max_expiry_(config.presign_max_expiry),
      clock_(clock ? std::move(clock) : Clock([] { return std::time(nullptr); })) {}

int64_t Presigner::ResolveExpiry(std::optional<int64_t> expires_in) const {
    if (!expires_in) return default_expiry_;
    if (*expires_in < 1 || *expires_in > max_expiry_) {
        std::string message = "expires_in must be between 1 and " + std::to_string(max_expiry_) + " seconds";
        throw StoreError(StoreErrorKind::InvalidArgument, message + " (got " + std::to_string(*expires_in) + ")", message);
    }
    return *expires_in;
}

PresignedGrant Presigner::PresignUpload(const std::string& key, const std::string& content_type,
                                        int64_t content_length, std::optional<int64_t> expires_in) const {
    ValidateObjectKey(key);
    if (content_length < 0 || content_length > kMaxSinglePutBytes) {
        std::string message = "content_length must be between 0 and " + std::to_string(kMaxSinglePutBytes) + " bytes";
        throw StoreError(StoreErrorKind::InvalidArgument, message + " (got " + std::to_string(content_length) + ")", message);
    }
    int64_t expiry = ResolveExpiry(expires_in);

    std::map<std::string, std::string> headers;
    headers["content-length"] = std::to_string(content_length);
    headers["content-type"] = content_type.empty() ? "application/octet-stream" : content_type;

    PresignedGrant grant = Sign("PUT", key, headers, expiry);
    grant.headers["Content-Type"] = headers["content-type"];
    grant.headers["Content-Length"] = headers["content-length"];
    return grant;
}

PresignedGrant Presigner::PresignDownload(const std::string& key, std::optional<int64_t> expires_in) const {
    ValidateObjectKey(key);
    int64_t expiry = ResolveExpiry(expires_in);
    return Sign("GET", key, {}, expiry);
}

PresignedGrant Presigner::Sign(const std::string& method, const std::string& key,
                               const std::map<std::string, std::string>& signed_headers, int64_t expires_in) const {
    std::time_t now = clock_();
    std::map<std::string, std::string> headers = signed_headers;
    headers["host"] = endpoint_.host;

    std::string path = ObjectPath(bucket_, key);
    std::string query = PresignQuery(creds_, method, path, headers, expires_in, AmzDate(now));

    PresignedGrant grant;
    grant.key = key;
    grant.method = method;
    grant.url = endpoint_.BaseUrl() + path + "?" + query;
    grant.expires_in = expires_in;
    grant.expires_at = EpochToIso8601(static_cast<long long>(now) + expires_in);
    return grant;
}
