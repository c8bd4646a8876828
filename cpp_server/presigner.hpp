#ifndef PRESIGNER_HPP
#define PRESIGNER_HPP

#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include "config.hpp"
#include "sigv4.hpp"

struct PresignedGrant {
    std::string key;
    std::string url;
    std::string method;
    std::map<std::string, std::string> headers; // must be sent verbatim with the request
    int64_t expires_in = 0;
    std::string expires_at;
};

// Issues SigV4 query-signed URLs. Pure computation: no store round trip and no state.
class Presigner {
public:
    static constexpr int64_t kMaxSinglePutBytes = 5LL * 1024 * 1024 * 1024;

    using Clock = std::function<std::time_t()>;

    explicit Presigner(const Config::ServerConfig& config, Clock clock = nullptr);

    // An absent expiry selects the configured default. Invalid input throws StoreError(InvalidArgument).
    PresignedGrant PresignUpload(const std::string& key, const std::string& content_type,
                                 int64_t content_length, std::optional<int64_t> expires_in) const;
    PresignedGrant PresignDownload(const std::string& key, std::optional<int64_t> expires_in) const;

    int64_t DefaultExpiry() const { return default_expiry_; }
    int64_t MaxExpiry() const { return max_expiry_; }

private:
    StoreEndpoint endpoint_;
    std::string bucket_;
    SigningCredentials creds_;
    int64_t default_expiry_;
    int64_t max_expiry_;
    Clock clock_;

    int64_t ResolveExpiry(std::optional<int64_t> expires_in) const;
    PresignedGrant Sign(const std::string& method, const std::string& key,
                        const std::map<std::string, std::string>& signed_headers, int64_t expires_in) const;
};

#endif // PRESIGNER_HPP
