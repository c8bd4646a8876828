#include "config.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

constexpr uint64_t kMinPartSize = 5 * 1024 * 1024;
constexpr uint64_t kMaxPartSize = 5ULL * 1024 * 1024 * 1024;
constexpr int64_t kSigV4MaxExpiry = 604800;

bool ReadEnv(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return false;
    out = value;
    return true;
}

template <typename T>
void EnvInteger(const char* name, T& target) {
    std::string raw;
    if (!ReadEnv(name, raw)) return;
    long long value = 0;
    try {
        size_t consumed = 0;
        value = std::stoll(raw, &consumed);
        if (consumed != raw.size()) throw std::invalid_argument(raw);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Environment variable ") + name + " is not an integer: " + raw);
    }
    if (value < static_cast<long long>(std::numeric_limits<T>::min()) ||
        (value > 0 && static_cast<unsigned long long>(value) >
                          static_cast<unsigned long long>(std::numeric_limits<T>::max()))) {
        throw std::invalid_argument(std::string("Environment variable ") + name + " is out of range: " + raw);
    }
    target = static_cast<T>(value);
}

void EnvString(const char* name, std::string& target) {
    ReadEnv(name, target);
}

} // namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

void Config::Load(const std::string& path, Role role) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::Warn("Config file not found at " + path + ". Using defaults.", "Config");
    } else {
        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument("Failed to parse config file " + path + ": " + e.what());
        }
        ApplyJson(j, config_);
        Logger::Info("Configuration loaded from " + path, "Config");
    }

    ApplyEnvironment(config_);
    Validate(config_, role);
}

const Config::ServerConfig& Config::Get() const {
    return config_;
}

void Config::ApplyJson(const nlohmann::json& j, ServerConfig& config) {
    try {
        if (j.contains("listen_address")) config.listen_address = j["listen_address"].get<std::string>();
        if (j.contains("port")) config.port = j["port"].get<int>();
        if (j.contains("log_level")) config.log_level = j["log_level"].get<std::string>();
        if (j.contains("max_upload_bytes")) config.max_upload_bytes = j["max_upload_bytes"].get<uint64_t>();

        if (j.contains("s3")) {
            auto& s3 = j["s3"];
            if (s3.contains("endpoint")) config.s3_endpoint = s3["endpoint"].get<std::string>();
            if (s3.contains("bucket")) config.s3_bucket = s3["bucket"].get<std::string>();
            if (s3.contains("access_key")) config.s3_access_key = s3["access_key"].get<std::string>();
            if (s3.contains("secret_key")) config.s3_secret_key = s3["secret_key"].get<std::string>();
            if (s3.contains("region")) config.s3_region = s3["region"].get<std::string>();
            if (s3.contains("part_size")) config.s3_part_size = s3["part_size"].get<uint64_t>();
            if (s3.contains("connect_timeout_ms")) config.s3_connect_timeout_ms = s3["connect_timeout_ms"].get<long>();
            if (s3.contains("request_timeout_ms")) config.s3_request_timeout_ms = s3["request_timeout_ms"].get<long>();
        }

        if (j.contains("presign")) {
            auto& presign = j["presign"];
            if (presign.contains("default_expiry")) config.presign_default_expiry = presign["default_expiry"].get<int64_t>();
            if (presign.contains("max_expiry")) config.presign_max_expiry = presign["max_expiry"].get<int64_t>();
            if (presign.contains("public_endpoint")) config.presign_public_endpoint = presign["public_endpoint"].get<std::string>();
        }

        if (j.contains("startup")) {
            auto& startup = j["startup"];
            if (startup.contains("health_retries")) config.health_retries = startup["health_retries"].get<int>();
            if (startup.contains("health_backoff_ms")) config.health_backoff_ms = startup["health_backoff_ms"].get<long>();
        }

        if (j.contains("admin")) {
            auto& admin = j["admin"];
            if (admin.contains("endpoint")) config.admin_endpoint = admin["endpoint"].get<std::string>();
            if (admin.contains("access_key")) config.admin_access_key = admin["access_key"].get<std::string>();
            if (admin.contains("secret_key")) config.admin_secret_key = admin["secret_key"].get<std::string>();
            if (admin.contains("policy_name")) config.admin_policy_name = admin["policy_name"].get<std::string>();
            if (admin.contains("retries")) config.admin_retries = admin["retries"].get<int>();
            if (admin.contains("interval_ms")) config.admin_interval_ms = admin["interval_ms"].get<long>();
            if (admin.contains("lock_file")) config.admin_lock_file = admin["lock_file"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid config value: ") + e.what());
    }
}

void Config::ApplyEnvironment(ServerConfig& config) {
    EnvString("APP_HOST", config.listen_address);
    EnvInteger("APP_PORT", config.port);
    EnvString("LOG_LEVEL", config.log_level);
    EnvInteger("MAX_UPLOAD_BYTES", config.max_upload_bytes);

    EnvString("S3_ENDPOINT", config.s3_endpoint);
    // The provisioning script names the same values after MinIO and the app identity.
    EnvString("MINIO_BUCKET", config.s3_bucket);
    EnvString("S3_BUCKET", config.s3_bucket);
    EnvString("OMS_ACCESS_KEY", config.s3_access_key);
    EnvString("S3_ACCESS_KEY", config.s3_access_key);
    EnvString("OMS_SECRET_KEY", config.s3_secret_key);
    EnvString("S3_SECRET_KEY", config.s3_secret_key);
    EnvString("S3_REGION", config.s3_region);
    EnvInteger("S3_PART_SIZE", config.s3_part_size);

    EnvInteger("PRESIGN_DEFAULT_EXPIRY", config.presign_default_expiry);
    EnvInteger("PRESIGN_MAX_EXPIRY", config.presign_max_expiry);
    EnvString("PRESIGN_PUBLIC_ENDPOINT", config.presign_public_endpoint);

    EnvInteger("S3_HEALTH_RETRIES", config.health_retries);
    std::string backoff;
    if (ReadEnv("S3_HEALTH_BACKOFF", backoff)) {
        try {
            size_t consumed = 0;
            double seconds = std::stod(backoff, &consumed);
            if (consumed != backoff.size() || seconds < 0) throw std::invalid_argument(backoff);
            config.health_backoff_ms = static_cast<long>(seconds * 1000.0);
        } catch (const std::exception&) {
            throw std::invalid_argument("Environment variable S3_HEALTH_BACKOFF is not a number of seconds: " + backoff);
        }
    }

    EnvString("MINIO_ENDPOINT", config.admin_endpoint);
    EnvString("MINIO_ROOT_USER", config.admin_access_key);
    EnvString("MINIO_ROOT_PASSWORD", config.admin_secret_key);
    EnvString("MINIO_POLICY_NAME", config.admin_policy_name);
    EnvInteger("MINIO_INIT_RETRIES", config.admin_retries);
}

void Config::Validate(const ServerConfig& config, Role role) {
    if (config.s3_endpoint.empty()) throw std::invalid_argument("s3.endpoint must be set");
    if (config.s3_bucket.empty()) throw std::invalid_argument("s3.bucket must be set");
    if (config.s3_access_key.empty() || config.s3_secret_key.empty()) {
        throw std::invalid_argument("s3.access_key and s3.secret_key must be set");
    }
    if (config.s3_region.empty()) throw std::invalid_argument("s3.region must be set");

    if (role == Role::Bridge) {
        if (config.port <= 0 || config.port > 65535) {
            throw std::invalid_argument("port must be between 1 and 65535");
        }
        if (config.s3_part_size < kMinPartSize || config.s3_part_size > kMaxPartSize) {
            throw std::invalid_argument("s3.part_size must be between 5 MiB and 5 GiB");
        }
        if (config.presign_max_expiry < 1 || config.presign_max_expiry > kSigV4MaxExpiry) {
            throw std::invalid_argument("presign.max_expiry must be between 1 and 604800 seconds");
        }
        if (config.presign_default_expiry < 1 || config.presign_default_expiry > config.presign_max_expiry) {
            throw std::invalid_argument("presign.default_expiry must be between 1 and presign.max_expiry");
        }
        if (config.health_retries < 1) throw std::invalid_argument("startup.health_retries must be at least 1");
        if (config.health_backoff_ms < 0) throw std::invalid_argument("startup.health_backoff_ms must not be negative");
    } else {
        if (config.admin_access_key.empty() || config.admin_secret_key.empty()) {
            throw std::invalid_argument("admin.access_key and admin.secret_key must be set");
        }
        if (config.admin_policy_name.empty()) throw std::invalid_argument("admin.policy_name must be set");
        if (config.admin_retries < 1) throw std::invalid_argument("admin.retries must be at least 1");
        if (config.admin_interval_ms < 0) throw std::invalid_argument("admin.interval_ms must not be negative");
    }
}
