#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

class Config {
public:
    struct ServerConfig {
        std::string listen_address = "0.0.0.0";
        int port = 8080;
        std::string log_level = "INFO";
        uint64_t max_upload_bytes = 5ULL * 1024 * 1024 * 1024;

        // Object store, accessed with the application identity
        std::string s3_endpoint = "http://minio:9000";
        std::string s3_bucket = "";
        std::string s3_access_key = "";
        std::string s3_secret_key = "";
        std::string s3_region = "us-east-1";
        uint64_t s3_part_size = 8 * 1024 * 1024;
        long s3_connect_timeout_ms = 10000;
        long s3_request_timeout_ms = 300000;

        // Presigned grants
        int64_t presign_default_expiry = 3600;
        int64_t presign_max_expiry = 604800;
        std::string presign_public_endpoint = ""; // empty: same as s3_endpoint

        // Bridge startup gate
        int health_retries = 10;
        long health_backoff_ms = 3000;

        // Provisioning agent
        std::string admin_endpoint = ""; // empty: same as s3_endpoint
        std::string admin_access_key = "";
        std::string admin_secret_key = "";
        std::string admin_policy_name = "app-rw";
        int admin_retries = 60;
        long admin_interval_ms = 1000;
        std::string admin_lock_file = "/tmp/bucketbridge-provision.lock";

        const std::string& PresignEndpoint() const {
            return presign_public_endpoint.empty() ? s3_endpoint : presign_public_endpoint;
        }
        const std::string& AdminEndpoint() const {
            return admin_endpoint.empty() ? s3_endpoint : admin_endpoint;
        }
    };

    enum class Role {
        Bridge,
        Provisioner
    };

    static Config& Instance();

    // Reads the JSON file (defaults if absent), then the environment, then validates for role.
    void Load(const std::string& path, Role role);
    const ServerConfig& Get() const;

    static void ApplyJson(const nlohmann::json& j, ServerConfig& config);
    static void ApplyEnvironment(ServerConfig& config);

    // Throws std::invalid_argument describing the first problem found.
    static void Validate(const ServerConfig& config, Role role);

private:
    Config() = default;
    ServerConfig config_;
};

#endif // CONFIG_HPP
