#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>
#include "config.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kVariables) unsetenv(name);
    }

    void TearDown() override {
        for (const char* name : kVariables) unsetenv(name);
    }

    static Config::ServerConfig Complete() {
        Config::ServerConfig config;
        config.s3_bucket = "uploads";
        config.s3_access_key = "app";
        config.s3_secret_key = "app-secret";
        config.admin_access_key = "root";
        config.admin_secret_key = "root-secret";
        return config;
    }

    static constexpr const char* kVariables[] = {
        "APP_HOST", "APP_PORT", "LOG_LEVEL", "MAX_UPLOAD_BYTES", "S3_ENDPOINT", "MINIO_BUCKET", "S3_BUCKET",
        "OMS_ACCESS_KEY", "S3_ACCESS_KEY", "OMS_SECRET_KEY", "S3_SECRET_KEY", "S3_REGION", "S3_PART_SIZE",
        "PRESIGN_DEFAULT_EXPIRY", "PRESIGN_MAX_EXPIRY", "PRESIGN_PUBLIC_ENDPOINT", "S3_HEALTH_RETRIES",
        "S3_HEALTH_BACKOFF", "MINIO_ENDPOINT", "MINIO_ROOT_USER", "MINIO_ROOT_PASSWORD", "MINIO_POLICY_NAME",
        "MINIO_INIT_RETRIES"};
};

TEST_F(ConfigTest, DefaultsMatchDeployment) {
    Config::ServerConfig config;
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.s3_endpoint, "http://minio:9000");
    EXPECT_EQ(config.s3_part_size, 8u * 1024 * 1024);
    EXPECT_EQ(config.presign_default_expiry, 3600);
    EXPECT_EQ(config.health_retries, 10);
    EXPECT_EQ(config.health_backoff_ms, 3000);
    EXPECT_EQ(config.admin_policy_name, "app-rw");
    EXPECT_EQ(config.PresignEndpoint(), "http://minio:9000");
    EXPECT_EQ(config.AdminEndpoint(), "http://minio:9000");
}

TEST_F(ConfigTest, AppliesNestedJson) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "port": 9090,
        "log_level": "DEBUG",
        "s3": {"endpoint": "http://localhost:9000", "bucket": "docs", "part_size": 16777216},
        "presign": {"default_expiry": 600, "public_endpoint": "https://files.example.com"},
        "startup": {"health_retries": 3},
        "admin": {"policy_name": "docs-rw", "retries": 5}
    })");

    Config::ServerConfig config;
    Config::ApplyJson(j, config);

    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_EQ(config.s3_endpoint, "http://localhost:9000");
    EXPECT_EQ(config.s3_bucket, "docs");
    EXPECT_EQ(config.s3_part_size, 16777216u);
    EXPECT_EQ(config.presign_default_expiry, 600);
    EXPECT_EQ(config.PresignEndpoint(), "https://files.example.com");
    EXPECT_EQ(config.health_retries, 3);
    EXPECT_EQ(config.admin_policy_name, "docs-rw");
    EXPECT_EQ(config.admin_retries, 5);
}

TEST_F(ConfigTest, RejectsWronglyTypedJson) {
    nlohmann::json j = nlohmann::json::parse(R"({"port": "eighty"})");
    Config::ServerConfig config;
    EXPECT_THROW(Config::ApplyJson(j, config), std::invalid_argument);
}

TEST_F(ConfigTest, EnvironmentOverridesJson) {
    setenv("APP_PORT", "7000", 1);
    setenv("MINIO_BUCKET", "from-env", 1);
    setenv("OMS_ACCESS_KEY", "oms", 1);
    setenv("OMS_SECRET_KEY", "oms-secret", 1);
    setenv("S3_HEALTH_BACKOFF", "1.5", 1);
    setenv("MINIO_ROOT_USER", "minioadmin", 1);
    setenv("MINIO_INIT_RETRIES", "12", 1);

    Config::ServerConfig config;
    config.s3_bucket = "from-json";
    Config::ApplyEnvironment(config);

    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.s3_bucket, "from-env");
    EXPECT_EQ(config.s3_access_key, "oms");
    EXPECT_EQ(config.s3_secret_key, "oms-secret");
    EXPECT_EQ(config.health_backoff_ms, 1500);
    EXPECT_EQ(config.admin_access_key, "minioadmin");
    EXPECT_EQ(config.admin_retries, 12);
}

TEST_F(ConfigTest, GenericNamesWinOverProvisioningNames) {
    setenv("MINIO_BUCKET", "minio-name", 1);
    setenv("S3_BUCKET", "s3-name", 1);

    Config::ServerConfig config;
    Config::ApplyEnvironment(config);
    EXPECT_EQ(config.s3_bucket, "s3-name");
}

TEST_F(ConfigTest, RejectsMalformedEnvironmentNumbers) {
    setenv("APP_PORT", "80a", 1);
    Config::ServerConfig config;
    EXPECT_THROW(Config::ApplyEnvironment(config), std::invalid_argument);

    unsetenv("APP_PORT");
    setenv("S3_HEALTH_BACKOFF", "-1", 1);
    EXPECT_THROW(Config::ApplyEnvironment(config), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsEnvironmentNumbersOutsideTheFieldRange) {
    Config::ServerConfig config;
    setenv("MAX_UPLOAD_BYTES", "-1", 1);
    EXPECT_THROW(Config::ApplyEnvironment(config), std::invalid_argument);
    EXPECT_EQ(config.max_upload_bytes, 5ULL * 1024 * 1024 * 1024);

    unsetenv("MAX_UPLOAD_BYTES");
    setenv("APP_PORT", "4294967376", 1);
    EXPECT_THROW(Config::ApplyEnvironment(config), std::invalid_argument);
    EXPECT_EQ(config.port, 8080);
}

TEST_F(ConfigTest, ValidatesBridgeSettings) {
    EXPECT_NO_THROW(Config::Validate(Complete(), Config::Role::Bridge));

    Config::ServerConfig no_bucket = Complete();
    no_bucket.s3_bucket.clear();
    EXPECT_THROW(Config::Validate(no_bucket, Config::Role::Bridge), std::invalid_argument);

    Config::ServerConfig small_parts = Complete();
    small_parts.s3_part_size = 1024 * 1024;
    EXPECT_THROW(Config::Validate(small_parts, Config::Role::Bridge), std::invalid_argument);

    Config::ServerConfig long_expiry = Complete();
    long_expiry.presign_max_expiry = 604801;
    EXPECT_THROW(Config::Validate(long_expiry, Config::Role::Bridge), std::invalid_argument);

    Config::ServerConfig default_over_max = Complete();
    default_over_max.presign_default_expiry = 7200;
    default_over_max.presign_max_expiry = 3600;
    EXPECT_THROW(Config::Validate(default_over_max, Config::Role::Bridge), std::invalid_argument);
}

TEST_F(ConfigTest, ProvisionerNeedsAdminCredentials) {
    Config::ServerConfig config = Complete();
    EXPECT_NO_THROW(Config::Validate(config, Config::Role::Provisioner));

    config.admin_secret_key.clear();
    EXPECT_THROW(Config::Validate(config, Config::Role::Provisioner), std::invalid_argument);
    // The bridge never talks to the admin API.
    EXPECT_NO_THROW(Config::Validate(config, Config::Role::Bridge));
}
