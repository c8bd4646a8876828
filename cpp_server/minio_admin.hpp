#ifndef MINIO_ADMIN_HPP
#define MINIO_ADMIN_HPP

#include <string>
#include "config.hpp"
#include "signed_transport.hpp"
#include "store_error.hpp"

enum class StepOutcome {
    Created,
    AlreadyExists
};

// Administrative capabilities the provisioning agent needs. Each create call
// is repeat-safe: an existing resource is re-affirmed and reported as
// AlreadyExists. Failures throw StoreError.
class AdminClient {
public:
    virtual ~AdminClient() = default;

    // True once the admin API accepts our credentials. Never throws.
    virtual bool Handshake() = 0;

    virtual StepOutcome CreateBucket(const std::string& bucket) = 0;
    virtual StepOutcome CreateUser(const std::string& access_key, const std::string& secret_key) = 0;
    virtual StepOutcome CreatePolicy(const std::string& name, const std::string& document) = 0;
    virtual StepOutcome AttachPolicy(const std::string& policy_name, const std::string& access_key) = 0;
};

// MinIO admin REST API (v3) signed with the root credentials.
class MinioAdminClient : public AdminClient {
public:
    explicit MinioAdminClient(const Config::ServerConfig& config);

    bool Handshake() override;
    StepOutcome CreateBucket(const std::string& bucket) override;
    StepOutcome CreateUser(const std::string& access_key, const std::string& secret_key) override;
    StepOutcome CreatePolicy(const std::string& name, const std::string& document) override;
    StepOutcome AttachPolicy(const std::string& policy_name, const std::string& access_key) override;

private:
    std::string admin_secret_;
    std::string region_;
    SignedTransport transport_;

    TransportResponse Send(const TransportRequest& request) const;
    StoreError Failure(const std::string& operation, const TransportResponse& response) const;
};

#endif // MINIO_ADMIN_HPP
