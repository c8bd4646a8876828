#include "minio_admin.hpp"
#include "admin_payload.hpp"
#include "logger.hpp"
#include "s3_wire.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace {

const char* const kAdminPrefix = "/minio/admin/v3/";

// Admin API errors are JSON; S3 API errors (bucket creation) are XML.
std::string ErrorCode(const std::string& body) {
    if (body.empty()) return "";
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("Code") && parsed["Code"].is_string()) {
        return parsed["Code"].get<std::string>();
    }
    return ExtractXmlValue(body, "Code");
}

TransportRequest AdminRequest(const std::string& method, const std::string& api) {
    TransportRequest request;
    request.method = method;
    request.path = std::string(kAdminPrefix) + api;
    return request;
}

bool HasPolicy(const std::string& policy_list, const std::string& policy_name) {
    std::stringstream ss(policy_list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item == policy_name) return true;
    }
    return false;
}

} // namespace

MinioAdminClient::MinioAdminClient(const Config::ServerConfig& config)
    : admin_secret_(config.admin_secret_key),
      region_(config.s3_region),
      transport_(config.AdminEndpoint(),
                 SigningCredentials{config.admin_access_key, config.admin_secret_key, config.s3_region, "s3"},
                 config.s3_connect_timeout_ms, config.s3_request_timeout_ms) {}

TransportResponse MinioAdminClient::Send(const TransportRequest& request) const {
    try {
        return transport_.Execute(request);
    } catch (const std::exception& e) {
        throw StoreError(StoreErrorKind::Internal, std::string("Admin transport failure: ") + e.what());
    }
}

StoreError MinioAdminClient::Failure(const std::string& operation, const TransportResponse& response) const {
    if (response.curl != CURLE_OK) {
        return StoreError(StoreErrorKind::Unavailable,
                          operation + " failed: " + curl_easy_strerror(response.curl));
    }
    std::string code = ErrorCode(response.body);
    std::string detail = operation + " failed: HTTP " + std::to_string(response.status);
    if (!code.empty()) detail += " " + code;
    return StoreError(ClassifyS3Error(response.status, code), detail);
}

bool MinioAdminClient::Handshake() {
    try {
        TransportResponse response = Send(AdminRequest("GET", "info"));
        if (response.Ok()) return true;
        Logger::Warn(Failure("Admin handshake", response).what(), "Provision");
    } catch (const std::exception& e) {
        Logger::Warn(std::string("Admin handshake failed: ") + e.what(), "Provision");
    }
    return false;
}

StepOutcome MinioAdminClient::CreateBucket(const std::string& bucket) {
    TransportRequest request;
    request.method = "PUT";
    request.path = "/" + UriEncode(bucket, true);
    if (region_ != "us-east-1") {
        request.headers["content-type"] = "application/xml";
        request.body = "<CreateBucketConfiguration xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
                       "<LocationConstraint>" + XmlEscape(region_) + "</LocationConstraint>"
                       "</CreateBucketConfiguration>";
    }

    TransportResponse response = Send(request);
    if (response.Ok()) return StepOutcome::Created;

    std::string code = ErrorCode(response.body);
    if (code == "BucketAlreadyOwnedByYou" || code == "BucketAlreadyExists") return StepOutcome::AlreadyExists;
    throw Failure("CreateBucket " + bucket, response);
}

StepOutcome MinioAdminClient::CreateUser(const std::string& access_key, const std::string& secret_key) {
    TransportRequest lookup = AdminRequest("GET", "user-info");
    lookup.query["accessKey"] = access_key;
    TransportResponse existing = Send(lookup);

    bool exists = existing.Ok();
    if (!exists) {
        StoreError error = Failure("User lookup " + access_key, existing);
        if (error.Kind() != StoreErrorKind::NotFound && ErrorCode(existing.body) != "XMinioAdminNoSuchUser") {
            throw error;
        }
    }

    // Always (re)write the secret so a rotated credential takes effect.
    json user;
    user["secretKey"] = secret_key;
    user["status"] = "enabled";

    TransportRequest request = AdminRequest("PUT", "add-user");
    request.query["accessKey"] = access_key;
    request.headers["content-type"] = "application/octet-stream";
    request.body = EncryptAdminPayload(admin_secret_, user.dump());

    TransportResponse response = Send(request);
    if (!response.Ok()) throw Failure("CreateUser " + access_key, response);
    return exists ? StepOutcome::AlreadyExists : StepOutcome::Created;
}

StepOutcome MinioAdminClient::CreatePolicy(const std::string& name, const std::string& document) {
    TransportRequest lookup = AdminRequest("GET", "info-canned-policy");
    lookup.query["name"] = name;
    TransportResponse existing = Send(lookup);

    bool exists = existing.Ok();
    if (!exists) {
        StoreError error = Failure("Policy lookup " + name, existing);
        if (error.Kind() != StoreErrorKind::NotFound && ErrorCode(existing.body) != "XMinioAdminNoSuchPolicy") {
            throw error;
        }
    }

    TransportRequest request = AdminRequest("PUT", "add-canned-policy");
    request.query["name"] = name;
    request.headers["content-type"] = "application/json";
    request.body = document;

    TransportResponse response = Send(request);
    if (!response.Ok()) throw Failure("CreatePolicy " + name, response);
    return exists ? StepOutcome::AlreadyExists : StepOutcome::Created;
}

StepOutcome MinioAdminClient::AttachPolicy(const std::string& policy_name, const std::string& access_key) {
    bool attached = false;
    TransportRequest lookup = AdminRequest("GET", "user-info");
    lookup.query["accessKey"] = access_key;
    TransportResponse info = Send(lookup);
    if (info.Ok()) {
        json parsed = json::parse(info.body, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("policyName") &&
            parsed["policyName"].is_string()) {
            attached = HasPolicy(parsed["policyName"].get<std::string>(), policy_name);
        }
    }

    TransportRequest request = AdminRequest("PUT", "set-user-or-group-policy");
    request.query["policyName"] = policy_name;
    request.query["userOrGroup"] = access_key;
    request.query["isGroup"] = "false";

    TransportResponse response = Send(request);
    if (response.Ok()) return attached ? StepOutcome::AlreadyExists : StepOutcome::Created;

    if (ErrorCode(response.body) == "XMinioAdminPolicyChangeAlreadyApplied") return StepOutcome::AlreadyExists;
    throw Failure("AttachPolicy " + policy_name + " to " + access_key, response);
}
