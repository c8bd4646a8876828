#ifndef PROVISIONER_HPP
#define PROVISIONER_HPP

#include <atomic>
#include <mutex>
#include <string>
#include "config.hpp"
#include "minio_admin.hpp"
#include "readiness.hpp"

enum class ProvisionState {
    Waiting,
    Provisioning,
    Done,
    Failed
};

const char* StateName(ProvisionState state);

struct ProvisionPlan {
    std::string bucket;
    std::string access_key;
    std::string secret_key;
    std::string policy_name = "app-rw";
    RetryPolicy retry;
};

ProvisionPlan PlanFromConfig(const Config::ServerConfig& config);

// Read/write on the bucket's objects plus listing the bucket itself.
std::string RenderBucketPolicy(const std::string& bucket);

// Startup gate: waits for the admin API, then creates bucket, identity and
// policy and attaches the policy. Every step is repeat-safe, so running the
// whole sequence again against the same store changes nothing.
class Provisioner {
public:
    Provisioner(AdminClient& admin, ProvisionPlan plan, Sleeper sleep = SleepFor);

    // Returns Done or Failed. Throws std::logic_error if another Run() is in progress.
    ProvisionState Run();

    ProvisionState State() const { return state_.load(); }
    const std::string& FailureReason() const { return failure_; }

private:
    AdminClient& admin_;
    ProvisionPlan plan_;
    Sleeper sleep_;
    std::atomic<ProvisionState> state_{ProvisionState::Waiting};
    std::string failure_;
    std::mutex run_mutex_;

    void Transition(ProvisionState next);
    void Fail(const std::string& reason);
    void ProvisionAll();
};

#endif // PROVISIONER_HPP
