#include "provisioner.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace {

const char* OutcomeText(StepOutcome outcome) {
    return outcome == StepOutcome::Created ? "created" : "already exists";
}

} // namespace

const char* StateName(ProvisionState state) {
    switch (state) {
        case ProvisionState::Waiting: return "waiting";
        case ProvisionState::Provisioning: return "provisioning";
        case ProvisionState::Done: return "done";
        case ProvisionState::Failed: return "failed";
    }
    return "unknown";
}

ProvisionPlan PlanFromConfig(const Config::ServerConfig& config) {
    ProvisionPlan plan;
    plan.bucket = config.s3_bucket;
    plan.access_key = config.s3_access_key;
    plan.secret_key = config.s3_secret_key;
    plan.policy_name = config.admin_policy_name;
    plan.retry.max_attempts = config.admin_retries;
    plan.retry.interval = std::chrono::milliseconds(config.admin_interval_ms);
    return plan;
}

std::string RenderBucketPolicy(const std::string& bucket) {
    json objects;
    objects["Effect"] = "Allow";
    objects["Action"] = json::array({"s3:GetObject", "s3:PutObject", "s3:DeleteObject"});
    objects["Resource"] = "arn:aws:s3:::" + bucket + "/*";

    json listing;
    listing["Effect"] = "Allow";
    listing["Action"] = json::array({"s3:ListBucket"});
    listing["Resource"] = "arn:aws:s3:::" + bucket;

    json policy;
    policy["Version"] = "2012-10-17";
    policy["Statement"] = json::array({objects, listing});
    return policy.dump();
}

Provisioner::Provisioner(AdminClient& admin, ProvisionPlan plan, Sleeper sleep)
    : admin_(admin), plan_(std::move(plan)), sleep_(sleep ? std::move(sleep) : Sleeper(SleepFor)) {}

void Provisioner::Transition(ProvisionState next) {
    ProvisionState previous = state_.exchange(next);
    Logger::Info(std::string("State ") + StateName(previous) + " -> " + StateName(next), "Provision");
}

void Provisioner::Fail(const std::string& reason) {
    failure_ = reason;
    Logger::Error(reason, "Provision");
    Transition(ProvisionState::Failed);
}

ProvisionState Provisioner::Run() {
    std::unique_lock<std::mutex> lock(run_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) throw std::logic_error("Provisioner is already running");

    failure_.clear();
    Transition(ProvisionState::Waiting);

    ReadinessResult ready = WaitUntilReady([this] { return admin_.Handshake(); }, plan_.retry, "Provision", sleep_);
    if (!ready.Ready()) {
        Fail("Object store admin API not ready after " + std::to_string(ready.attempts) + " attempts");
        return state_.load();
    }

    Transition(ProvisionState::Provisioning);
    try {
        ProvisionAll();
    } catch (const StoreError& e) {
        Fail(std::string("Provisioning failed (") + KindName(e.Kind()) + "): " + e.what());
        return state_.load();
    } catch (const std::exception& e) {
        Fail(std::string("Provisioning failed: ") + e.what());
        return state_.load();
    }

    Transition(ProvisionState::Done);
    Logger::Info("Bucket: " + plan_.bucket + ", user: " + plan_.access_key +
                 ", policy: " + plan_.policy_name + " (read/write on " + plan_.bucket + ")", "Provision");
    return state_.load();
}

void Provisioner::ProvisionAll() {
    StepOutcome bucket = admin_.CreateBucket(plan_.bucket);
    Logger::Info("Bucket " + plan_.bucket + ": " + OutcomeText(bucket), "Provision");

    StepOutcome user = admin_.CreateUser(plan_.access_key, plan_.secret_key);
    Logger::Info("User " + plan_.access_key + ": " + OutcomeText(user), "Provision");

    StepOutcome policy = admin_.CreatePolicy(plan_.policy_name, RenderBucketPolicy(plan_.bucket));
    Logger::Info("Policy " + plan_.policy_name + ": " + OutcomeText(policy), "Provision");

    StepOutcome attach = admin_.AttachPolicy(plan_.policy_name, plan_.access_key);
    Logger::Info("Policy " + plan_.policy_name + " on " + plan_.access_key + ": " +
                 (attach == StepOutcome::Created ? "attached" : "already attached"), "Provision");
}
