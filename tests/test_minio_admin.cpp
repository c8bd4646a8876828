#include <gtest/gtest.h>
#include <memory>
#include "admin_payload.hpp"
#include "minio_admin.hpp"
#include "mock_s3_server.hpp"
#include "provisioner.hpp"

class MinioAdminTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<MockS3Server>("existing", "minioadmin", "minioadmin-secret");
        config_.s3_endpoint = server_->Endpoint();
        config_.s3_bucket = "uploads";
        config_.s3_access_key = "app";
        config_.s3_secret_key = "app-secret";
        config_.admin_access_key = "minioadmin";
        config_.admin_secret_key = "minioadmin-secret";
        config_.admin_retries = 3;
        config_.admin_interval_ms = 1;
        admin_ = std::make_unique<MinioAdminClient>(config_);
    }

    void TearDown() override {
        admin_.reset();
        server_.reset();
    }

    Config::ServerConfig config_;
    std::unique_ptr<MockS3Server> server_;
    std::unique_ptr<MinioAdminClient> admin_;
};

TEST_F(MinioAdminTest, HandshakeSucceedsWithRootCredentials) {
    EXPECT_TRUE(admin_->Handshake());
    EXPECT_EQ(server_->signature_failures.load(), 0);
}

TEST_F(MinioAdminTest, HandshakeFailsWithWrongCredentials) {
    config_.admin_secret_key = "guess";
    MinioAdminClient wrong(config_);
    EXPECT_FALSE(wrong.Handshake());
}

TEST_F(MinioAdminTest, CreateBucketIsRepeatSafe) {
    EXPECT_EQ(admin_->CreateBucket("uploads"), StepOutcome::Created);
    EXPECT_EQ(admin_->CreateBucket("uploads"), StepOutcome::AlreadyExists);
    EXPECT_EQ(admin_->CreateBucket("existing"), StepOutcome::AlreadyExists);
    EXPECT_EQ(server_->buckets_.count("uploads"), 1u);
}

TEST_F(MinioAdminTest, CreateUserSendsSealedSecret) {
    EXPECT_EQ(admin_->CreateUser("app", "app-secret"), StepOutcome::Created);
    ASSERT_EQ(server_->user_bodies.count("app"), 1u);

    const std::string& body = server_->user_bodies["app"];
    ASSERT_GT(body.size(), kAdminSaltSize + 1 + kAdminNonceSize + kAdminTagSize);
    EXPECT_EQ(static_cast<unsigned char>(body[kAdminSaltSize]), kAdminPbkdf2AesGcm);
    EXPECT_EQ(body.find("app-secret"), std::string::npos);

    EXPECT_EQ(admin_->CreateUser("app", "app-secret"), StepOutcome::AlreadyExists);
}

TEST_F(MinioAdminTest, CreatePolicyStoresDocument) {
    std::string document = RenderBucketPolicy("uploads");
    EXPECT_EQ(admin_->CreatePolicy("app-rw", document), StepOutcome::Created);
    EXPECT_EQ(server_->policies.at("app-rw"), document);
    EXPECT_EQ(admin_->CreatePolicy("app-rw", document), StepOutcome::AlreadyExists);
}

TEST_F(MinioAdminTest, AttachPolicyReportsExistingAttachment) {
    admin_->CreateUser("app", "app-secret");
    admin_->CreatePolicy("app-rw", RenderBucketPolicy("uploads"));

    EXPECT_EQ(admin_->AttachPolicy("app-rw", "app"), StepOutcome::Created);
    EXPECT_EQ(server_->users.at("app"), "app-rw");
    EXPECT_EQ(admin_->AttachPolicy("app-rw", "app"), StepOutcome::AlreadyExists);
}

TEST_F(MinioAdminTest, AttachToUnknownUserFails) {
    admin_->CreatePolicy("app-rw", RenderBucketPolicy("uploads"));
    try {
        admin_->AttachPolicy("app-rw", "nobody");
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.Kind(), StoreErrorKind::NotFound);
    }
}

TEST_F(MinioAdminTest, ProvisionerRunsTwiceAgainstTheSameStore) {
    Provisioner first(*admin_, PlanFromConfig(config_));
    ASSERT_EQ(first.Run(), ProvisionState::Done) << first.FailureReason();

    EXPECT_EQ(server_->buckets_.count("uploads"), 1u);
    EXPECT_EQ(server_->users.at("app"), "app-rw");
    EXPECT_EQ(server_->policies.at("app-rw"), RenderBucketPolicy("uploads"));

    Provisioner second(*admin_, PlanFromConfig(config_));
    EXPECT_EQ(second.Run(), ProvisionState::Done) << second.FailureReason();
    EXPECT_EQ(server_->buckets_.size(), 2u);
    EXPECT_EQ(server_->users.size(), 1u);
    EXPECT_EQ(server_->signature_failures.load(), 0);
}

TEST_F(MinioAdminTest, ProvisionerFailsWhenAdminRejectsCredentials) {
    config_.admin_secret_key = "guess";
    MinioAdminClient wrong(config_);
    Provisioner provisioner(wrong, PlanFromConfig(config_), [](std::chrono::milliseconds) {});

    EXPECT_EQ(provisioner.Run(), ProvisionState::Failed);
    EXPECT_TRUE(server_->buckets_.count("uploads") == 0);
}
