#include <gtest/gtest.h>
#include <sbus/auth/component_token.h>
#include <sbus/crypto/openssl_provider.h>
#include <memory>
#include <string>

using namespace sbus::v1;
using namespace sbus::v1::auth;

class ComponentTokenTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{50000});
        provider_ = crypto::make_openssl_provider().value();
        manager_ = std::make_unique<ComponentTokenManager>(provider_, std::vector<uint8_t>(32, 0x42), clock_);
    }

    ComponentToken issue(ComponentType component = ComponentType::CPU) {
        return manager_->issue_session_token(component, 1, std::chrono::seconds(300)).value();
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::unique_ptr<ComponentTokenManager> manager_;
};

TEST_F(ComponentTokenTest, IssuedTokenValidates) {
    auto token = issue();
    EXPECT_EQ(token.token_id.rfind("cpu:1:", 0), 0u);
    EXPECT_EQ(token.expires_at - token.created_at, Timestamp{300000});
    EXPECT_FALSE(token.public_key.empty());

    EXPECT_TRUE(manager_->validate_token(token.token_id, token.token_value));

    auto looked_up = manager_->validate_token_value(token.token_value);
    ASSERT_TRUE(looked_up);
    EXPECT_EQ(looked_up->token_id, token.token_id);
    EXPECT_EQ(manager_->active_token_count(), 1u);
}

TEST_F(ComponentTokenTest, WrongValueOrIdIsInvalid) {
    auto token = issue();
    auto other = issue(ComponentType::GPU);

    EXPECT_EQ(manager_->validate_token(token.token_id, other.token_value).error(), SBusError::INVALID_TOKEN);
    EXPECT_EQ(manager_->validate_token("gpu:9:0:0", token.token_value).error(), SBusError::INVALID_TOKEN);
    EXPECT_EQ(manager_->validate_token("", "").error(), SBusError::INVALID_TOKEN);
    EXPECT_EQ(manager_->validate_token_value("unknown").error(), SBusError::INVALID_TOKEN);
}

TEST_F(ComponentTokenTest, SensitiveComponentsUseSha512) {
    EXPECT_EQ(ComponentTokenManager::algorithm_for(ComponentType::DISPLAY), SignatureAlgorithm::HMAC_SHA512);
    EXPECT_EQ(ComponentTokenManager::algorithm_for(ComponentType::SECURITY_DRIVER), SignatureAlgorithm::HMAC_SHA512);
    EXPECT_EQ(ComponentTokenManager::algorithm_for(ComponentType::KERNEL), SignatureAlgorithm::HMAC_SHA256);
    EXPECT_EQ(issue(ComponentType::AUDIO).algorithm, SignatureAlgorithm::HMAC_SHA512);
}

TEST_F(ComponentTokenTest, SignedActionVerifies) {
    auto token = issue(ComponentType::DISPLAY);
    auto signature = manager_->sign_action(token.token_id, "set_brightness=80", "n-1");
    ASSERT_TRUE(signature);
    EXPECT_TRUE(manager_->verify_signature(*signature));
}

TEST_F(ComponentTokenTest, TamperedActionFailsVerification) {
    auto token = issue();
    auto signature = manager_->sign_action(token.token_id, "throttle=50", "n-2").value();

    auto altered_message = signature;
    altered_message.message = "throttle=0";
    EXPECT_EQ(manager_->verify_signature(altered_message).error(), SBusError::SIGNATURE_MISMATCH);

    auto altered_nonce = signature;
    altered_nonce.nonce = "n-3";
    EXPECT_EQ(manager_->verify_signature(altered_nonce).error(), SBusError::SIGNATURE_MISMATCH);

    auto malformed = signature;
    malformed.signature = "***";
    EXPECT_EQ(manager_->verify_signature(malformed).error(), SBusError::SIGNATURE_MISMATCH);
}

TEST_F(ComponentTokenTest, SignActionRejectsEmptyInput) {
    auto token = issue();
    EXPECT_EQ(manager_->sign_action(token.token_id, "", "n").error(), SBusError::INVALID_PARAMETER);
    EXPECT_EQ(manager_->sign_action(token.token_id, "m", "").error(), SBusError::INVALID_PARAMETER);
    EXPECT_EQ(manager_->sign_action("missing", "m", "n").error(), SBusError::INVALID_TOKEN);
}

TEST_F(ComponentTokenTest, RevokedTokenIsRejected) {
    auto token = issue();
    ASSERT_TRUE(manager_->revoke_token(token.token_id));

    EXPECT_EQ(manager_->validate_token(token.token_id, token.token_value).error(), SBusError::TOKEN_REVOKED);
    EXPECT_FALSE(manager_->validate_token_value(token.token_value));
    EXPECT_EQ(manager_->active_token_count(), 0u);
    EXPECT_EQ(manager_->revoke_token("").error(), SBusError::INVALID_PARAMETER);
}

TEST_F(ComponentTokenTest, RotationReplacesToken) {
    auto token = issue(ComponentType::RAM);
    clock_->advance(std::chrono::milliseconds(5));

    auto rotated = manager_->rotate_token(token.token_id, std::chrono::seconds(60));
    ASSERT_TRUE(rotated);
    EXPECT_NE(rotated->token_id, token.token_id);
    EXPECT_EQ(rotated->component, ComponentType::RAM);

    EXPECT_EQ(manager_->validate_token(token.token_id, token.token_value).error(), SBusError::TOKEN_REVOKED);
    EXPECT_TRUE(manager_->validate_token(rotated->token_id, rotated->token_value));
    EXPECT_EQ(manager_->rotate_token("missing", std::chrono::seconds(60)).error(), SBusError::INVALID_TOKEN);
}

TEST_F(ComponentTokenTest, ExpiredTokensFailAndPurge) {
    auto token = manager_->issue_session_token(ComponentType::THERMAL, 2, std::chrono::seconds(10)).value();
    issue();

    clock_->advance(std::chrono::seconds(10));
    EXPECT_EQ(manager_->validate_token(token.token_id, token.token_value).error(), SBusError::TOKEN_EXPIRED);
    EXPECT_EQ(manager_->sign_action(token.token_id, "m", "n").error(), SBusError::TOKEN_EXPIRED);

    EXPECT_EQ(manager_->purge_expired(), 1u);
    EXPECT_EQ(manager_->active_token_count(), 1u);
}
