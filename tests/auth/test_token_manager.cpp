#include <gtest/gtest.h>
#include <sbus/auth/token_manager.h>
#include <sbus/crypto/openssl_provider.h>
#include <memory>
#include <string>

using namespace sbus::v1;
using namespace sbus::v1::auth;

class TokenManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{100000});
        provider_ = crypto::make_openssl_provider().value();
        manager_ = std::make_unique<TokenManager>(provider_, std::vector<uint8_t>(32, 0x5c), clock_);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::unique_ptr<TokenManager> manager_;
};

TEST_F(TokenManagerTest, GeneratedTokenValidatesForItsContext) {
    auto token = manager_->generate("kernel-loop", std::chrono::seconds(60));
    ASSERT_TRUE(token);
    EXPECT_EQ(token->find('='), std::string::npos);

    EXPECT_TRUE(manager_->validate("kernel-loop", *token));
    EXPECT_TRUE(manager_->validate_issued(*token));
}

TEST_F(TokenManagerTest, WrongContextIsRejected) {
    auto token = manager_->generate("kernel-loop", std::chrono::seconds(60)).value();
    EXPECT_EQ(manager_->validate("ai-loop", token).error(), SBusError::INVALID_TOKEN);
}

TEST_F(TokenManagerTest, MalformedTokenIsRejected) {
    EXPECT_EQ(manager_->validate("kernel-loop", "garbage!").error(), SBusError::INVALID_TOKEN);
    EXPECT_EQ(manager_->validate("kernel-loop", "AAAA").error(), SBusError::INVALID_TOKEN);
    EXPECT_EQ(manager_->validate_issued("AAAA").error(), SBusError::INVALID_TOKEN);
}

TEST_F(TokenManagerTest, TokenExpires) {
    auto token = manager_->generate("kernel-loop", std::chrono::seconds(10)).value();
    clock_->advance(std::chrono::seconds(9));
    EXPECT_TRUE(manager_->validate("kernel-loop", token));

    clock_->advance(std::chrono::seconds(1));
    EXPECT_EQ(manager_->validate("kernel-loop", token).error(), SBusError::TOKEN_EXPIRED);
}

TEST_F(TokenManagerTest, RevokedTokenIsRejected) {
    auto token = manager_->generate("kernel-loop", std::chrono::seconds(60)).value();
    manager_->revoke(token);
    manager_->revoke(token);
    EXPECT_EQ(manager_->validate("kernel-loop", token).error(), SBusError::TOKEN_REVOKED);
}

TEST_F(TokenManagerTest, RevocationOutlivesManyLaterRevocations) {
    auto first = manager_->generate("kernel-loop", std::chrono::seconds(3600)).value();
    manager_->revoke(first);

    for (int i = 0; i < 5000; ++i) {
        manager_->revoke(manager_->generate("bulk-" + std::to_string(i), std::chrono::seconds(3600)).value());
    }
    EXPECT_EQ(manager_->revoked_count(), 5001u);
    EXPECT_EQ(manager_->validate("kernel-loop", first).error(), SBusError::TOKEN_REVOKED);
}

TEST_F(TokenManagerTest, ExpiredRevocationsAreDropped) {
    auto brief = manager_->generate("kernel-loop", std::chrono::seconds(10)).value();
    auto lasting = manager_->generate("ai-loop", std::chrono::seconds(600)).value();
    manager_->revoke(brief);
    manager_->revoke(lasting);
    manager_->revoke("not a token");
    EXPECT_EQ(manager_->revoked_count(), 2u);

    clock_->advance(std::chrono::seconds(10));
    manager_->purge_expired();
    EXPECT_EQ(manager_->revoked_count(), 1u);
    EXPECT_EQ(manager_->validate("kernel-loop", brief).error(), SBusError::TOKEN_EXPIRED);
    EXPECT_EQ(manager_->validate("ai-loop", lasting).error(), SBusError::TOKEN_REVOKED);
}

TEST_F(TokenManagerTest, EmptyInputsAreRejected) {
    EXPECT_EQ(manager_->generate("", std::chrono::seconds(60)).error(), SBusError::INVALID_PARAMETER);

    TokenManager keyless(provider_, {}, clock_);
    EXPECT_EQ(keyless.generate("ctx", std::chrono::seconds(60)).error(),
              SBusError::INVALID_CONFIGURATION);
}

TEST_F(TokenManagerTest, PurgeDropsExpiredEntries) {
    manager_->generate("short", std::chrono::seconds(5)).value();
    manager_->generate("long", std::chrono::seconds(500)).value();
    EXPECT_EQ(manager_->list_tokens().size(), 2u);

    clock_->advance(std::chrono::seconds(6));
    EXPECT_EQ(manager_->purge_expired(), 1u);

    auto remaining = manager_->list_tokens();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].context, "long");
}

TEST_F(TokenManagerTest, DifferentMasterKeysDoNotCrossValidate) {
    TokenManager other(provider_, std::vector<uint8_t>(32, 0x3a), clock_);
    auto token = other.generate("kernel-loop", std::chrono::seconds(60)).value();
    EXPECT_EQ(manager_->validate("kernel-loop", token).error(), SBusError::INVALID_TOKEN);
}
