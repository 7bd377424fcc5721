#include <gtest/gtest.h>
#include <sbus/crypto/session_keys.h>
#include <sbus/crypto/openssl_provider.h>
#include <memory>
#include <vector>

using namespace sbus::v1;
using namespace sbus::v1::crypto;

class SessionKeysTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = make_openssl_provider().value();
        master_ = std::vector<uint8_t>(32, 0x61);
        client_random_ = std::vector<uint8_t>(RANDOM_LENGTH, 0x01);
        server_random_ = std::vector<uint8_t>(RANDOM_LENGTH, 0x02);
    }

    std::shared_ptr<CryptoProvider> provider_;
    std::vector<uint8_t> master_;
    std::vector<uint8_t> client_random_;
    std::vector<uint8_t> server_random_;
};

TEST_F(SessionKeysTest, DerivationIsDeterministic) {
    auto first = SessionKeys::derive(*provider_, master_, client_random_, server_random_).value();
    auto second = SessionKeys::derive(*provider_, master_, client_random_, server_random_).value();

    EXPECT_EQ(first.client_write_key, second.client_write_key);
    EXPECT_EQ(first.server_mac_key, second.server_mac_key);

    EXPECT_EQ(first.client_write_key.size(), SessionKeys::WRITE_KEY_LENGTH);
    EXPECT_EQ(first.client_write_iv.size(), SessionKeys::IV_LENGTH);
    EXPECT_EQ(first.client_mac_key.size(), SessionKeys::MAC_KEY_LENGTH);
}

TEST_F(SessionKeysTest, DirectionsUseDistinctKeys) {
    auto keys = SessionKeys::derive(*provider_, master_, client_random_, server_random_).value();
    EXPECT_NE(keys.client_write_key, keys.server_write_key);
    EXPECT_NE(keys.client_write_iv, keys.server_write_iv);
    EXPECT_NE(keys.client_mac_key, keys.server_mac_key);

    EXPECT_EQ(&keys.write_key(ConnectionRole::CLIENT), &keys.client_write_key);
    EXPECT_EQ(&keys.mac_key(ConnectionRole::SERVER), &keys.server_mac_key);
}

TEST_F(SessionKeysTest, DifferentRandomsDifferentKeys) {
    auto keys = SessionKeys::derive(*provider_, master_, client_random_, server_random_).value();
    std::vector<uint8_t> other_server(RANDOM_LENGTH, 0x03);
    auto other = SessionKeys::derive(*provider_, master_, client_random_, other_server).value();
    EXPECT_NE(keys.client_write_key, other.client_write_key);
}

TEST_F(SessionKeysTest, RejectsBadInputs) {
    EXPECT_EQ(SessionKeys::derive(*provider_, {}, client_random_, server_random_).error(),
              SBusError::INVALID_PARAMETER);
    EXPECT_EQ(SessionKeys::derive(*provider_, master_, std::vector<uint8_t>(16, 1), server_random_).error(),
              SBusError::INVALID_PARAMETER);
    EXPECT_EQ(SessionKeys::derive(*provider_, master_, std::vector<uint8_t>(RANDOM_LENGTH, 0), server_random_).error(),
              SBusError::INVALID_PARAMETER);
    EXPECT_EQ(SessionKeys::derive(*provider_, master_, client_random_, client_random_).error(),
              SBusError::INVALID_PARAMETER);
}

TEST_F(SessionKeysTest, NextGenerationChains) {
    std::vector<uint8_t> key(16, 0x44);
    auto g1 = SessionKeys::next_generation(*provider_, key).value();
    auto g2 = SessionKeys::next_generation(*provider_, g1).value();
    EXPECT_EQ(g1.size(), key.size());
    EXPECT_NE(g1, key);
    EXPECT_NE(g2, g1);
    EXPECT_EQ(SessionKeys::next_generation(*provider_, key).value(), g1);
    EXPECT_EQ(SessionKeys::next_generation(*provider_, {}).error(), SBusError::INVALID_PARAMETER);
}

TEST_F(SessionKeysTest, ResumptionSecretBindsBothRandoms) {
    auto secret = SessionKeys::resumption_secret(*provider_, master_, client_random_, server_random_).value();
    auto swapped = SessionKeys::resumption_secret(*provider_, master_, server_random_, client_random_).value();
    EXPECT_EQ(secret.size(), 32u);
    EXPECT_NE(secret, swapped);
    EXPECT_EQ(SessionKeys::resumption_secret(*provider_, {}, client_random_, server_random_).error(),
              SBusError::INVALID_PARAMETER);
}

TEST_F(SessionKeysTest, ClearEmptiesEveryKey) {
    auto keys = SessionKeys::derive(*provider_, master_, client_random_, server_random_).value();
    ASSERT_FALSE(keys.empty());
    keys.clear();
    EXPECT_TRUE(keys.empty());
    EXPECT_TRUE(keys.server_mac_key.empty());
}

TEST(KeyMaterialRegistryTest, RefusesReusedPair) {
    KeyMaterialRegistry registry;
    std::vector<uint8_t> cr(RANDOM_LENGTH, 0x0a);
    std::vector<uint8_t> sr(RANDOM_LENGTH, 0x0b);

    EXPECT_TRUE(registry.register_pair(ConnectionRole::CLIENT, cr, sr).is_success());
    EXPECT_TRUE(registry.contains(ConnectionRole::CLIENT, cr, sr));
    EXPECT_EQ(registry.register_pair(ConnectionRole::CLIENT, cr, sr).error(), SBusError::KEY_MATERIAL_REUSED);

    EXPECT_TRUE(registry.register_pair(ConnectionRole::CLIENT, sr, cr).is_success());
    EXPECT_EQ(registry.size(), 2u);

    registry.clear();
    EXPECT_FALSE(registry.contains(ConnectionRole::CLIENT, cr, sr));
}

TEST(KeyMaterialRegistryTest, BothEndsOfOneSessionMayRegister) {
    KeyMaterialRegistry registry;
    std::vector<uint8_t> cr(RANDOM_LENGTH, 0x0a);
    std::vector<uint8_t> sr(RANDOM_LENGTH, 0x0b);

    EXPECT_TRUE(registry.register_pair(ConnectionRole::CLIENT, cr, sr).is_success());
    EXPECT_FALSE(registry.contains(ConnectionRole::SERVER, cr, sr));
    EXPECT_TRUE(registry.register_pair(ConnectionRole::SERVER, cr, sr).is_success());
    EXPECT_EQ(registry.register_pair(ConnectionRole::SERVER, cr, sr).error(), SBusError::KEY_MATERIAL_REUSED);
}
