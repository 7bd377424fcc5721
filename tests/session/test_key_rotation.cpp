#include <gtest/gtest.h>
#include <sbus/session/key_rotation.h>
#include <sbus/crypto/openssl_provider.h>
#include <memory>

using namespace sbus::v1;
using namespace sbus::v1::session;

class KeyRotationTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{0});
        provider_ = crypto::make_openssl_provider().value();
        config_.interval = std::chrono::seconds(60);
        config_.max_operations = 3;
        config_.max_history = 2;
    }

    std::unique_ptr<KeyRotationManager> make(KeyRotationPolicy policy) {
        config_.policy = policy;
        return std::make_unique<KeyRotationManager>(config_, initial_, provider_, clock_);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    KeyRotationConfig config_;
    std::vector<uint8_t> initial_ = std::vector<uint8_t>(32, 0x0d);
};

TEST_F(KeyRotationTest, StartsWithInitialKey) {
    auto manager = make(KeyRotationPolicy::HYBRID);
    auto active = manager->get_active_key();
    EXPECT_EQ(active.key_id, 1u);
    EXPECT_EQ(active.key_material, initial_);
    EXPECT_TRUE(active.is_active);
    EXPECT_FALSE(manager->rotate_if_needed().value());
}

TEST_F(KeyRotationTest, TimeBasedIgnoresOperations) {
    auto manager = make(KeyRotationPolicy::TIME_BASED);
    for (int i = 0; i < 5; ++i) {
        manager->record_operation();
    }
    EXPECT_FALSE(manager->rotate_if_needed().value());

    clock_->advance(std::chrono::seconds(60));
    EXPECT_TRUE(manager->rotate_if_needed().value());
    EXPECT_EQ(manager->get_active_key().key_id, 2u);
}

TEST_F(KeyRotationTest, OperationBasedIgnoresTime) {
    auto manager = make(KeyRotationPolicy::OPERATION_BASED);
    clock_->advance(std::chrono::seconds(600));
    EXPECT_FALSE(manager->rotate_if_needed().value());

    for (int i = 0; i < 3; ++i) {
        manager->record_operation();
    }
    EXPECT_TRUE(manager->stats().needs_rotation);
    EXPECT_TRUE(manager->rotate_if_needed().value());

    auto active = manager->get_active_key();
    EXPECT_EQ(active.operation_count, 0u);
    EXPECT_EQ(active.key_material.size(), config_.key_length);
    EXPECT_NE(active.key_material, initial_);
}

TEST_F(KeyRotationTest, HybridRotatesOnEither) {
    auto manager = make(KeyRotationPolicy::HYBRID);
    clock_->advance(std::chrono::seconds(60));
    EXPECT_TRUE(manager->rotate_if_needed().value());

    for (int i = 0; i < 3; ++i) {
        manager->record_operation();
    }
    EXPECT_TRUE(manager->rotate_if_needed().value());
    EXPECT_EQ(manager->get_active_key().key_id, 3u);
}

TEST_F(KeyRotationTest, RetiredKeysStayRetrievable) {
    auto manager = make(KeyRotationPolicy::HYBRID);
    EXPECT_EQ(manager->force_rotation().value(), 2u);

    auto retired = manager->get_key_by_id(1);
    ASSERT_TRUE(retired.has_value());
    EXPECT_FALSE(retired->is_active);
    EXPECT_EQ(retired->key_material, initial_);
}

TEST_F(KeyRotationTest, HistoryIsBounded) {
    auto manager = make(KeyRotationPolicy::HYBRID);
    for (int i = 0; i < 3; ++i) {
        manager->force_rotation().value();
    }

    EXPECT_FALSE(manager->get_key_by_id(1).has_value());
    EXPECT_TRUE(manager->get_key_by_id(2).has_value());
    EXPECT_TRUE(manager->get_key_by_id(3).has_value());
    EXPECT_EQ(manager->stats().total_historical_keys, 2u);

    manager->clear_historical();
    EXPECT_FALSE(manager->get_key_by_id(2).has_value());
    EXPECT_TRUE(manager->get_key_by_id(4).has_value());
}

TEST_F(KeyRotationTest, StatsReportAge) {
    auto manager = make(KeyRotationPolicy::TIME_BASED);
    clock_->advance(std::chrono::seconds(42));
    manager->record_operation();

    auto stats = manager->stats();
    EXPECT_EQ(stats.active_key_id, 1u);
    EXPECT_EQ(stats.operations_with_current_key, 1u);
    EXPECT_EQ(stats.time_since_rotation_secs, 42u);
    EXPECT_FALSE(stats.needs_rotation);
}
