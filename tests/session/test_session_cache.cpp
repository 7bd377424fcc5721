#include <gtest/gtest.h>
#include <sbus/session/session_cache.h>
#include <memory>

using namespace sbus::v1;
using namespace sbus::v1::session;

namespace {
const uint16_t SUITE = static_cast<uint16_t>(CipherSuite::RSA_WITH_AES_128_CBC_SHA256);
}

class SessionCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{0});
        config_.ttl = std::chrono::seconds(60);
        config_.capacity = 3;
        cache_ = std::make_unique<SessionCache>(config_, clock_);
    }

    static std::vector<uint8_t> id(uint8_t n) { return std::vector<uint8_t>(16, n); }

    std::shared_ptr<ManualClock> clock_;
    SessionCacheConfig config_;
    std::unique_ptr<SessionCache> cache_;
    std::vector<uint8_t> secret_ = std::vector<uint8_t>(48, 0x77);
};

TEST_F(SessionCacheTest, StoreAndResume) {
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(1), secret_, SUITE));
    EXPECT_TRUE(cache_->has_valid_session("ai.bus", id(1)));

    auto cached = cache_->get_session("ai.bus", id(1));
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->master_secret, secret_);
    EXPECT_EQ(cached->cipher_suite, SUITE);
    EXPECT_EQ(cached->resume_count, 1u);

    EXPECT_EQ(cache_->stats().total_resumptions, 1u);
}

TEST_F(SessionCacheTest, KeyedByHostnameAndId) {
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(1), secret_, SUITE));
    EXPECT_FALSE(cache_->get_session("kernel.bus", id(1)).has_value());
    EXPECT_FALSE(cache_->get_session("ai.bus", id(2)).has_value());
}

TEST_F(SessionCacheTest, RejectsInvalidInput) {
    EXPECT_EQ(cache_->cache_session("", id(1), secret_, SUITE).error(), SBusError::INVALID_PARAMETER);
    EXPECT_EQ(cache_->cache_session("ai.bus", {}, secret_, SUITE).error(), SBusError::INVALID_PARAMETER);
    EXPECT_EQ(cache_->cache_session("ai.bus", id(1), {}, SUITE).error(), SBusError::INVALID_PARAMETER);
    EXPECT_EQ(cache_->cache_session("ai.bus", id(1), secret_, 0x1301).error(), SBusError::INVALID_PARAMETER);
}

TEST_F(SessionCacheTest, ExpiredSessionIsNeverReturned) {
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(1), secret_, SUITE));

    clock_->advance(std::chrono::milliseconds(59999));
    EXPECT_TRUE(cache_->has_valid_session("ai.bus", id(1)));

    clock_->advance(std::chrono::milliseconds(1));
    EXPECT_FALSE(cache_->has_valid_session("ai.bus", id(1)));
    EXPECT_FALSE(cache_->get_session("ai.bus", id(1)).has_value());
    EXPECT_EQ(cache_->stats().total_sessions, 0u);
}

TEST_F(SessionCacheTest, EvictsLeastRecentlyUsed) {
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(1), secret_, SUITE));
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(2), secret_, SUITE));
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(3), secret_, SUITE));

    // Touch 1 so that 2 is the oldest
    ASSERT_TRUE(cache_->get_session("ai.bus", id(1)).has_value());
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(4), secret_, SUITE));

    EXPECT_TRUE(cache_->has_valid_session("ai.bus", id(1)));
    EXPECT_FALSE(cache_->has_valid_session("ai.bus", id(2)));
    EXPECT_TRUE(cache_->has_valid_session("ai.bus", id(4)));

    auto stats = cache_->stats();
    EXPECT_EQ(stats.total_sessions, 3u);
    EXPECT_EQ(stats.evictions, 1u);
}

TEST_F(SessionCacheTest, ReplacingAnEntryDoesNotEvict) {
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(1), secret_, SUITE));
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(1), std::vector<uint8_t>(48, 0x01), SUITE));

    EXPECT_EQ(cache_->stats().total_sessions, 1u);
    EXPECT_EQ(cache_->get_session("ai.bus", id(1))->master_secret, std::vector<uint8_t>(48, 0x01));
}

TEST_F(SessionCacheTest, CleanupAndRemove) {
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(1), secret_, SUITE));
    clock_->advance(std::chrono::seconds(30));
    ASSERT_TRUE(cache_->cache_session("ai.bus", id(2), secret_, SUITE));
    clock_->advance(std::chrono::seconds(31));

    EXPECT_EQ(cache_->cleanup_expired(), 1u);
    EXPECT_TRUE(cache_->remove_session("ai.bus", id(2)));
    EXPECT_FALSE(cache_->remove_session("ai.bus", id(2)));
    EXPECT_EQ(cache_->stats().total_sessions, 0u);
}
