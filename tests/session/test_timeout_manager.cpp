#include <gtest/gtest.h>
#include <sbus/session/timeout_manager.h>
#include <algorithm>
#include <memory>

using namespace sbus::v1;
using namespace sbus::v1::session;

class TimeoutManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{0});
        config_.handshake = std::chrono::milliseconds(500);
        config_.pending_message = std::chrono::milliseconds(100);
        config_.max_retries = 2;
        manager_ = std::make_unique<TimeoutManager>(config_, clock_);
    }

    std::shared_ptr<ManualClock> clock_;
    TimeoutConfig config_;
    std::unique_ptr<TimeoutManager> manager_;
};

TEST_F(TimeoutManagerTest, ExpiresStrictlyAfterDuration) {
    manager_->register_timeout("hs", TimeoutType::HANDSHAKE);

    clock_->advance(std::chrono::milliseconds(500));
    EXPECT_FALSE(manager_->has_timed_out("hs"));

    clock_->advance(std::chrono::milliseconds(1));
    EXPECT_TRUE(manager_->has_timed_out("hs"));
    EXPECT_FALSE(manager_->has_timed_out("unknown"));
}

TEST_F(TimeoutManagerTest, DurationsFollowType) {
    EXPECT_EQ(manager_->duration(TimeoutType::HANDSHAKE), std::chrono::milliseconds(500));
    EXPECT_EQ(manager_->duration(TimeoutType::PENDING_MESSAGE), std::chrono::milliseconds(100));
    EXPECT_EQ(manager_->duration(TimeoutType::SESSION), config_.session);
}

TEST_F(TimeoutManagerTest, ReRegisteringRestartsDeadline) {
    manager_->register_timeout("hs", TimeoutType::HANDSHAKE);
    clock_->advance(std::chrono::milliseconds(400));
    manager_->register_timeout("hs", TimeoutType::HANDSHAKE);
    clock_->advance(std::chrono::milliseconds(400));

    EXPECT_FALSE(manager_->has_timed_out("hs"));
    EXPECT_EQ(manager_->active_count(), 1u);
}

TEST_F(TimeoutManagerTest, RetryLifecycle) {
    manager_->register_timeout("msg", TimeoutType::PENDING_MESSAGE);
    manager_->register_timeout("hs", TimeoutType::HANDSHAKE);
    clock_->advance(std::chrono::milliseconds(101));

    auto candidates = manager_->get_retry_candidates();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0], "msg");

    // Expired with retries left: not collected yet
    EXPECT_TRUE(manager_->cleanup_expired().empty());

    EXPECT_TRUE(manager_->increment_retry("msg"));
    EXPECT_TRUE(manager_->increment_retry("msg"));
    EXPECT_FALSE(manager_->increment_retry("missing"));
    EXPECT_TRUE(manager_->get_retry_candidates().empty());

    auto removed = manager_->cleanup_expired();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "msg");
    EXPECT_EQ(manager_->active_count(), 1u);

    EXPECT_EQ(manager_->take_expired(), removed);
    EXPECT_TRUE(manager_->take_expired().empty());
}

TEST_F(TimeoutManagerTest, RemoveCancels) {
    manager_->register_timeout("hs", TimeoutType::HANDSHAKE);
    manager_->remove_timeout("hs");
    clock_->advance(std::chrono::seconds(10));
    EXPECT_FALSE(manager_->has_timed_out("hs"));
    EXPECT_EQ(manager_->active_count(), 0u);
}
