#include <gtest/gtest.h>

#include <sbus/monitoring/metrics.h>

using namespace sbus::v1::monitoring;
using namespace sbus::v1;

class MetricsCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{1000});
        metrics_ = std::make_unique<MetricsCollector>(clock_);
    }

    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<MetricsCollector> metrics_;
};

TEST_F(MetricsCollectorTest, StartsHealthy) {
    auto snap = metrics_->snapshot();
    EXPECT_EQ(snap.health_score, 100);
    EXPECT_EQ(snap.handshakes_completed, 0u);
    EXPECT_DOUBLE_EQ(snap.average_latency_ms, 0.0);
    EXPECT_EQ(snap.taken_at, Timestamp{1000});
}

TEST_F(MetricsCollectorTest, CountersAccumulate) {
    metrics_->record_handshake_success();
    metrics_->record_handshake_success();
    metrics_->record_resumption();
    metrics_->record_encryption(100);
    metrics_->record_encryption(28);
    metrics_->record_decryption(64);
    metrics_->record_rejection();
    metrics_->set_active_sessions(3);

    auto snap = metrics_->snapshot();
    EXPECT_EQ(snap.handshakes_completed, 2u);
    EXPECT_EQ(snap.resumptions, 1u);
    EXPECT_EQ(snap.messages_encrypted, 2u);
    EXPECT_EQ(snap.bytes_encrypted, 128u);
    EXPECT_EQ(snap.messages_decrypted, 1u);
    EXPECT_EQ(snap.bytes_decrypted, 64u);
    EXPECT_EQ(snap.messages_rejected, 1u);
    EXPECT_EQ(snap.active_sessions, 3u);
}

TEST_F(MetricsCollectorTest, AverageLatency) {
    metrics_->record_latency(std::chrono::milliseconds(10));
    metrics_->record_latency(std::chrono::milliseconds(30));
    metrics_->record_latency(std::chrono::milliseconds(-5));
    EXPECT_DOUBLE_EQ(metrics_->average_latency_ms(), 20.0);
}

TEST_F(MetricsCollectorTest, HealthScorePenalties) {
    metrics_->record_handshake_failure();
    metrics_->record_timeout();
    metrics_->record_timeout();
    metrics_->record_security_incident();
    EXPECT_EQ(metrics_->health_score(), 96);
}

TEST_F(MetricsCollectorTest, HealthScorePenaltiesAreCapped) {
    for (int i = 0; i < 80; ++i) {
        metrics_->record_handshake_failure();
    }
    EXPECT_EQ(metrics_->health_score(), 50);

    for (int i = 0; i < 40; ++i) {
        metrics_->record_timeout();
    }
    EXPECT_EQ(metrics_->health_score(), 20);

    for (int i = 0; i < 25; ++i) {
        metrics_->record_security_incident();
    }
    EXPECT_EQ(metrics_->health_score(), 0);
}

TEST_F(MetricsCollectorTest, HistoryIsBounded) {
    for (size_t i = 0; i < MetricsCollector::MAX_HISTORY + 5; ++i) {
        metrics_->record_handshake_success();
        clock_->advance(std::chrono::milliseconds(10));
        metrics_->store_snapshot();
    }

    auto history = metrics_->history();
    ASSERT_EQ(history.size(), MetricsCollector::MAX_HISTORY);
    EXPECT_EQ(history.front().handshakes_completed, 6u);
    EXPECT_EQ(history.back().handshakes_completed, MetricsCollector::MAX_HISTORY + 5);
    EXPECT_LT(history.front().taken_at, history.back().taken_at);
}

TEST_F(MetricsCollectorTest, ResetClearsCountersAndHistory) {
    metrics_->record_handshake_failure();
    metrics_->record_encryption(10);
    metrics_->record_latency(std::chrono::milliseconds(5));
    metrics_->store_snapshot();

    metrics_->reset();
    auto snap = metrics_->snapshot();
    EXPECT_EQ(snap.handshakes_failed, 0u);
    EXPECT_EQ(snap.bytes_encrypted, 0u);
    EXPECT_EQ(snap.health_score, 100);
    EXPECT_DOUBLE_EQ(snap.average_latency_ms, 0.0);
    EXPECT_TRUE(metrics_->history().empty());
}
