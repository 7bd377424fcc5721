#include <gtest/gtest.h>
#include <sbus/security/anomaly_detector.h>
#include <memory>

using namespace sbus::v1::security;
using namespace sbus::v1;

class AnomalyDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{0});

        ErrorReporter::ReportingConfig reporting;
        reporting.write_to_stderr = false;
        reporter_ = std::make_shared<ErrorReporter>(reporting, clock_);

        thresholds_.auth_failure_burst = 3;
        thresholds_.auth_failure_window = std::chrono::seconds{60};
        thresholds_.retention = std::chrono::seconds{600};
        thresholds_.max_history = 5;
        detector_ = std::make_unique<AnomalyDetector>(thresholds_, clock_, reporter_);
    }

    // Snapshot inside every threshold
    std::vector<DetectedAnomaly> healthy() {
        return detector_->check_metrics(0.01, 0.99, 20.0, 5, 0.95);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<ErrorReporter> reporter_;
    AnomalyThresholds thresholds_;
    std::unique_ptr<AnomalyDetector> detector_;
};

TEST_F(AnomalyDetectorTest, HealthyMetricsRaiseNothing) {
    EXPECT_TRUE(healthy().empty());
    EXPECT_EQ(detector_->stats().checks_with_anomalies, 0u);
}

TEST_F(AnomalyDetectorTest, EachThresholdIsChecked) {
    auto found = detector_->check_metrics(0.5, 0.5, 900.0, 80, 0.2);
    ASSERT_EQ(found.size(), 5u);
    EXPECT_EQ(found[0].type, AnomalyType::HIGH_ERROR_RATE);
    EXPECT_EQ(found[0].severity, AnomalySeverity::CRITICAL);
    EXPECT_EQ(found[1].type, AnomalyType::LOW_SUCCESS_RATE);
    EXPECT_EQ(found[2].type, AnomalyType::HIGH_LATENCY);
    EXPECT_EQ(found[3].type, AnomalyType::CONNECTION_SPIKE);
    EXPECT_EQ(found[4].type, AnomalyType::CACHE_MISS_SPIKE);

    auto stats = detector_->stats();
    EXPECT_EQ(stats.checks_with_anomalies, 1u);
    EXPECT_EQ(stats.total_anomalies, 5u);
    EXPECT_EQ(stats.critical_anomalies, 1u);
}

TEST_F(AnomalyDetectorTest, ThresholdsAreExclusive) {
    auto found = detector_->check_metrics(thresholds_.error_rate, thresholds_.success_rate,
                                          thresholds_.latency_ms, thresholds_.connection_spike,
                                          1.0 - thresholds_.cache_miss_rate);
    EXPECT_TRUE(found.empty());
}

TEST_F(AnomalyDetectorTest, HighSeverityGoesToSecurityLog) {
    detector_->check_metrics(0.5, 0.99, 20.0, 5, 0.95);
    EXPECT_EQ(reporter_->get_statistics().security_incidents, 1u);

    detector_->check_metrics(0.01, 0.99, 900.0, 5, 0.95);
    EXPECT_EQ(reporter_->get_statistics().security_incidents, 1u);
}

TEST_F(AnomalyDetectorTest, AuthFailureBurstPerSource) {
    EXPECT_FALSE(detector_->record_authorization_failure("node-a", "bad token"));
    EXPECT_FALSE(detector_->record_authorization_failure("node-b", "bad token"));
    EXPECT_FALSE(detector_->record_authorization_failure("node-a", "bad token"));

    auto burst = detector_->record_authorization_failure("node-a", "revoked token");
    ASSERT_TRUE(burst.has_value());
    EXPECT_EQ(burst->type, AnomalyType::AUTH_FAILURE_BURST);
    EXPECT_EQ(burst->source, "node-a");
    EXPECT_EQ(AnomalyDetector::remediation_for(burst->type), RemediationAction::BLACKLIST_SOURCE);

    // Window restarts after a burst
    EXPECT_FALSE(detector_->record_authorization_failure("node-a", "bad token"));

    auto stats = detector_->stats();
    EXPECT_EQ(stats.authorization_failures, 5u);
    EXPECT_EQ(stats.auth_failure_bursts, 1u);
}

TEST_F(AnomalyDetectorTest, AuthFailuresOutsideWindowDoNotCount) {
    detector_->record_authorization_failure("node-a", "x");
    detector_->record_authorization_failure("node-a", "x");
    clock_->advance(std::chrono::seconds{60});
    EXPECT_FALSE(detector_->record_authorization_failure("node-a", "x"));
}

TEST_F(AnomalyDetectorTest, RemediationTable) {
    EXPECT_EQ(AnomalyDetector::remediation_for(AnomalyType::HIGH_ERROR_RATE), RemediationAction::CLEAR_CACHE);
    EXPECT_EQ(AnomalyDetector::remediation_for(AnomalyType::LOW_SUCCESS_RATE),
              RemediationAction::INCREASE_BREAKER_THRESHOLD);
    EXPECT_EQ(AnomalyDetector::remediation_for(AnomalyType::HIGH_LATENCY), RemediationAction::REDUCE_MAX_CONCURRENCY);
    EXPECT_EQ(AnomalyDetector::remediation_for(AnomalyType::CONNECTION_SPIKE), RemediationAction::ENABLE_RATE_LIMITING);
    EXPECT_EQ(AnomalyDetector::remediation_for(AnomalyType::CACHE_MISS_SPIKE), RemediationAction::REBUILD_CACHE);
}

TEST_F(AnomalyDetectorTest, RemediationIsTracked) {
    auto found = detector_->check_metrics(0.5, 0.99, 20.0, 5, 0.95);
    ASSERT_EQ(found.size(), 1u);

    EXPECT_EQ(detector_->apply_auto_remediation(found[0]), RemediationAction::CLEAR_CACHE);
    ASSERT_TRUE(detector_->mark_remediated(found[0].id));
    EXPECT_TRUE(detector_->recent_anomalies(1)[0].remediation_applied);
    EXPECT_EQ(detector_->stats().remediations_triggered, 1u);
    EXPECT_EQ(detector_->mark_remediated(999).error(), SBusError::KEY_NOT_FOUND);
}

TEST_F(AnomalyDetectorTest, HistoryIsBoundedAndAged) {
    for (int i = 0; i < 4; ++i) {
        detector_->check_metrics(0.5, 0.5, 20.0, 5, 0.95);
    }
    EXPECT_EQ(detector_->anomaly_count(), thresholds_.max_history);

    auto recent = detector_->recent_anomalies(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_LT(recent[0].id, recent[1].id);

    clock_->advance(std::chrono::seconds{600});
    EXPECT_EQ(detector_->cleanup_old(), thresholds_.max_history);
    EXPECT_EQ(detector_->anomaly_count(), 0u);
}

TEST_F(AnomalyDetectorTest, SettingsCanChange) {
    AnomalyThresholds relaxed = thresholds_;
    relaxed.latency_ms = 2000.0;
    detector_->set_thresholds(relaxed);
    EXPECT_TRUE(detector_->check_metrics(0.01, 0.99, 900.0, 5, 0.95).empty());

    EXPECT_TRUE(detector_->is_auto_remediation_enabled());
    detector_->set_auto_remediation(false);
    EXPECT_FALSE(detector_->is_auto_remediation_enabled());
}
