#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>
#include <sbus/error_reporter.h>

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sbus {
namespace v1 {
namespace security {

enum class AnomalyType : uint8_t {
    HIGH_ERROR_RATE,
    LOW_SUCCESS_RATE,
    HIGH_LATENCY,
    CONNECTION_SPIKE,
    CACHE_MISS_SPIKE,
    AUTH_FAILURE_BURST
};

enum class AnomalySeverity : uint8_t {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class RemediationAction : uint8_t {
    CLEAR_CACHE,
    INCREASE_BREAKER_THRESHOLD,
    REDUCE_MAX_CONCURRENCY,
    ENABLE_RATE_LIMITING,
    REBUILD_CACHE,
    BLACKLIST_SOURCE,
    LOG_AND_ALERT
};

SBUS_API std::string to_string(AnomalyType type);
SBUS_API std::string to_string(AnomalySeverity severity);
SBUS_API std::string to_string(RemediationAction action);

struct DetectedAnomaly {
    uint64_t id = 0;
    AnomalyType type = AnomalyType::HIGH_ERROR_RATE;
    AnomalySeverity severity = AnomalySeverity::LOW;
    Timestamp detected_at{0};
    std::string details;
    // Offending identity, empty for aggregate metrics
    std::string source;
    bool remediation_applied = false;
};

struct AnomalyStats {
    uint64_t checks_with_anomalies = 0;
    uint64_t total_anomalies = 0;
    uint64_t critical_anomalies = 0;
    uint64_t authorization_failures = 0;
    uint64_t auth_failure_bursts = 0;
    uint64_t remediations_triggered = 0;
};

/**
 * Passive traffic-pattern monitor.
 *
 * check_metrics() compares one snapshot of aggregate metrics against the
 * configured thresholds. record_authorization_failure() tracks failures per
 * source over a sliding window and flags a burst once the count reaches
 * auth_failure_burst. Detected anomalies are kept in a bounded history.
 */
class SBUS_API AnomalyDetector {
public:
    AnomalyDetector(const AnomalyThresholds& thresholds,
                    std::shared_ptr<Clock> clock,
                    std::shared_ptr<ErrorReporter> reporter = nullptr);

    AnomalyDetector(const AnomalyDetector&) = delete;
    AnomalyDetector& operator=(const AnomalyDetector&) = delete;

    std::vector<DetectedAnomaly> check_metrics(double error_rate,
                                               double success_rate,
                                               double avg_latency_ms,
                                               uint64_t connection_count,
                                               double cache_hit_rate);

    /**
     * Count one authorization failure from source.
     * @return The burst anomaly when this failure completes a burst
     */
    std::optional<DetectedAnomaly> record_authorization_failure(const std::string& source,
                                                                const std::string& reason);

    static RemediationAction remediation_for(AnomalyType type);
    static AnomalySeverity severity_of(AnomalyType type);

    // Counts the remediation in the statistics
    RemediationAction apply_auto_remediation(const DetectedAnomaly& anomaly);

    // KEY_NOT_FOUND if the anomaly is no longer in the history
    Result<void> mark_remediated(uint64_t anomaly_id);

    // Newest last
    std::vector<DetectedAnomaly> recent_anomalies(size_t limit) const;
    size_t anomaly_count() const;

    // Drops anomalies older than the retention period
    size_t cleanup_old();

    void set_thresholds(const AnomalyThresholds& thresholds);
    AnomalyThresholds thresholds() const;

    void set_auto_remediation(bool enabled);
    bool is_auto_remediation_enabled() const;

    AnomalyStats stats() const;

private:
    DetectedAnomaly record_locked(AnomalyType type, std::string details, std::string source, Timestamp now);
    void report(const DetectedAnomaly& anomaly) const;

    AnomalyThresholds thresholds_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ErrorReporter> reporter_;

    mutable std::mutex mutex_;
    std::deque<DetectedAnomaly> history_;
    std::unordered_map<std::string, std::deque<Timestamp>> auth_failures_;
    AnomalyStats stats_;
    uint64_t next_id_ = 1;
    bool auto_remediation_ = true;
};

} // namespace security
} // namespace v1
} // namespace sbus
