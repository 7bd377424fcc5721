#include <sbus/security/anomaly_detector.h>

#include <cstdio>

namespace sbus {
namespace v1 {
namespace security {

namespace {

std::string percent(double ratio) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f%%", ratio * 100.0);
    return buffer;
}

SBusError anomaly_error(AnomalyType type) {
    switch (type) {
        case AnomalyType::HIGH_ERROR_RATE: return SBusError::CHANNEL_SEND_FAILED;
        case AnomalyType::LOW_SUCCESS_RATE: return SBusError::CHANNEL_SEND_FAILED;
        case AnomalyType::HIGH_LATENCY: return SBusError::TIMEOUT;
        case AnomalyType::CONNECTION_SPIKE: return SBusError::RESOURCE_EXHAUSTED;
        case AnomalyType::CACHE_MISS_SPIKE: return SBusError::SESSION_NOT_FOUND;
        case AnomalyType::AUTH_FAILURE_BURST: return SBusError::AUTHENTICATION_FAILED;
    }
    return SBusError::INTERNAL_ERROR;
}

// Guards the cache-miss comparison against rounding in 1 - hit_rate
constexpr double MISS_RATE_EPSILON = 1e-12;

} // namespace

std::string to_string(AnomalyType type) {
    switch (type) {
        case AnomalyType::HIGH_ERROR_RATE: return "HIGH_ERROR_RATE";
        case AnomalyType::LOW_SUCCESS_RATE: return "LOW_SUCCESS_RATE";
        case AnomalyType::HIGH_LATENCY: return "HIGH_LATENCY";
        case AnomalyType::CONNECTION_SPIKE: return "CONNECTION_SPIKE";
        case AnomalyType::CACHE_MISS_SPIKE: return "CACHE_MISS_SPIKE";
        case AnomalyType::AUTH_FAILURE_BURST: return "AUTH_FAILURE_BURST";
    }
    return "UNKNOWN";
}

std::string to_string(AnomalySeverity severity) {
    switch (severity) {
        case AnomalySeverity::LOW: return "LOW";
        case AnomalySeverity::MEDIUM: return "MEDIUM";
        case AnomalySeverity::HIGH: return "HIGH";
        case AnomalySeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string to_string(RemediationAction action) {
    switch (action) {
        case RemediationAction::CLEAR_CACHE: return "CLEAR_CACHE";
        case RemediationAction::INCREASE_BREAKER_THRESHOLD: return "INCREASE_BREAKER_THRESHOLD";
        case RemediationAction::REDUCE_MAX_CONCURRENCY: return "REDUCE_MAX_CONCURRENCY";
        case RemediationAction::ENABLE_RATE_LIMITING: return "ENABLE_RATE_LIMITING";
        case RemediationAction::REBUILD_CACHE: return "REBUILD_CACHE";
        case RemediationAction::BLACKLIST_SOURCE: return "BLACKLIST_SOURCE";
        case RemediationAction::LOG_AND_ALERT: return "LOG_AND_ALERT";
    }
    return "UNKNOWN";
}

AnomalyDetector::AnomalyDetector(const AnomalyThresholds& thresholds,
                                 std::shared_ptr<Clock> clock,
                                 std::shared_ptr<ErrorReporter> reporter)
    : thresholds_(thresholds)
    , clock_(std::move(clock))
    , reporter_(std::move(reporter)) {}

AnomalySeverity AnomalyDetector::severity_of(AnomalyType type) {
    switch (type) {
        case AnomalyType::HIGH_ERROR_RATE: return AnomalySeverity::CRITICAL;
        case AnomalyType::LOW_SUCCESS_RATE: return AnomalySeverity::HIGH;
        case AnomalyType::HIGH_LATENCY: return AnomalySeverity::MEDIUM;
        case AnomalyType::CONNECTION_SPIKE: return AnomalySeverity::HIGH;
        case AnomalyType::CACHE_MISS_SPIKE: return AnomalySeverity::MEDIUM;
        case AnomalyType::AUTH_FAILURE_BURST: return AnomalySeverity::HIGH;
    }
    return AnomalySeverity::LOW;
}

RemediationAction AnomalyDetector::remediation_for(AnomalyType type) {
    switch (type) {
        case AnomalyType::HIGH_ERROR_RATE: return RemediationAction::CLEAR_CACHE;
        case AnomalyType::LOW_SUCCESS_RATE: return RemediationAction::INCREASE_BREAKER_THRESHOLD;
        case AnomalyType::HIGH_LATENCY: return RemediationAction::REDUCE_MAX_CONCURRENCY;
        case AnomalyType::CONNECTION_SPIKE: return RemediationAction::ENABLE_RATE_LIMITING;
        case AnomalyType::CACHE_MISS_SPIKE: return RemediationAction::REBUILD_CACHE;
        case AnomalyType::AUTH_FAILURE_BURST: return RemediationAction::BLACKLIST_SOURCE;
    }
    return RemediationAction::LOG_AND_ALERT;
}

DetectedAnomaly AnomalyDetector::record_locked(AnomalyType type, std::string details,
                                               std::string source, Timestamp now) {
    DetectedAnomaly anomaly;
    anomaly.id = next_id_++;
    anomaly.type = type;
    anomaly.severity = severity_of(type);
    anomaly.detected_at = now;
    anomaly.details = std::move(details);
    anomaly.source = std::move(source);

    history_.push_back(anomaly);
    while (history_.size() > thresholds_.max_history) {
        history_.pop_front();
    }

    stats_.total_anomalies++;
    if (anomaly.severity == AnomalySeverity::CRITICAL) {
        stats_.critical_anomalies++;
    }
    return anomaly;
}

void AnomalyDetector::report(const DetectedAnomaly& anomaly) const {
    if (!reporter_) {
        return;
    }
    if (anomaly.severity >= AnomalySeverity::HIGH) {
        (void)reporter_->report_security_incident(anomaly_error(anomaly.type),
                                                  to_string(anomaly.type),
                                                  anomaly.severity == AnomalySeverity::CRITICAL ? 0.9 : 0.7,
                                                  anomaly.source);
    } else {
        (void)reporter_->report_error(ErrorReporter::LogLevel::WARNING,
                                      anomaly_error(anomaly.type),
                                      "anomaly",
                                      to_string(anomaly.type) + ": " + anomaly.details);
    }
}

std::vector<DetectedAnomaly> AnomalyDetector::check_metrics(double error_rate,
                                                            double success_rate,
                                                            double avg_latency_ms,
                                                            uint64_t connection_count,
                                                            double cache_hit_rate) {
    Timestamp now = clock_->now();
    std::vector<DetectedAnomaly> detected;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const AnomalyThresholds& t = thresholds_;

        if (error_rate > t.error_rate) {
            detected.push_back(record_locked(AnomalyType::HIGH_ERROR_RATE,
                "error rate " + percent(error_rate) + " above " + percent(t.error_rate), "", now));
        }

        if (success_rate < t.success_rate) {
            detected.push_back(record_locked(AnomalyType::LOW_SUCCESS_RATE,
                "success rate " + percent(success_rate) + " below " + percent(t.success_rate), "", now));
        }

        if (avg_latency_ms > t.latency_ms) {
            detected.push_back(record_locked(AnomalyType::HIGH_LATENCY,
                "latency " + std::to_string(static_cast<uint64_t>(avg_latency_ms)) + "ms above " +
                std::to_string(static_cast<uint64_t>(t.latency_ms)) + "ms", "", now));
        }

        if (connection_count > t.connection_spike) {
            detected.push_back(record_locked(AnomalyType::CONNECTION_SPIKE,
                std::to_string(connection_count) + " connections above " +
                std::to_string(t.connection_spike), "", now));
        }

        double miss_rate = 1.0 - cache_hit_rate;
        if (miss_rate > t.cache_miss_rate + MISS_RATE_EPSILON) {
            detected.push_back(record_locked(AnomalyType::CACHE_MISS_SPIKE,
                "cache miss rate " + percent(miss_rate) + " above " + percent(t.cache_miss_rate), "", now));
        }

        if (!detected.empty()) {
            stats_.checks_with_anomalies++;
        }
    }

    for (const auto& anomaly : detected) {
        report(anomaly);
    }
    return detected;
}

std::optional<DetectedAnomaly> AnomalyDetector::record_authorization_failure(const std::string& source,
                                                                             const std::string& reason) {
    Timestamp now = clock_->now();
    std::optional<DetectedAnomaly> burst;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.authorization_failures++;

        auto& window = auth_failures_[source];
        auto horizon = std::chrono::duration_cast<Timestamp>(thresholds_.auth_failure_window);
        while (!window.empty() && now - window.front() >= horizon) {
            window.pop_front();
        }
        window.push_back(now);

        if (thresholds_.auth_failure_burst > 0 && window.size() >= thresholds_.auth_failure_burst) {
            burst = record_locked(AnomalyType::AUTH_FAILURE_BURST,
                                  std::to_string(window.size()) + " authorization failures, last: " + reason,
                                  source, now);
            stats_.auth_failure_bursts++;
            window.clear();
        }
    }

    if (burst) {
        report(*burst);
    } else {
        SBUS_REPORT_DEBUG(reporter_, SBusError::AUTHENTICATION_FAILED, "authorization failure: " + reason);
    }
    return burst;
}

RemediationAction AnomalyDetector::apply_auto_remediation(const DetectedAnomaly& anomaly) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.remediations_triggered++;
    return remediation_for(anomaly.type);
}

Result<void> AnomalyDetector::mark_remediated(uint64_t anomaly_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& anomaly : history_) {
        if (anomaly.id == anomaly_id) {
            anomaly.remediation_applied = true;
            return make_result();
        }
    }
    return Failure(SBusError::KEY_NOT_FOUND, "anomaly " + std::to_string(anomaly_id));
}

std::vector<DetectedAnomaly> AnomalyDetector::recent_anomalies(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start = history_.size() > limit ? history_.size() - limit : 0;
    return std::vector<DetectedAnomaly>(history_.begin() + static_cast<std::ptrdiff_t>(start), history_.end());
}

size_t AnomalyDetector::anomaly_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

size_t AnomalyDetector::cleanup_old() {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);

    auto retention = std::chrono::duration_cast<Timestamp>(thresholds_.retention);
    size_t removed = 0;
    while (!history_.empty() && now - history_.front().detected_at >= retention) {
        history_.pop_front();
        removed++;
    }

    for (auto it = auth_failures_.begin(); it != auth_failures_.end();) {
        if (it->second.empty() || now - it->second.back() >= retention) {
            it = auth_failures_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

void AnomalyDetector::set_thresholds(const AnomalyThresholds& thresholds) {
    std::lock_guard<std::mutex> lock(mutex_);
    thresholds_ = thresholds;
}

AnomalyThresholds AnomalyDetector::thresholds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thresholds_;
}

void AnomalyDetector::set_auto_remediation(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_remediation_ = enabled;
}

bool AnomalyDetector::is_auto_remediation_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auto_remediation_;
}

AnomalyStats AnomalyDetector::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace security
} // namespace v1
} // namespace sbus
