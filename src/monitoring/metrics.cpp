/**
 * @file metrics.cpp
 * @brief Implementation of session-level metrics
 */

#include <sbus/monitoring/metrics.h>
#include <algorithm>

namespace sbus {
namespace v1 {
namespace monitoring {

MetricsCollector::MetricsCollector(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)) {}

void MetricsCollector::record_encryption(uint64_t bytes) {
    messages_encrypted_.fetch_add(1);
    bytes_encrypted_.fetch_add(bytes);
}

void MetricsCollector::record_decryption(uint64_t bytes) {
    messages_decrypted_.fetch_add(1);
    bytes_decrypted_.fetch_add(bytes);
}

void MetricsCollector::record_latency(std::chrono::milliseconds latency) {
    if (latency.count() < 0) {
        return;
    }
    latency_total_ms_.fetch_add(static_cast<uint64_t>(latency.count()));
    latency_samples_.fetch_add(1);
}

double MetricsCollector::average_latency_ms() const {
    const uint64_t samples = latency_samples_.load();
    if (samples == 0) {
        return 0.0;
    }
    return static_cast<double>(latency_total_ms_.load()) / static_cast<double>(samples);
}

uint8_t MetricsCollector::health_score() const {
    uint64_t score = 100;
    const uint64_t penalty = std::min<uint64_t>(handshakes_failed_.load(), 50) +
                             std::min<uint64_t>(timeouts_.load(), 30) +
                             std::min<uint64_t>(security_incidents_.load(), 20);
    score = penalty >= score ? 0 : score - penalty;
    return static_cast<uint8_t>(score);
}

MetricsSnapshot MetricsCollector::snapshot() const {
    MetricsSnapshot snap;
    snap.taken_at = clock_ ? clock_->now() : Timestamp{0};
    snap.handshakes_completed = handshakes_completed_.load();
    snap.handshakes_failed = handshakes_failed_.load();
    snap.resumptions = resumptions_.load();
    snap.timeouts = timeouts_.load();
    snap.messages_encrypted = messages_encrypted_.load();
    snap.messages_decrypted = messages_decrypted_.load();
    snap.bytes_encrypted = bytes_encrypted_.load();
    snap.bytes_decrypted = bytes_decrypted_.load();
    snap.messages_rejected = messages_rejected_.load();
    snap.security_incidents = security_incidents_.load();
    snap.active_sessions = active_sessions_.load();
    snap.average_latency_ms = average_latency_ms();
    snap.health_score = health_score();
    return snap;
}

void MetricsCollector::store_snapshot() {
    MetricsSnapshot snap = snapshot();
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(snap);
    while (history_.size() > MAX_HISTORY) {
        history_.pop_front();
    }
}

std::deque<MetricsSnapshot> MetricsCollector::history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

void MetricsCollector::reset() {
    handshakes_completed_.store(0);
    handshakes_failed_.store(0);
    resumptions_.store(0);
    timeouts_.store(0);
    messages_encrypted_.store(0);
    messages_decrypted_.store(0);
    bytes_encrypted_.store(0);
    bytes_decrypted_.store(0);
    messages_rejected_.store(0);
    security_incidents_.store(0);
    latency_total_ms_.store(0);
    latency_samples_.store(0);

    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.clear();
}

} // namespace monitoring
} // namespace v1
} // namespace sbus
