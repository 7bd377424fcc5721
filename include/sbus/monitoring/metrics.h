#pragma once

/**
 * @file metrics.h
 * @brief Session-level metrics and health scoring
 */

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/clock.h>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>

namespace sbus {
namespace v1 {
namespace monitoring {

/**
 * @brief Point-in-time copy of the collected metrics
 */
struct MetricsSnapshot {
    Timestamp taken_at{0};

    uint64_t handshakes_completed = 0;
    uint64_t handshakes_failed = 0;
    uint64_t resumptions = 0;
    uint64_t timeouts = 0;

    uint64_t messages_encrypted = 0;
    uint64_t messages_decrypted = 0;
    uint64_t bytes_encrypted = 0;
    uint64_t bytes_decrypted = 0;
    uint64_t messages_rejected = 0;
    uint64_t security_incidents = 0;

    uint64_t active_sessions = 0;
    double average_latency_ms = 0.0;

    uint8_t health_score = 100;
};

/**
 * @brief Counters for one bus session or a whole bus instance
 *
 * All recording methods are lock-free; snapshots and the bounded history
 * take a mutex.
 */
class SBUS_API MetricsCollector {
public:
    static constexpr size_t MAX_HISTORY = 100;

    explicit MetricsCollector(std::shared_ptr<Clock> clock);

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void record_handshake_success() { handshakes_completed_.fetch_add(1); }
    void record_handshake_failure() { handshakes_failed_.fetch_add(1); }
    void record_resumption() { resumptions_.fetch_add(1); }
    void record_timeout() { timeouts_.fetch_add(1); }

    void record_encryption(uint64_t bytes);
    void record_decryption(uint64_t bytes);
    void record_rejection() { messages_rejected_.fetch_add(1); }
    void record_security_incident() { security_incidents_.fetch_add(1); }

    void record_latency(std::chrono::milliseconds latency);
    void set_active_sessions(uint64_t count) { active_sessions_.store(count); }

    double average_latency_ms() const;

    /**
     * @brief 0-100; 100 minus penalties for failed handshakes (up to 50),
     * timeouts (up to 30) and security incidents (up to 20)
     */
    uint8_t health_score() const;

    MetricsSnapshot snapshot() const;

    // Appends a snapshot to the bounded history
    void store_snapshot();
    std::deque<MetricsSnapshot> history() const;

    void reset();

private:
    std::shared_ptr<Clock> clock_;

    std::atomic<uint64_t> handshakes_completed_{0};
    std::atomic<uint64_t> handshakes_failed_{0};
    std::atomic<uint64_t> resumptions_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> messages_encrypted_{0};
    std::atomic<uint64_t> messages_decrypted_{0};
    std::atomic<uint64_t> bytes_encrypted_{0};
    std::atomic<uint64_t> bytes_decrypted_{0};
    std::atomic<uint64_t> messages_rejected_{0};
    std::atomic<uint64_t> security_incidents_{0};
    std::atomic<uint64_t> active_sessions_{0};
    std::atomic<uint64_t> latency_total_ms_{0};
    std::atomic<uint64_t> latency_samples_{0};

    mutable std::mutex history_mutex_;
    std::deque<MetricsSnapshot> history_;
};

} // namespace monitoring
} // namespace v1
} // namespace sbus
