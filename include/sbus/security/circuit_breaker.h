#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/bus_config.h>

#include <mutex>
#include <string>

namespace sbus {
namespace v1 {
namespace security {

enum class CircuitState : uint8_t {
    CLOSED,
    OPEN,
    HALF_OPEN
};

SBUS_API std::string to_string(CircuitState state);

struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    uint32_t consecutive_failures = 0;
    uint32_t consecutive_successes = 0;
    uint64_t total_failures = 0;
    uint64_t total_successes = 0;
    uint64_t rejected_requests = 0;
    uint64_t transitions = 0;
    uint32_t failure_threshold = 0;
    uint32_t success_threshold = 0;
    std::chrono::seconds timeout{0};
};

/**
 * Three-state admission control.
 *
 * CLOSED -> OPEN after failure_threshold consecutive failures.
 * OPEN -> HALF_OPEN on the first request once timeout has elapsed since
 * the last failure; that request is the probe.
 * HALF_OPEN admits one probe at a time; success_threshold consecutive
 * probe successes close the breaker and any probe failure reopens it.
 */
class SBUS_API CircuitBreaker {
public:
    explicit CircuitBreaker(const CircuitBreakerConfig& config = CircuitBreakerConfig{});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    bool allow_request(Timestamp now);

    // CIRCUIT_OPEN when the request is not admitted
    Result<void> check(Timestamp now);

    void record_success();
    void record_failure(Timestamp now);

    // Releases an admitted HALF_OPEN probe that never reached the dependency
    void cancel_probe();

    CircuitState state() const;
    bool is_open() const { return state() == CircuitState::OPEN; }

    // Forces CLOSED and clears the counters
    void reset();

    CircuitBreakerStats stats() const;

private:
    void transition_locked(CircuitState next);

    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint32_t consecutive_failures_ = 0;
    uint32_t consecutive_successes_ = 0;
    uint64_t total_failures_ = 0;
    uint64_t total_successes_ = 0;
    uint64_t rejected_ = 0;
    uint64_t transitions_ = 0;
    Timestamp last_failure_{0};
    bool probe_in_flight_ = false;
};

} // namespace security
} // namespace v1
} // namespace sbus
