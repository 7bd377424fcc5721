#include <sbus/security/circuit_breaker.h>

namespace sbus {
namespace v1 {
namespace security {

std::string to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config)
    : config_(config) {}

void CircuitBreaker::transition_locked(CircuitState next) {
    if (state_ != next) {
        state_ = next;
        transitions_++;
    }
    consecutive_successes_ = 0;
    probe_in_flight_ = false;
    if (next == CircuitState::CLOSED) {
        consecutive_failures_ = 0;
    }
}

bool CircuitBreaker::allow_request(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN:
            if (now - last_failure_ >= std::chrono::duration_cast<Timestamp>(config_.timeout)) {
                transition_locked(CircuitState::HALF_OPEN);
                probe_in_flight_ = true;
                return true;
            }
            rejected_++;
            return false;

        case CircuitState::HALF_OPEN:
            if (!probe_in_flight_) {
                probe_in_flight_ = true;
                return true;
            }
            rejected_++;
            return false;
    }
    return false;
}

Result<void> CircuitBreaker::check(Timestamp now) {
    if (!allow_request(now)) {
        return Failure(SBusError::CIRCUIT_OPEN, "circuit breaker open");
    }
    return make_result();
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    total_successes_++;

    switch (state_) {
        case CircuitState::CLOSED:
            consecutive_failures_ = 0;
            break;

        case CircuitState::HALF_OPEN:
            probe_in_flight_ = false;
            consecutive_successes_++;
            if (consecutive_successes_ >= config_.success_threshold) {
                transition_locked(CircuitState::CLOSED);
            }
            break;

        case CircuitState::OPEN:
            break;
    }
}

void CircuitBreaker::record_failure(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_failures_++;
    last_failure_ = now;

    switch (state_) {
        case CircuitState::CLOSED:
            consecutive_failures_++;
            if (consecutive_failures_ >= config_.failure_threshold) {
                transition_locked(CircuitState::OPEN);
            }
            break;

        case CircuitState::HALF_OPEN:
            consecutive_failures_++;
            transition_locked(CircuitState::OPEN);
            break;

        case CircuitState::OPEN:
            consecutive_failures_++;
            break;
    }
}

void CircuitBreaker::cancel_probe() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::HALF_OPEN) {
        probe_in_flight_ = false;
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    transition_locked(CircuitState::CLOSED);
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats stats;
    stats.state = state_;
    stats.consecutive_failures = consecutive_failures_;
    stats.consecutive_successes = consecutive_successes_;
    stats.total_failures = total_failures_;
    stats.total_successes = total_successes_;
    stats.rejected_requests = rejected_;
    stats.transitions = transitions_;
    stats.failure_threshold = config_.failure_threshold;
    stats.success_threshold = config_.success_threshold;
    stats.timeout = config_.timeout;
    return stats;
}

} // namespace security
} // namespace v1
} // namespace sbus
