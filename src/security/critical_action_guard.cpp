#include <sbus/security/critical_action_guard.h>

namespace sbus {
namespace v1 {
namespace security {

CriticalActionGuard::CriticalActionGuard(std::chrono::milliseconds cooldown,
                                         std::shared_ptr<Clock> clock)
    : cooldown_(cooldown)
    , clock_(std::move(clock)) {}

bool CriticalActionGuard::is_critical(HardwareCommand command) {
    return command == HardwareCommand::RECOVER_COMPONENT ||
           command == HardwareCommand::SET_THERMAL_THROTTLE;
}

Result<void> CriticalActionGuard::check_and_record(HardwareCommand command) {
    if (!is_critical(command)) {
        return make_result();
    }

    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = last_executed_.find(command);
    if (it != last_executed_.end() && now - it->second < cooldown_) {
        refused_++;
        return Failure(SBusError::CRITICAL_ACTION_COOLDOWN, to_string(command) + " in cooldown");
    }

    last_executed_[command] = now;
    return make_result();
}

std::chrono::milliseconds CriticalActionGuard::remaining_cooldown(HardwareCommand command) const {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = last_executed_.find(command);
    if (it == last_executed_.end()) {
        return std::chrono::milliseconds{0};
    }
    auto elapsed = now - it->second;
    if (elapsed >= cooldown_) {
        return std::chrono::milliseconds{0};
    }
    return cooldown_ - elapsed;
}

uint64_t CriticalActionGuard::refused_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refused_;
}

void CriticalActionGuard::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_executed_.clear();
    refused_ = 0;
}

} // namespace security
} // namespace v1
} // namespace sbus
