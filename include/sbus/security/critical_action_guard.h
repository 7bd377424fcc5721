#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>

namespace sbus {
namespace v1 {
namespace security {

/**
 * Cooldown for hardware commands that must not be repeated quickly.
 *
 * RECOVER_COMPONENT and SET_THERMAL_THROTTLE are critical; a second
 * request for the same command inside the cooldown is refused with
 * CRITICAL_ACTION_COOLDOWN. Other commands pass untouched.
 */
class SBUS_API CriticalActionGuard {
public:
    CriticalActionGuard(std::chrono::milliseconds cooldown, std::shared_ptr<Clock> clock);

    static bool is_critical(HardwareCommand command);

    // Records the attempt when admitted
    Result<void> check_and_record(HardwareCommand command);

    // Zero when the command may run now
    std::chrono::milliseconds remaining_cooldown(HardwareCommand command) const;

    uint64_t refused_count() const;

    void reset();

private:
    std::chrono::milliseconds cooldown_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::map<HardwareCommand, Timestamp> last_executed_;
    uint64_t refused_ = 0;
};

} // namespace security
} // namespace v1
} // namespace sbus
