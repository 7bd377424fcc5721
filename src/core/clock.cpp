#include <sbus/clock.h>

namespace sbus {
namespace v1 {

Timestamp SteadyClock::now() const {
    return std::chrono::duration_cast<Timestamp>(
        std::chrono::steady_clock::now().time_since_epoch());
}

void ManualClock::set(Timestamp t) {
    int64_t target = t.count();
    int64_t current = now_ms_.load();
    while (current < target && !now_ms_.compare_exchange_weak(current, target)) {
    }
}

std::shared_ptr<Clock> make_steady_clock() {
    return std::make_shared<SteadyClock>();
}

} // namespace v1
} // namespace sbus
