#ifndef SBUS_CLOCK_H
#define SBUS_CLOCK_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <atomic>
#include <chrono>
#include <memory>

namespace sbus {
namespace v1 {

/**
 * Monotonic time source shared by every time-dependent component.
 *
 * Expiry, rate windows, breaker cooldowns and the handshake deadline are
 * all measured on this timeline. Two implementations exist:
 *  - SteadyClock: std::chrono::steady_clock, the default.
 *  - ManualClock: a simulation clock that moves only when told to. It is
 *    the documented mode for embedders without a real-time source and for
 *    tests; there is no implicit zero clock.
 */
class SBUS_API Clock {
public:
    virtual ~Clock() = default;

    virtual Timestamp now() const = 0;

    uint64_t now_ms() const {
        return static_cast<uint64_t>(now().count());
    }

    uint64_t now_seconds() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(now()).count());
    }
};

class SBUS_API SteadyClock : public Clock {
public:
    Timestamp now() const override;
};

class SBUS_API ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp{0}) : now_ms_(start.count()) {}

    Timestamp now() const override {
        return Timestamp{now_ms_.load()};
    }

    void advance(std::chrono::milliseconds delta) {
        now_ms_.fetch_add(delta.count());
    }

    // Never moves backwards
    void set(Timestamp t);

private:
    std::atomic<int64_t> now_ms_;
};

SBUS_API std::shared_ptr<Clock> make_steady_clock();

} // namespace v1
} // namespace sbus

#endif // SBUS_CLOCK_H
