#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace session {

enum class TimeoutType : uint8_t {
    HANDSHAKE,
    SESSION,
    PENDING_MESSAGE,
    RETRY
};

struct TimeoutEntry {
    std::string name;
    TimeoutType type = TimeoutType::HANDSHAKE;
    Timestamp created_at{0};
    uint32_t retries = 0;
};

/**
 * Named, polled deadlines with retry counting.
 *
 * An entry is expired once more than its type's duration has elapsed.
 * Expired entries with retries left are retry candidates; expired entries
 * that used up max_retries are collected by cleanup_expired().
 */
class SBUS_API TimeoutManager {
public:
    TimeoutManager(const TimeoutConfig& config, std::shared_ptr<Clock> clock);

    // Registering an existing name restarts its deadline
    void register_timeout(const std::string& name, TimeoutType type);
    void remove_timeout(const std::string& name);

    bool has_timed_out(const std::string& name) const;
    std::vector<std::string> get_retry_candidates() const;
    bool increment_retry(const std::string& name);

    std::vector<std::string> cleanup_expired();
    // Names collected by cleanup_expired() since the last call
    std::vector<std::string> take_expired();

    size_t active_count() const;
    std::chrono::milliseconds duration(TimeoutType type) const;

private:
    bool is_expired_locked(const TimeoutEntry& entry, Timestamp now) const;

    TimeoutConfig config_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::map<std::string, TimeoutEntry> entries_;
    std::vector<std::string> expired_;
};

} // namespace session
} // namespace v1
} // namespace sbus
