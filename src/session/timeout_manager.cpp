#include <sbus/session/timeout_manager.h>

namespace sbus {
namespace v1 {
namespace session {

TimeoutManager::TimeoutManager(const TimeoutConfig& config, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(std::move(clock)) {}

std::chrono::milliseconds TimeoutManager::duration(TimeoutType type) const {
    switch (type) {
        case TimeoutType::HANDSHAKE: return config_.handshake;
        case TimeoutType::SESSION: return config_.session;
        case TimeoutType::PENDING_MESSAGE: return config_.pending_message;
        case TimeoutType::RETRY: return config_.retry;
    }
    return config_.handshake;
}

bool TimeoutManager::is_expired_locked(const TimeoutEntry& entry, Timestamp now) const {
    return now - entry.created_at > duration(entry.type);
}

void TimeoutManager::register_timeout(const std::string& name, TimeoutType type) {
    TimeoutEntry entry;
    entry.name = name;
    entry.type = type;
    entry.created_at = clock_->now();

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[name] = entry;
}

void TimeoutManager::remove_timeout(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(name);
}

bool TimeoutManager::has_timed_out(const std::string& name) const {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    return it != entries_.end() && is_expired_locked(it->second, now);
}

std::vector<std::string> TimeoutManager::get_retry_candidates() const {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> out;
    for (const auto& entry : entries_) {
        if (entry.second.retries < config_.max_retries && is_expired_locked(entry.second, now)) {
            out.push_back(entry.first);
        }
    }
    return out;
}

bool TimeoutManager::increment_retry(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return false;
    }
    it->second.retries++;
    return true;
}

std::vector<std::string> TimeoutManager::cleanup_expired() {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> removed;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_expired_locked(it->second, now) && it->second.retries >= config_.max_retries) {
            removed.push_back(it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    expired_.insert(expired_.end(), removed.begin(), removed.end());
    return removed;
}

std::vector<std::string> TimeoutManager::take_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.swap(expired_);
    return out;
}

size_t TimeoutManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace session
} // namespace v1
} // namespace sbus
