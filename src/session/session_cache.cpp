#include <sbus/session/session_cache.h>
#include <sbus/crypto/crypto_utils.h>

namespace sbus {
namespace v1 {
namespace session {

SessionCache::SessionCache(const SessionCacheConfig& config, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(std::move(clock)) {}

SessionCache::~SessionCache() {
    clear_all();
}

std::string SessionCache::make_key(const std::string& hostname, const std::vector<uint8_t>& session_id) {
    return hostname + ":" + crypto::utils::to_hex(session_id);
}

void SessionCache::erase_locked(std::unordered_map<std::string, Slot>::iterator it) {
    crypto::utils::secure_zero(it->second.session.master_secret);
    lru_.erase(it->second.position);
    sessions_.erase(it);
}

Result<void> SessionCache::cache_session(const std::string& hostname,
                                         const std::vector<uint8_t>& session_id,
                                         const std::vector<uint8_t>& master_secret,
                                         uint16_t cipher_suite) {
    if (hostname.empty() || session_id.empty()) {
        return Failure(SBusError::INVALID_PARAMETER, "hostname and session id required");
    }
    if (master_secret.empty()) {
        return Failure(SBusError::INVALID_PARAMETER, "empty master secret");
    }
    if (!is_supported_cipher_suite(cipher_suite)) {
        return Failure(SBusError::INVALID_PARAMETER, "unsupported cipher suite");
    }

    CachedSession session;
    session.hostname = hostname;
    session.session_id = session_id;
    session.master_secret = master_secret;
    session.cipher_suite = cipher_suite;
    session.created_at = clock_->now();
    session.ttl = config_.ttl;

    std::string key = make_key(hostname, session_id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = sessions_.find(key);
    if (existing != sessions_.end()) {
        erase_locked(existing);
    }

    while (!lru_.empty() && sessions_.size() >= config_.capacity) {
        erase_locked(sessions_.find(lru_.back()));
        ++evictions_;
    }

    lru_.push_front(key);
    sessions_.emplace(key, Slot{std::move(session), lru_.begin()});
    return make_result();
}

std::optional<CachedSession> SessionCache::get_session(const std::string& hostname,
                                                       const std::vector<uint8_t>& session_id) {
    std::string key = make_key(hostname, session_id);
    Timestamp now = clock_->now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    if (it == sessions_.end()) {
        return std::nullopt;
    }

    if (!it->second.session.is_valid(now)) {
        erase_locked(it);
        return std::nullopt;
    }

    it->second.session.resume_count++;
    lru_.splice(lru_.begin(), lru_, it->second.position);
    return it->second.session;
}

bool SessionCache::has_valid_session(const std::string& hostname,
                                     const std::vector<uint8_t>& session_id) const {
    std::string key = make_key(hostname, session_id);
    Timestamp now = clock_->now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    return it != sessions_.end() && it->second.session.is_valid(now);
}

bool SessionCache::remove_session(const std::string& hostname, const std::vector<uint8_t>& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(make_key(hostname, session_id));
    if (it == sessions_.end()) {
        return false;
    }
    erase_locked(it);
    return true;
}

size_t SessionCache::cleanup_expired() {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (!it->second.session.is_valid(now)) {
            auto victim = it++;
            erase_locked(victim);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

SessionCacheStats SessionCache::stats() const {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);

    SessionCacheStats stats;
    stats.total_sessions = sessions_.size();
    stats.evictions = evictions_;
    for (const auto& entry : sessions_) {
        if (entry.second.session.is_valid(now)) {
            stats.valid_sessions++;
            stats.total_resumptions += entry.second.session.resume_count;
        }
    }
    return stats;
}

void SessionCache::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : sessions_) {
        crypto::utils::secure_zero(entry.second.session.master_secret);
    }
    sessions_.clear();
    lru_.clear();
}

} // namespace session
} // namespace v1
} // namespace sbus
