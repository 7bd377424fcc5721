#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>

#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sbus {
namespace v1 {
namespace session {

/**
 * Resumable session material stored after a full handshake
 */
struct CachedSession {
    std::string hostname;
    std::vector<uint8_t> session_id;
    std::vector<uint8_t> master_secret;
    uint16_t cipher_suite = 0;
    Timestamp created_at{0};
    std::chrono::seconds ttl{0};
    uint32_t resume_count = 0;

    // Valid strictly before created_at + ttl
    bool is_valid(Timestamp now) const {
        return now < created_at + std::chrono::duration_cast<Timestamp>(ttl);
    }
};

struct SessionCacheStats {
    size_t total_sessions = 0;
    size_t valid_sessions = 0;
    uint64_t total_resumptions = 0;
    uint64_t evictions = 0;
};

/**
 * Session cache keyed by (hostname, session id).
 *
 * Lookup, TTL expiry and LRU bookkeeping happen under one lock so an
 * expired entry is never returned. When the cache is full the least
 * recently used entry is evicted.
 */
class SBUS_API SessionCache {
public:
    SessionCache(const SessionCacheConfig& config, std::shared_ptr<Clock> clock);
    ~SessionCache();

    SessionCache(const SessionCache&) = delete;
    SessionCache& operator=(const SessionCache&) = delete;

    Result<void> cache_session(const std::string& hostname,
                               const std::vector<uint8_t>& session_id,
                               const std::vector<uint8_t>& master_secret,
                               uint16_t cipher_suite);

    // Removes the entry when expired; counts a resumption on success
    std::optional<CachedSession> get_session(const std::string& hostname,
                                             const std::vector<uint8_t>& session_id);

    bool has_valid_session(const std::string& hostname, const std::vector<uint8_t>& session_id) const;
    bool remove_session(const std::string& hostname, const std::vector<uint8_t>& session_id);

    size_t cleanup_expired();
    SessionCacheStats stats() const;
    void clear_all();

private:
    using LruList = std::list<std::string>;

    struct Slot {
        CachedSession session;
        LruList::iterator position;
    };

    static std::string make_key(const std::string& hostname, const std::vector<uint8_t>& session_id);
    void erase_locked(std::unordered_map<std::string, Slot>::iterator it);

    SessionCacheConfig config_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> sessions_;
    LruList lru_;                          // front = most recently used
    uint64_t evictions_ = 0;
};

} // namespace session
} // namespace v1
} // namespace sbus
