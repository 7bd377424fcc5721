#pragma once

#include <sbus/result.h>
#include <sbus/types.h>
#include <sbus/error.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>

#include <chrono>
#include <unordered_map>
#include <unordered_set>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <atomic>
#include <vector>

namespace sbus {
namespace v1 {
namespace security {

/**
 * Rate limiting result
 */
enum class RateLimitResult : uint8_t {
    ALLOWED,                // Request allowed
    RATE_LIMITED,           // Window budget spent
    BLACKLISTED,            // Identity is blacklisted
    RESOURCE_EXHAUSTED      // Tracking table full
};

/**
 * Rate limiting statistics per identity
 */
struct RateLimitStats {
    size_t total_requests = 0;
    size_t allowed_requests = 0;
    size_t denied_requests = 0;
    size_t violations = 0;
    Timestamp first_seen{0};
    Timestamp last_request{0};
    Timestamp last_violation{0};
};

/**
 * Fixed window counter: count resets when the window rolls over
 */
class FixedWindow {
public:
    explicit FixedWindow(std::chrono::milliseconds window_size);

    /**
     * Count one request and check it against the budget
     * @return true if the request fits in the current window
     */
    bool try_consume(uint32_t budget, Timestamp now);

    uint32_t get_count(Timestamp now) const;
    void resize(std::chrono::milliseconds window_size);
    void reset();

private:
    void roll(Timestamp now);

    std::chrono::milliseconds window_size_;
    Timestamp window_start_{0};
    uint32_t count_ = 0;
    bool started_ = false;
};

/**
 * Tracking data for one identity
 */
struct IdentityData {
    FixedWindow window;
    RateLimitStats stats;
    std::optional<ComponentType> component;
    std::optional<uint32_t> budget_override;
    bool is_blacklisted = false;
    Timestamp blacklist_expiry{0};
    std::vector<Timestamp> violations;
    mutable std::mutex mutex;

    explicit IdentityData(const RateLimitConfig& config);
};

/**
 * Per-identity fixed-window rate limiter.
 *
 * The budget of an identity is, in order: its explicit override, the
 * budget of the component it is bound to, or the default budget.
 * Whitelisted identities are always allowed; blacklisted identities are
 * denied until their blacklist expires.
 */
class SBUS_API RateLimiter {
public:
    RateLimiter(const RateLimitConfig& config, std::shared_ptr<Clock> clock);
    ~RateLimiter();

    // Non-copyable
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Count a request from identity against its window budget
     * @param identity Caller identity (node name, peer id)
     * @param component Component to bind the identity to, if not yet bound
     * @return Rate limiting result
     */
    RateLimitResult check_request(const std::string& identity,
                                  std::optional<ComponentType> component = std::nullopt);

    bool is_allowed(const std::string& identity, ComponentType component) {
        return check_request(identity, component) == RateLimitResult::ALLOWED;
    }

    // RATE_LIMITED, BLACKLISTED or RESOURCE_EXHAUSTED as errors
    Result<void> acquire(const std::string& identity,
                         std::optional<ComponentType> component = std::nullopt);

    // Clears the window, blacklist and violations of one identity
    void reset_component(const std::string& identity);

    Result<void> set_budget_override(const std::string& identity, uint32_t budget);
    void clear_budget_override(const std::string& identity);

    void record_violation(const std::string& identity, const std::string& violation_type);

    Result<void> add_to_whitelist(const std::string& identity);
    Result<void> remove_from_whitelist(const std::string& identity);
    bool is_whitelisted(const std::string& identity) const;

    /**
     * Manually blacklist an identity
     * @param duration Blacklist duration, 0 = configured default
     */
    Result<void> blacklist_identity(const std::string& identity,
                                    std::chrono::seconds duration = std::chrono::seconds{0});
    Result<void> remove_from_blacklist(const std::string& identity);
    bool is_blacklisted(const std::string& identity);

    uint32_t budget_for(const std::string& identity) const;
    static uint32_t component_budget(ComponentType component, uint32_t default_budget);

    Result<RateLimitStats> get_identity_stats(const std::string& identity) const;

    struct OverallStats {
        size_t total_identities = 0;
        size_t blacklisted_identities = 0;
        size_t whitelisted_identities = 0;
        size_t total_requests = 0;
        size_t allowed_requests = 0;
        size_t denied_requests = 0;
        size_t total_violations = 0;
        Timestamp creation_time{0};
    };
    OverallStats get_overall_stats() const;

    // Drops identities idle for longer than the violation window
    size_t cleanup_expired_entries();

    Result<void> update_config(const RateLimitConfig& new_config);
    RateLimitConfig get_config() const;

    void reset();

private:
    std::shared_ptr<IdentityData> get_or_create_identity(const std::string& identity);
    std::shared_ptr<IdentityData> get_identity(const std::string& identity) const;
    uint32_t budget_locked(const IdentityData& data) const;
    bool blacklisted_locked(IdentityData& data, Timestamp now);
    void note_violation_locked(IdentityData& data, Timestamp now);
    // Caller holds identities_mutex_ exclusively
    size_t sweep_idle_locked(Timestamp now, Timestamp idle, bool keep_recent_violations);

    RateLimitConfig config_;
    mutable std::mutex config_mutex_;
    std::shared_ptr<Clock> clock_;

    std::unordered_map<std::string, std::shared_ptr<IdentityData>> identities_;
    mutable std::shared_mutex identities_mutex_;

    std::unordered_set<std::string> whitelist_;
    mutable std::shared_mutex whitelist_mutex_;

    std::atomic<size_t> total_requests_{0};
    std::atomic<size_t> allowed_requests_{0};
    std::atomic<size_t> denied_requests_{0};
    std::atomic<size_t> total_violations_{0};
    Timestamp creation_time_{0};
};

/**
 * Rate limiter presets
 */
class RateLimiterFactory {
public:
    // Permissive limits for development and testing
    static std::unique_ptr<RateLimiter> create_development(std::shared_ptr<Clock> clock);

    // Default budgets with auto-blacklisting
    static std::unique_ptr<RateLimiter> create_production(std::shared_ptr<Clock> clock);

    // Halved budgets, quick and long blacklisting
    static std::unique_ptr<RateLimiter> create_high_security(std::shared_ptr<Clock> clock);
};

}  // namespace security
}  // namespace v1
}  // namespace sbus
