#include <sbus/security/rate_limiter.h>
#include <algorithm>

namespace sbus {
namespace v1 {
namespace security {

// FixedWindow implementation
FixedWindow::FixedWindow(std::chrono::milliseconds window_size)
    : window_size_(window_size) {
}

void FixedWindow::roll(Timestamp now) {
    if (!started_ || now >= window_start_ + window_size_) {
        window_start_ = now;
        count_ = 0;
        started_ = true;
    }
}

bool FixedWindow::try_consume(uint32_t budget, Timestamp now) {
    roll(now);
    if (count_ >= budget) {
        return false;
    }
    count_++;
    return true;
}

uint32_t FixedWindow::get_count(Timestamp now) const {
    if (!started_ || now >= window_start_ + window_size_) {
        return 0;
    }
    return count_;
}

void FixedWindow::resize(std::chrono::milliseconds window_size) {
    window_size_ = window_size;
    reset();
}

void FixedWindow::reset() {
    count_ = 0;
    started_ = false;
    window_start_ = Timestamp{0};
}

// IdentityData implementation
IdentityData::IdentityData(const RateLimitConfig& config)
    : window(std::chrono::duration_cast<std::chrono::milliseconds>(config.window)) {
}

// RateLimiter implementation
RateLimiter::RateLimiter(const RateLimitConfig& config, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(std::move(clock))
    , creation_time_(clock_->now()) {
}

RateLimiter::~RateLimiter() = default;

uint32_t RateLimiter::component_budget(ComponentType component, uint32_t default_budget) {
    switch (component) {
        case ComponentType::KERNEL: return 100;
        case ComponentType::AI: return 50;
        case ComponentType::API: return 20;
        case ComponentType::SECURITY: return 10;
        case ComponentType::OPTIMIZATION: return 30;
        case ComponentType::HSM: return 3;
        default: return default_budget;
    }
}

uint32_t RateLimiter::budget_locked(const IdentityData& data) const {
    if (data.budget_override) {
        return *data.budget_override;
    }
    uint32_t default_budget;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        default_budget = config_.default_budget;
    }
    if (data.component) {
        return component_budget(*data.component, default_budget);
    }
    return default_budget;
}

uint32_t RateLimiter::budget_for(const std::string& identity) const {
    auto data = get_identity(identity);
    if (!data) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return config_.default_budget;
    }
    std::lock_guard<std::mutex> lock(data->mutex);
    return budget_locked(*data);
}

bool RateLimiter::blacklisted_locked(IdentityData& data, Timestamp now) {
    if (!data.is_blacklisted) {
        return false;
    }
    // Check if blacklist has expired
    if (now >= data.blacklist_expiry) {
        data.is_blacklisted = false;
        return false;
    }
    return true;
}

void RateLimiter::note_violation_locked(IdentityData& data, Timestamp now) {
    RateLimitConfig config = get_config();

    data.violations.push_back(now);
    data.stats.violations++;
    data.stats.last_violation = now;

    // Clean up old violations
    auto window = std::chrono::duration_cast<Timestamp>(config.violation_window);
    data.violations.erase(
        std::remove_if(data.violations.begin(), data.violations.end(),
                       [now, window](Timestamp t) {
                           return now - t >= window;
                       }),
        data.violations.end());

    total_violations_++;

    if (config.auto_blacklist_threshold > 0 &&
        data.violations.size() >= config.auto_blacklist_threshold) {
        data.is_blacklisted = true;
        data.blacklist_expiry = now + std::chrono::duration_cast<Timestamp>(config.blacklist_duration);
    }
}

RateLimitResult RateLimiter::check_request(const std::string& identity,
                                           std::optional<ComponentType> component) {
    total_requests_++;

    // Check whitelist first
    if (get_config().enable_whitelist && is_whitelisted(identity)) {
        allowed_requests_++;
        return RateLimitResult::ALLOWED;
    }

    auto data = get_or_create_identity(identity);
    if (!data) {
        denied_requests_++;
        return RateLimitResult::RESOURCE_EXHAUSTED;
    }

    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(data->mutex);

    if (component && !data->component) {
        data->component = component;
    }

    data->stats.total_requests++;
    data->stats.last_request = now;

    if (blacklisted_locked(*data, now)) {
        denied_requests_++;
        data->stats.denied_requests++;
        return RateLimitResult::BLACKLISTED;
    }

    if (!data->window.try_consume(budget_locked(*data), now)) {
        denied_requests_++;
        data->stats.denied_requests++;
        note_violation_locked(*data, now);
        return RateLimitResult::RATE_LIMITED;
    }

    allowed_requests_++;
    data->stats.allowed_requests++;
    return RateLimitResult::ALLOWED;
}

Result<void> RateLimiter::acquire(const std::string& identity, std::optional<ComponentType> component) {
    switch (check_request(identity, component)) {
        case RateLimitResult::ALLOWED:
            return make_result();
        case RateLimitResult::RATE_LIMITED:
            return Failure(SBusError::RATE_LIMITED, identity);
        case RateLimitResult::BLACKLISTED:
            return Failure(SBusError::BLACKLISTED, identity);
        case RateLimitResult::RESOURCE_EXHAUSTED:
            return Failure(SBusError::RESOURCE_EXHAUSTED, "rate limiter identity table full");
    }
    return Failure(SBusError::INTERNAL_ERROR, "unknown rate limit result");
}

void RateLimiter::reset_component(const std::string& identity) {
    auto data = get_identity(identity);
    if (!data) {
        return;
    }
    std::lock_guard<std::mutex> lock(data->mutex);
    data->window.reset();
    data->violations.clear();
    data->is_blacklisted = false;
}

Result<void> RateLimiter::set_budget_override(const std::string& identity, uint32_t budget) {
    if (budget == 0) {
        return make_error<void>(SBusError::INVALID_PARAMETER, "budget must be positive");
    }
    auto data = get_or_create_identity(identity);
    if (!data) {
        return make_error<void>(SBusError::RESOURCE_EXHAUSTED, "Cannot create identity data");
    }
    std::lock_guard<std::mutex> lock(data->mutex);
    data->budget_override = budget;
    return make_result();
}

void RateLimiter::clear_budget_override(const std::string& identity) {
    auto data = get_identity(identity);
    if (data) {
        std::lock_guard<std::mutex> lock(data->mutex);
        data->budget_override.reset();
    }
}

void RateLimiter::record_violation(const std::string& identity, const std::string& violation_type) {
    (void)violation_type;
    auto data = get_or_create_identity(identity);
    if (!data) {
        return;
    }
    std::lock_guard<std::mutex> lock(data->mutex);
    note_violation_locked(*data, clock_->now());
}

Result<void> RateLimiter::add_to_whitelist(const std::string& identity) {
    std::unique_lock<std::shared_mutex> lock(whitelist_mutex_);
    whitelist_.insert(identity);
    return make_result();
}

Result<void> RateLimiter::remove_from_whitelist(const std::string& identity) {
    std::unique_lock<std::shared_mutex> lock(whitelist_mutex_);
    whitelist_.erase(identity);
    return make_result();
}

bool RateLimiter::is_whitelisted(const std::string& identity) const {
    std::shared_lock<std::shared_mutex> lock(whitelist_mutex_);
    return whitelist_.find(identity) != whitelist_.end();
}

Result<void> RateLimiter::blacklist_identity(const std::string& identity, std::chrono::seconds duration) {
    auto data = get_or_create_identity(identity);
    if (!data) {
        return make_error<void>(SBusError::RESOURCE_EXHAUSTED, "Cannot create identity data");
    }

    auto blacklist_duration = duration.count() > 0 ? duration : get_config().blacklist_duration;
    std::lock_guard<std::mutex> lock(data->mutex);
    data->is_blacklisted = true;
    data->blacklist_expiry = clock_->now() + std::chrono::duration_cast<Timestamp>(blacklist_duration);
    return make_result();
}

Result<void> RateLimiter::remove_from_blacklist(const std::string& identity) {
    auto data = get_identity(identity);
    if (data) {
        std::lock_guard<std::mutex> lock(data->mutex);
        data->is_blacklisted = false;
        data->violations.clear();
    }
    return make_result();
}

bool RateLimiter::is_blacklisted(const std::string& identity) {
    auto data = get_identity(identity);
    if (!data) {
        return false;
    }
    std::lock_guard<std::mutex> lock(data->mutex);
    return blacklisted_locked(*data, clock_->now());
}

Result<RateLimitStats> RateLimiter::get_identity_stats(const std::string& identity) const {
    auto data = get_identity(identity);
    if (!data) {
        return make_error<RateLimitStats>(SBusError::INVALID_PARAMETER, "Identity not found");
    }
    std::lock_guard<std::mutex> lock(data->mutex);
    return make_result(data->stats);
}

RateLimiter::OverallStats RateLimiter::get_overall_stats() const {
    OverallStats stats;
    stats.creation_time = creation_time_;
    stats.total_requests = total_requests_.load();
    stats.allowed_requests = allowed_requests_.load();
    stats.denied_requests = denied_requests_.load();
    stats.total_violations = total_violations_.load();

    Timestamp now = clock_->now();
    {
        std::shared_lock<std::shared_mutex> lock(identities_mutex_);
        stats.total_identities = identities_.size();
        for (const auto& entry : identities_) {
            std::lock_guard<std::mutex> data_lock(entry.second->mutex);
            if (entry.second->is_blacklisted && now < entry.second->blacklist_expiry) {
                stats.blacklisted_identities++;
            }
        }
    }

    {
        std::shared_lock<std::shared_mutex> lock(whitelist_mutex_);
        stats.whitelisted_identities = whitelist_.size();
    }

    return stats;
}

size_t RateLimiter::cleanup_expired_entries() {
    Timestamp now = clock_->now();
    auto idle = std::chrono::duration_cast<Timestamp>(get_config().violation_window);

    std::unique_lock<std::shared_mutex> lock(identities_mutex_);
    return sweep_idle_locked(now, idle, false);
}

size_t RateLimiter::sweep_idle_locked(Timestamp now, Timestamp idle, bool keep_recent_violations) {
    auto window = std::chrono::duration_cast<Timestamp>(get_config().violation_window);
    size_t removed = 0;
    for (auto it = identities_.begin(); it != identities_.end();) {
        bool remove;
        {
            IdentityData& data = *it->second;
            std::lock_guard<std::mutex> data_lock(data.mutex);
            blacklisted_locked(data, now);
            remove = !data.is_blacklisted &&
                     !data.budget_override &&
                     now - data.stats.last_request >= idle;
            if (remove && keep_recent_violations) {
                // Still counting towards an automatic blacklist
                remove = std::none_of(data.violations.begin(), data.violations.end(),
                                      [now, window](Timestamp t) { return now - t < window; });
            }
        }
        if (remove) {
            it = identities_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

Result<void> RateLimiter::update_config(const RateLimitConfig& new_config) {
    if (new_config.window.count() <= 0 || new_config.default_budget == 0) {
        return make_error<void>(SBusError::INVALID_CONFIGURATION, "window and default budget must be positive");
    }
    if (new_config.max_identities == 0) {
        return make_error<void>(SBusError::INVALID_CONFIGURATION, "identity capacity must be positive");
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = new_config;
    }

    // Windows restart under the new size
    std::shared_lock<std::shared_mutex> lock(identities_mutex_);
    for (auto& entry : identities_) {
        std::lock_guard<std::mutex> data_lock(entry.second->mutex);
        entry.second->window.resize(std::chrono::duration_cast<std::chrono::milliseconds>(new_config.window));
    }
    return make_result();
}

RateLimitConfig RateLimiter::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void RateLimiter::reset() {
    std::unique_lock<std::shared_mutex> identities_lock(identities_mutex_);
    std::unique_lock<std::shared_mutex> whitelist_lock(whitelist_mutex_);

    identities_.clear();
    whitelist_.clear();

    total_requests_ = 0;
    allowed_requests_ = 0;
    denied_requests_ = 0;
    total_violations_ = 0;

    creation_time_ = clock_->now();
}

// Private helper methods
std::shared_ptr<IdentityData> RateLimiter::get_or_create_identity(const std::string& identity) {
    {
        std::shared_lock<std::shared_mutex> lock(identities_mutex_);
        auto it = identities_.find(identity);
        if (it != identities_.end()) {
            return it->second;
        }
    }

    RateLimitConfig config = get_config();

    std::unique_lock<std::shared_mutex> lock(identities_mutex_);
    // Double-check after acquiring write lock
    auto it = identities_.find(identity);
    if (it != identities_.end()) {
        return it->second;
    }
    Timestamp now = clock_->now();
    if (identities_.size() >= config.max_identities) {
        // An identity idle for a whole window holds no live count
        sweep_idle_locked(now, std::chrono::duration_cast<Timestamp>(config.window),
                          config.auto_blacklist_threshold > 0);
        if (identities_.size() >= config.max_identities) {
            return nullptr;
        }
    }

    auto data = std::make_shared<IdentityData>(config);
    data->stats.first_seen = now;
    identities_[identity] = data;
    return data;
}

std::shared_ptr<IdentityData> RateLimiter::get_identity(const std::string& identity) const {
    std::shared_lock<std::shared_mutex> lock(identities_mutex_);
    auto it = identities_.find(identity);
    return (it != identities_.end()) ? it->second : nullptr;
}

// Factory implementations
std::unique_ptr<RateLimiter> RateLimiterFactory::create_development(std::shared_ptr<Clock> clock) {
    RateLimitConfig config;
    config.default_budget = 1000;
    config.blacklist_duration = std::chrono::seconds{60};
    return std::make_unique<RateLimiter>(config, std::move(clock));
}

std::unique_ptr<RateLimiter> RateLimiterFactory::create_production(std::shared_ptr<Clock> clock) {
    RateLimitConfig config;
    config.auto_blacklist_threshold = 50;
    config.blacklist_duration = std::chrono::seconds{300};
    return std::make_unique<RateLimiter>(config, std::move(clock));
}

std::unique_ptr<RateLimiter> RateLimiterFactory::create_high_security(std::shared_ptr<Clock> clock) {
    RateLimitConfig config;
    config.default_budget = 50;
    config.auto_blacklist_threshold = 10;
    config.blacklist_duration = std::chrono::seconds{1800};
    return std::make_unique<RateLimiter>(config, std::move(clock));
}

}  // namespace security
}  // namespace v1
}  // namespace sbus
