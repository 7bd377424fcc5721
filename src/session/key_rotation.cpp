#include <sbus/session/key_rotation.h>
#include <sbus/crypto/crypto_utils.h>

namespace sbus {
namespace v1 {
namespace session {

KeyRotationManager::KeyRotationManager(const KeyRotationConfig& config,
                                       std::vector<uint8_t> initial_key,
                                       std::shared_ptr<crypto::CryptoProvider> provider,
                                       std::shared_ptr<Clock> clock)
    : config_(config)
    , provider_(std::move(provider))
    , clock_(std::move(clock)) {
    active_.key_id = 1;
    active_.key_material = std::move(initial_key);
    active_.created_at = clock_->now();
    active_.is_active = true;
}

KeyRotationManager::~KeyRotationManager() {
    crypto::utils::secure_zero(active_.key_material);
    for (auto& entry : history_) {
        crypto::utils::secure_zero(entry.second.key_material);
    }
}

bool KeyRotationManager::needs_rotation_locked(Timestamp now) const {
    bool time_expired = now - active_.created_at >= std::chrono::duration_cast<Timestamp>(config_.interval);
    bool ops_exceeded = active_.operation_count >= config_.max_operations;

    switch (config_.policy) {
        case KeyRotationPolicy::TIME_BASED: return time_expired;
        case KeyRotationPolicy::OPERATION_BASED: return ops_exceeded;
        case KeyRotationPolicy::HYBRID: return time_expired || ops_exceeded;
    }
    return false;
}

Result<uint64_t> KeyRotationManager::rotate_locked(Timestamp now) {
    auto material = SBUS_TRY(crypto::utils::generate_random(*provider_, config_.key_length));

    RotationKey retired = std::move(active_);
    retired.is_active = false;
    uint64_t retired_id = retired.key_id;
    history_[retired_id] = std::move(retired);

    while (history_.size() > config_.max_history) {
        crypto::utils::secure_zero(history_.begin()->second.key_material);
        history_.erase(history_.begin());
    }

    active_ = RotationKey{};
    active_.key_id = next_key_id_++;
    active_.key_material = std::move(material);
    active_.created_at = now;
    active_.is_active = true;
    return active_.key_id;
}

RotationKey KeyRotationManager::get_active_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void KeyRotationManager::record_operation() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.operation_count++;
}

Result<bool> KeyRotationManager::rotate_if_needed() {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!needs_rotation_locked(now)) {
        return false;
    }
    SBUS_TRY(rotate_locked(now));
    return true;
}

Result<uint64_t> KeyRotationManager::force_rotation() {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    return rotate_locked(now);
}

std::optional<RotationKey> KeyRotationManager::get_key_by_id(uint64_t key_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.key_id == key_id) {
        return active_;
    }
    auto it = history_.find(key_id);
    if (it == history_.end()) {
        return std::nullopt;
    }
    return it->second;
}

KeyRotationStats KeyRotationManager::stats() const {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);

    KeyRotationStats stats;
    stats.active_key_id = active_.key_id;
    stats.operations_with_current_key = active_.operation_count;
    stats.time_since_rotation_secs = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now - active_.created_at).count());
    stats.total_historical_keys = history_.size();
    stats.needs_rotation = needs_rotation_locked(now);
    return stats;
}

void KeyRotationManager::clear_historical() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : history_) {
        crypto::utils::secure_zero(entry.second.key_material);
    }
    history_.clear();
}

} // namespace session
} // namespace v1
} // namespace sbus
