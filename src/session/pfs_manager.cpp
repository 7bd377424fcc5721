#include <sbus/session/pfs_manager.h>
#include <sbus/crypto/crypto_utils.h>

#include <mutex>

namespace sbus {
namespace v1 {
namespace session {

PfsManager::PfsManager(const PfsConfig& config,
                       std::shared_ptr<crypto::CryptoProvider> provider,
                       std::shared_ptr<Clock> clock)
    : config_(config)
    , provider_(std::move(provider))
    , clock_(std::move(clock)) {}

PfsManager::~PfsManager() {
    clear_all();
}

void PfsManager::wipe(Entry& entry) {
    crypto::utils::secure_zero(entry.private_key);
    if (entry.shared_secret) {
        crypto::utils::secure_zero(*entry.shared_secret);
    }
}

Result<EphemeralKey> PfsManager::generate_ephemeral_key() {
    auto pair = SBUS_TRY(provider_->generate_x25519_key_pair());
    Timestamp now = clock_->now();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t live = 0;
    for (const auto& entry : keys_) {
        if (entry.second.is_valid(now)) {
            ++live;
        }
    }
    if (live >= config_.max_keys) {
        crypto::utils::secure_zero(pair.private_key);
        return make_error<EphemeralKey>(SBusError::RESOURCE_EXHAUSTED, "ephemeral key limit reached");
    }

    Entry entry;
    entry.info.key_id = next_key_id_++;
    entry.info.public_key = pair.public_key;
    entry.info.generated_at = now;
    entry.info.ttl = config_.key_lifetime;
    entry.private_key = std::move(pair.private_key);

    EphemeralKey info = entry.info;
    keys_.emplace(info.key_id, std::move(entry));
    generated_++;
    return info;
}

Result<std::vector<uint8_t>> PfsManager::compute_shared_secret(EphemeralKeyId key_id,
                                                               const std::vector<uint8_t>& peer_public_key) {
    if (peer_public_key.size() != crypto::X25519_KEY_LENGTH) {
        return make_error<std::vector<uint8_t>>(SBusError::KEY_EXCHANGE_FAILED, "peer key length");
    }

    Timestamp now = clock_->now();
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = keys_.find(key_id);
    if (it == keys_.end()) {
        return make_error<std::vector<uint8_t>>(SBusError::KEY_NOT_FOUND, "ephemeral key " + std::to_string(key_id));
    }

    Entry& entry = it->second;
    if (!entry.is_valid(now)) {
        return make_error<std::vector<uint8_t>>(SBusError::PFS_KEY_EXPIRED, "ephemeral key " + std::to_string(key_id));
    }

    if (entry.shared_secret) {
        return *entry.shared_secret;
    }

    crypto::KeyExchangeParams params;
    params.private_key = entry.private_key;
    params.peer_public_key = peer_public_key;
    auto secret = provider_->perform_key_exchange(params);
    crypto::utils::secure_zero(params.private_key);
    if (!secret) {
        return secret;
    }

    entry.shared_secret = *secret;
    entry.info.has_shared_secret = true;
    // Private half is no longer needed once the secret exists
    crypto::utils::secure_zero(entry.private_key);
    return secret;
}

std::optional<std::vector<uint8_t>> PfsManager::get_shared_secret(EphemeralKeyId key_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = keys_.find(key_id);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second.shared_secret;
}

std::optional<std::vector<uint8_t>> PfsManager::get_public_key(EphemeralKeyId key_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = keys_.find(key_id);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second.info.public_key;
}

bool PfsManager::has_valid_key(EphemeralKeyId key_id) const {
    Timestamp now = clock_->now();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = keys_.find(key_id);
    return it != keys_.end() && it->second.is_valid(now);
}

bool PfsManager::remove_key(EphemeralKeyId key_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = keys_.find(key_id);
    if (it == keys_.end()) {
        return false;
    }
    wipe(it->second);
    keys_.erase(it);
    return true;
}

size_t PfsManager::cleanup_expired() {
    Timestamp now = clock_->now();
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = keys_.begin(); it != keys_.end();) {
        if (!it->second.is_valid(now)) {
            wipe(it->second);
            it = keys_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    expired_ += removed;
    return removed;
}

size_t PfsManager::active_key_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return keys_.size();
}

PfsStats PfsManager::stats() const {
    Timestamp now = clock_->now();
    std::shared_lock<std::shared_mutex> lock(mutex_);

    PfsStats stats;
    stats.total_keys = keys_.size();
    stats.generated = generated_;
    stats.expired = expired_;
    for (const auto& entry : keys_) {
        if (entry.second.is_valid(now)) {
            stats.valid_keys++;
            if (entry.second.shared_secret) {
                stats.keys_with_secret++;
            }
        }
    }
    return stats;
}

void PfsManager::clear_all() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& entry : keys_) {
        wipe(entry.second);
    }
    keys_.clear();
}

} // namespace session
} // namespace v1
} // namespace sbus
