#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>
#include <sbus/crypto/provider.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sbus {
namespace v1 {
namespace session {

struct RotationKey {
    uint64_t key_id = 0;
    std::vector<uint8_t> key_material;
    Timestamp created_at{0};
    uint64_t operation_count = 0;
    bool is_active = false;
};

struct KeyRotationStats {
    uint64_t active_key_id = 0;
    uint64_t operations_with_current_key = 0;
    uint64_t time_since_rotation_secs = 0;
    size_t total_historical_keys = 0;
    bool needs_rotation = false;
};

/**
 * Long-term key rotation by time, operation count or both.
 *
 * The initial key has id 1. Retired keys stay retrievable by id until
 * more than max_history newer retirements push them out, oldest first.
 * Fresh key material comes from the crypto provider.
 */
class SBUS_API KeyRotationManager {
public:
    KeyRotationManager(const KeyRotationConfig& config,
                       std::vector<uint8_t> initial_key,
                       std::shared_ptr<crypto::CryptoProvider> provider,
                       std::shared_ptr<Clock> clock);
    ~KeyRotationManager();

    KeyRotationManager(const KeyRotationManager&) = delete;
    KeyRotationManager& operator=(const KeyRotationManager&) = delete;

    RotationKey get_active_key() const;
    void record_operation();

    // true when a rotation happened
    Result<bool> rotate_if_needed();

    // Rotates unconditionally and returns the new key id
    Result<uint64_t> force_rotation();

    std::optional<RotationKey> get_key_by_id(uint64_t key_id) const;

    KeyRotationStats stats() const;
    void clear_historical();

private:
    bool needs_rotation_locked(Timestamp now) const;
    Result<uint64_t> rotate_locked(Timestamp now);

    KeyRotationConfig config_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    RotationKey active_;
    std::map<uint64_t, RotationKey> history_;
    uint64_t next_key_id_ = 2;
};

} // namespace session
} // namespace v1
} // namespace sbus
