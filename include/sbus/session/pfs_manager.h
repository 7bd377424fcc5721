#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>
#include <sbus/crypto/provider.h>

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace sbus {
namespace v1 {
namespace session {

using EphemeralKeyId = uint64_t;

/**
 * Public view of an ephemeral X25519 key
 */
struct EphemeralKey {
    EphemeralKeyId key_id = 0;
    std::vector<uint8_t> public_key;
    Timestamp generated_at{0};
    std::chrono::seconds ttl{0};
    bool has_shared_secret = false;
};

struct PfsStats {
    size_t total_keys = 0;
    size_t valid_keys = 0;
    size_t keys_with_secret = 0;
    uint64_t generated = 0;
    uint64_t expired = 0;
};

/**
 * Ephemeral key agreement for forward secrecy.
 *
 * Key ids increase monotonically from 1. The shared secret of a key is
 * computed once, on the first exchange, and never recomputed; later calls
 * return the stored secret. Keys are valid strictly before
 * generated_at + ttl and private halves are cleansed when a key goes away.
 */
class SBUS_API PfsManager {
public:
    PfsManager(const PfsConfig& config,
               std::shared_ptr<crypto::CryptoProvider> provider,
               std::shared_ptr<Clock> clock);
    ~PfsManager();

    PfsManager(const PfsManager&) = delete;
    PfsManager& operator=(const PfsManager&) = delete;

    // RESOURCE_EXHAUSTED once max_keys valid keys are live
    Result<EphemeralKey> generate_ephemeral_key();

    /**
     * @return PFS_KEY_EXPIRED for an expired key, KEY_NOT_FOUND for an
     *         unknown one, KEY_EXCHANGE_FAILED for a bad peer key
     */
    Result<std::vector<uint8_t>> compute_shared_secret(EphemeralKeyId key_id,
                                                       const std::vector<uint8_t>& peer_public_key);

    std::optional<std::vector<uint8_t>> get_shared_secret(EphemeralKeyId key_id) const;
    std::optional<std::vector<uint8_t>> get_public_key(EphemeralKeyId key_id) const;

    bool has_valid_key(EphemeralKeyId key_id) const;
    bool remove_key(EphemeralKeyId key_id);

    size_t cleanup_expired();
    size_t active_key_count() const;
    PfsStats stats() const;
    void clear_all();

private:
    struct Entry {
        EphemeralKey info;
        std::vector<uint8_t> private_key;
        std::optional<std::vector<uint8_t>> shared_secret;

        bool is_valid(Timestamp now) const {
            return now < info.generated_at + std::chrono::duration_cast<Timestamp>(info.ttl);
        }
    };

    static void wipe(Entry& entry);

    PfsConfig config_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::shared_ptr<Clock> clock_;

    mutable std::shared_mutex mutex_;
    std::map<EphemeralKeyId, Entry> keys_;
    EphemeralKeyId next_key_id_ = 1;
    uint64_t generated_ = 0;
    uint64_t expired_ = 0;
};

} // namespace session
} // namespace v1
} // namespace sbus
