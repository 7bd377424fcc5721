#ifndef SBUS_CRYPTO_SESSION_KEYS_H
#define SBUS_CRYPTO_SESSION_KEYS_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/crypto/provider.h>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace sbus {
namespace v1 {
namespace crypto {

/**
 * Traffic keys of one established session.
 *
 * Derived once per handshake and shared read-only by both record layer
 * directions. The client writes with the client keys and the server reads
 * with them; the reverse direction uses the server keys.
 */
struct SBUS_API SessionKeys {
    static constexpr size_t WRITE_KEY_LENGTH = 16;
    static constexpr size_t IV_LENGTH = 12;
    static constexpr size_t MAC_KEY_LENGTH = 32;

    std::vector<uint8_t> client_write_key;
    std::vector<uint8_t> server_write_key;
    std::vector<uint8_t> client_write_iv;
    std::vector<uint8_t> server_write_iv;
    std::vector<uint8_t> client_mac_key;
    std::vector<uint8_t> server_mac_key;

    SessionKeys() = default;
    SessionKeys(const SessionKeys&) = default;
    SessionKeys& operator=(const SessionKeys&) = default;
    SessionKeys(SessionKeys&&) = default;
    SessionKeys& operator=(SessionKeys&&) = default;
    ~SessionKeys();

    /**
     * HKDF-SHA256(master_key, salt = client_random ‖ server_random,
     * info = "secure-bus key expansion").
     *
     * Deterministic for the same inputs. Both randoms must be
     * RANDOM_LENGTH bytes, not all zero, and distinct.
     */
    static Result<SessionKeys> derive(CryptoProvider& provider,
                                      const std::vector<uint8_t>& master_key,
                                      const std::vector<uint8_t>& client_random,
                                      const std::vector<uint8_t>& server_random);

    // Successor traffic key for key rotation
    static Result<std::vector<uint8_t>> next_generation(CryptoProvider& provider,
                                                        const std::vector<uint8_t>& key);

    // Secret cached for abbreviated handshakes of this session
    static Result<std::vector<uint8_t>> resumption_secret(CryptoProvider& provider,
                                                          const std::vector<uint8_t>& master_key,
                                                          const std::vector<uint8_t>& client_random,
                                                          const std::vector<uint8_t>& server_random);

    // Keys used by whoever writes in the given role's direction
    const std::vector<uint8_t>& write_key(ConnectionRole writer) const;
    const std::vector<uint8_t>& write_iv(ConnectionRole writer) const;
    const std::vector<uint8_t>& mac_key(ConnectionRole writer) const;

    bool empty() const { return client_write_key.empty(); }
    void clear();
};

/**
 * Remembers every (client_random, server_random) pair keys were derived
 * from, so the same key material is never produced twice.
 *
 * Entries are per role: the client and server ends of one session derive
 * from the same pair and may share a registry.
 */
class SBUS_API KeyMaterialRegistry {
public:
    // KEY_MATERIAL_REUSED if the pair was registered before
    Result<void> register_pair(ConnectionRole role,
                               const std::vector<uint8_t>& client_random,
                               const std::vector<uint8_t>& server_random);

    bool contains(ConnectionRole role,
                  const std::vector<uint8_t>& client_random,
                  const std::vector<uint8_t>& server_random) const;

    size_t size() const;
    void clear();

private:
    static std::string pair_key(ConnectionRole role,
                                const std::vector<uint8_t>& client_random,
                                const std::vector<uint8_t>& server_random);

    mutable std::mutex mutex_;
    std::unordered_set<std::string> pairs_;
};

} // namespace crypto
} // namespace v1
} // namespace sbus

#endif // SBUS_CRYPTO_SESSION_KEYS_H
