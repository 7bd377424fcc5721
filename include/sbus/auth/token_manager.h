#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/crypto/provider.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sbus {
namespace v1 {
namespace auth {

/**
 * Short-lived authorization tokens bound to a context string.
 *
 * Token layout before base64url encoding:
 *   nonce(12) ‖ expiry(8, big-endian seconds) ‖ HMAC-SHA256(master, context ‖ nonce ‖ expiry)
 *
 * Validation requires a well-formed encoding, an unexpired token and a
 * signature that matches under constant-time comparison.
 */
class SBUS_API TokenManager {
public:
    static constexpr size_t NONCE_LENGTH = 12;
    static constexpr size_t EXPIRY_LENGTH = 8;
    static constexpr size_t TOKEN_LENGTH = NONCE_LENGTH + EXPIRY_LENGTH + HMAC_TAG_LENGTH;

    struct IssuedToken {
        std::string context;
        std::string value;
        uint64_t expires_at_secs = 0;
    };

    TokenManager(std::shared_ptr<crypto::CryptoProvider> provider,
                 std::vector<uint8_t> master_key,
                 std::shared_ptr<Clock> clock);
    ~TokenManager();

    TokenManager(const TokenManager&) = delete;
    TokenManager& operator=(const TokenManager&) = delete;

    Result<std::string> generate(const std::string& context, std::chrono::seconds valid_for);

    /**
     * @return INVALID_TOKEN for bad encoding or signature, TOKEN_EXPIRED
     *         once past expiry, TOKEN_REVOKED after revoke()
     */
    Result<void> validate(const std::string& context, const std::string& token) const;

    // Same checks against the context the token was issued for
    Result<void> validate_issued(const std::string& token) const;

    /**
     * Revoked tokens stay refused until their own expiry, after which the
     * expiry check rejects them anyway and the entry is dropped.
     */
    void revoke(const std::string& token);
    size_t revoked_count() const;

    std::vector<IssuedToken> list_tokens() const;
    size_t purge_expired();

private:
    void drop_expired_revocations_locked(uint64_t now);

    Result<std::vector<uint8_t>> sign(const std::string& context,
                                      const uint8_t* nonce,
                                      const uint8_t* expiry) const;

    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::vector<uint8_t> master_key_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::map<std::string, IssuedToken> issued_;           // keyed by context
    std::unordered_map<std::string, uint64_t> revoked_;    // token -> expiry seconds
};

} // namespace auth
} // namespace v1
} // namespace sbus
