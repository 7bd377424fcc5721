#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/error_reporter.h>
#include <sbus/crypto/provider.h>

#include <chrono>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sbus {
namespace v1 {
namespace auth {

enum class SignatureAlgorithm : uint8_t {
    HMAC_SHA256,
    HMAC_SHA512
};

/**
 * Session token held by one component instance.
 *
 * token_value = base64url(HMAC-SHA256(master, token_id)). public_key is the
 * base64url SHA-256 fingerprint of the per-token signing key; the key
 * itself never leaves the manager.
 */
struct ComponentToken {
    std::string token_id;
    ComponentType component = ComponentType::KERNEL;
    uint32_t instance_id = 0;
    std::string token_value;
    Timestamp created_at{0};
    Timestamp expires_at{0};
    std::string public_key;
    SignatureAlgorithm algorithm = SignatureAlgorithm::HMAC_SHA256;
};

// Action signed with a token's signing key over "message|nonce|token_id"
struct ComponentSignature {
    std::string token_id;
    std::string message;
    std::string signature;
    Timestamp signed_at{0};
    std::string nonce;
};

/**
 * Issues, validates, rotates and revokes per-component session tokens.
 *
 * Thread-safe; all state is behind one reader/writer lock.
 */
class SBUS_API ComponentTokenManager {
public:
    static constexpr size_t SIGNING_KEY_LENGTH = 32;

    ComponentTokenManager(std::shared_ptr<crypto::CryptoProvider> provider,
                          std::vector<uint8_t> master_key,
                          std::shared_ptr<Clock> clock,
                          std::shared_ptr<ErrorReporter> reporter = nullptr);
    ~ComponentTokenManager();

    ComponentTokenManager(const ComponentTokenManager&) = delete;
    ComponentTokenManager& operator=(const ComponentTokenManager&) = delete;

    Result<ComponentToken> issue_session_token(ComponentType component,
                                               uint32_t instance_id,
                                               std::chrono::seconds valid_for);

    /**
     * @return TOKEN_REVOKED, INVALID_TOKEN (unknown id or wrong value) or
     *         TOKEN_EXPIRED
     */
    Result<void> validate_token(const std::string& token_id, const std::string& token_value) const;

    // Looks the token up by value; used at channel boundaries
    Result<ComponentToken> validate_token_value(const std::string& token_value) const;

    Result<ComponentSignature> sign_action(const std::string& token_id,
                                           const std::string& message,
                                           const std::string& nonce) const;

    // SIGNATURE_MISMATCH when the signature does not verify
    Result<void> verify_signature(const ComponentSignature& signature) const;

    Result<void> revoke_token(const std::string& token_id);

    // Revokes the old token and issues a new one for the same component
    Result<ComponentToken> rotate_token(const std::string& token_id, std::chrono::seconds valid_for);

    size_t active_token_count() const;
    size_t purge_expired();

    static SignatureAlgorithm algorithm_for(ComponentType component);

private:
    struct Entry {
        ComponentToken token;
        std::vector<uint8_t> signing_key;
    };

    std::string generate_token_id(ComponentType component, uint32_t instance_id) const;
    Result<std::string> compute_token_value(const std::string& token_id) const;
    Result<std::vector<uint8_t>> compute_signature(const Entry& entry,
                                                   const std::string& message,
                                                   const std::string& nonce) const;
    Result<void> check_entry(const Entry& entry) const;

    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::vector<uint8_t> master_key_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ErrorReporter> reporter_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> tokens_;
    std::unordered_map<std::string, std::string> id_by_value_;
    std::unordered_set<std::string> revoked_;
};

} // namespace auth
} // namespace v1
} // namespace sbus
