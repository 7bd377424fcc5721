#include <sbus/auth/component_token.h>
#include <sbus/crypto/crypto_utils.h>

#include <cstdio>
#include <mutex>

namespace sbus {
namespace v1 {
namespace auth {

ComponentTokenManager::ComponentTokenManager(std::shared_ptr<crypto::CryptoProvider> provider,
                                             std::vector<uint8_t> master_key,
                                             std::shared_ptr<Clock> clock,
                                             std::shared_ptr<ErrorReporter> reporter)
    : provider_(std::move(provider))
    , master_key_(std::move(master_key))
    , clock_(std::move(clock))
    , reporter_(std::move(reporter)) {}

ComponentTokenManager::~ComponentTokenManager() {
    crypto::utils::secure_zero(master_key_);
    for (auto& entry : tokens_) {
        crypto::utils::secure_zero(entry.second.signing_key);
    }
}

SignatureAlgorithm ComponentTokenManager::algorithm_for(ComponentType component) {
    switch (component) {
        case ComponentType::DEVICE_INTERFACES:
        case ComponentType::DISPLAY:
        case ComponentType::AUDIO:
        case ComponentType::SECURITY_DRIVER:
        case ComponentType::STORAGE_DRIVER:
            return SignatureAlgorithm::HMAC_SHA512;
        default:
            return SignatureAlgorithm::HMAC_SHA256;
    }
}

std::string ComponentTokenManager::generate_token_id(ComponentType component, uint32_t instance_id) const {
    uint64_t suffix = 0;
    auto random = crypto::utils::generate_random(*provider_, 8);
    if (random) {
        suffix = crypto::utils::load_u64_le(random->data());
    }

    char tail[17];
    std::snprintf(tail, sizeof(tail), "%016llx", static_cast<unsigned long long>(suffix));

    return to_string(component) + ":" + std::to_string(instance_id) + ":" +
           std::to_string(clock_->now_ms()) + ":" + tail;
}

Result<std::string> ComponentTokenManager::compute_token_value(const std::string& token_id) const {
    auto tag = SBUS_TRY(crypto::utils::hmac_sha256(*provider_, master_key_,
                                                   crypto::utils::to_bytes(token_id)));
    return crypto::utils::base64url_encode(tag);
}

Result<ComponentToken> ComponentTokenManager::issue_session_token(ComponentType component,
                                                                  uint32_t instance_id,
                                                                  std::chrono::seconds valid_for) {
    if (master_key_.empty()) {
        return make_error<ComponentToken>(SBusError::INVALID_CONFIGURATION, "empty master key");
    }

    Entry entry;
    entry.signing_key = SBUS_TRY(crypto::utils::generate_random(*provider_, SIGNING_KEY_LENGTH));

    ComponentToken& token = entry.token;
    token.token_id = generate_token_id(component, instance_id);
    token.component = component;
    token.instance_id = instance_id;
    token.token_value = SBUS_TRY(compute_token_value(token.token_id));
    token.created_at = clock_->now();
    token.expires_at = token.created_at + std::chrono::duration_cast<Timestamp>(valid_for);
    token.algorithm = algorithm_for(component);
    token.public_key = crypto::utils::base64url_encode(
        SBUS_TRY(crypto::utils::sha256(*provider_, entry.signing_key)));

    ComponentToken issued = token;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    id_by_value_[issued.token_value] = issued.token_id;
    tokens_[issued.token_id] = std::move(entry);
    return issued;
}

Result<void> ComponentTokenManager::check_entry(const Entry& entry) const {
    if (clock_->now() >= entry.token.expires_at) {
        return Failure(SBusError::TOKEN_EXPIRED, entry.token.token_id);
    }
    return make_result();
}

Result<void> ComponentTokenManager::validate_token(const std::string& token_id,
                                                   const std::string& token_value) const {
    if (token_id.empty() || token_value.empty()) {
        return Failure(SBusError::INVALID_TOKEN, "empty token");
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (revoked_.count(token_id) > 0) {
        SBUS_REPORT_WARNING(reporter_, SBusError::TOKEN_REVOKED, "revoked token presented");
        return Failure(SBusError::TOKEN_REVOKED, token_id);
    }

    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) {
        return Failure(SBusError::INVALID_TOKEN, "unknown token id");
    }
    SBUS_TRY_VOID(check_entry(it->second));

    if (!crypto::utils::constant_time_compare(it->second.token.token_value, token_value)) {
        return Failure(SBusError::INVALID_TOKEN, "token value mismatch");
    }
    return make_result();
}

Result<ComponentToken> ComponentTokenManager::validate_token_value(const std::string& token_value) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto id = id_by_value_.find(token_value);
    if (id == id_by_value_.end()) {
        return make_error<ComponentToken>(SBusError::INVALID_TOKEN, "unknown token");
    }
    auto it = tokens_.find(id->second);
    if (it == tokens_.end()) {
        return make_error<ComponentToken>(SBusError::TOKEN_REVOKED, id->second);
    }
    SBUS_TRY_VOID(check_entry(it->second));
    return it->second.token;
}

Result<std::vector<uint8_t>> ComponentTokenManager::compute_signature(const Entry& entry,
                                                                      const std::string& message,
                                                                      const std::string& nonce) const {
    crypto::HMACParams params;
    params.key = entry.signing_key;
    params.data = crypto::utils::to_bytes(message + "|" + nonce + "|" + entry.token.token_id);
    params.algorithm = entry.token.algorithm == SignatureAlgorithm::HMAC_SHA512
                           ? crypto::HashAlgorithm::SHA512
                           : crypto::HashAlgorithm::SHA256;
    auto mac = provider_->compute_hmac(params);
    crypto::utils::secure_zero(params.key);
    return mac;
}

Result<ComponentSignature> ComponentTokenManager::sign_action(const std::string& token_id,
                                                              const std::string& message,
                                                              const std::string& nonce) const {
    if (message.empty() || nonce.empty()) {
        return make_error<ComponentSignature>(SBusError::INVALID_PARAMETER, "empty message or nonce");
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) {
        return make_error<ComponentSignature>(SBusError::INVALID_TOKEN, "unknown token id");
    }
    SBUS_TRY_VOID(check_entry(it->second));

    auto mac = SBUS_TRY(compute_signature(it->second, message, nonce));

    ComponentSignature signature;
    signature.token_id = token_id;
    signature.message = message;
    signature.signature = crypto::utils::base64url_encode(mac);
    signature.signed_at = clock_->now();
    signature.nonce = nonce;
    return signature;
}

Result<void> ComponentTokenManager::verify_signature(const ComponentSignature& signature) const {
    auto provided = crypto::utils::base64url_decode(signature.signature);
    if (!provided) {
        return Failure(SBusError::SIGNATURE_MISMATCH, "malformed signature");
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(signature.token_id);
    if (it == tokens_.end()) {
        return Failure(SBusError::INVALID_TOKEN, "unknown token id");
    }

    auto expected = SBUS_TRY(compute_signature(it->second, signature.message, signature.nonce));
    if (!crypto::utils::constant_time_compare(expected, *provided)) {
        SBUS_REPORT_WARNING(reporter_, SBusError::SIGNATURE_MISMATCH, "component signature mismatch");
        return Failure(SBusError::SIGNATURE_MISMATCH, signature.token_id);
    }
    return make_result();
}

Result<void> ComponentTokenManager::revoke_token(const std::string& token_id) {
    if (token_id.empty()) {
        return Failure(SBusError::INVALID_PARAMETER, "empty token id");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    revoked_.insert(token_id);
    auto it = tokens_.find(token_id);
    if (it != tokens_.end()) {
        id_by_value_.erase(it->second.token.token_value);
        crypto::utils::secure_zero(it->second.signing_key);
        tokens_.erase(it);
    }
    return make_result();
}

Result<ComponentToken> ComponentTokenManager::rotate_token(const std::string& token_id,
                                                           std::chrono::seconds valid_for) {
    ComponentType component;
    uint32_t instance_id;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = tokens_.find(token_id);
        if (it == tokens_.end()) {
            return make_error<ComponentToken>(SBusError::INVALID_TOKEN, "unknown token id");
        }
        component = it->second.token.component;
        instance_id = it->second.token.instance_id;
    }

    SBUS_TRY_VOID(revoke_token(token_id));
    return issue_session_token(component, instance_id, valid_for);
}

size_t ComponentTokenManager::active_token_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tokens_.size();
}

size_t ComponentTokenManager::purge_expired() {
    Timestamp now = clock_->now();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t purged = 0;
    for (auto it = tokens_.begin(); it != tokens_.end();) {
        if (now >= it->second.token.expires_at) {
            id_by_value_.erase(it->second.token.token_value);
            crypto::utils::secure_zero(it->second.signing_key);
            it = tokens_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    return purged;
}

} // namespace auth
} // namespace v1
} // namespace sbus
