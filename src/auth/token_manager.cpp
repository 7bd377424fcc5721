#include <sbus/auth/token_manager.h>
#include <sbus/crypto/crypto_utils.h>

namespace sbus {
namespace v1 {
namespace auth {

TokenManager::TokenManager(std::shared_ptr<crypto::CryptoProvider> provider,
                           std::vector<uint8_t> master_key,
                           std::shared_ptr<Clock> clock)
    : provider_(std::move(provider))
    , master_key_(std::move(master_key))
    , clock_(std::move(clock)) {}

TokenManager::~TokenManager() {
    crypto::utils::secure_zero(master_key_);
}

Result<std::vector<uint8_t>> TokenManager::sign(const std::string& context,
                                                const uint8_t* nonce,
                                                const uint8_t* expiry) const {
    std::vector<uint8_t> message = crypto::utils::to_bytes(context);
    message.insert(message.end(), nonce, nonce + NONCE_LENGTH);
    message.insert(message.end(), expiry, expiry + EXPIRY_LENGTH);
    return crypto::utils::hmac_sha256(*provider_, master_key_, message);
}

Result<std::string> TokenManager::generate(const std::string& context, std::chrono::seconds valid_for) {
    if (master_key_.empty()) {
        return make_error<std::string>(SBusError::INVALID_CONFIGURATION, "empty master key");
    }
    if (context.empty()) {
        return make_error<std::string>(SBusError::INVALID_PARAMETER, "empty token context");
    }

    auto nonce = SBUS_TRY(crypto::utils::generate_random(*provider_, NONCE_LENGTH));

    uint64_t expiry = clock_->now_seconds() + static_cast<uint64_t>(valid_for.count());
    uint8_t expiry_bytes[EXPIRY_LENGTH];
    crypto::utils::store_u64_be(expiry, expiry_bytes);

    auto tag = SBUS_TRY(sign(context, nonce.data(), expiry_bytes));

    std::vector<uint8_t> raw;
    raw.reserve(TOKEN_LENGTH);
    crypto::utils::append(raw, nonce);
    raw.insert(raw.end(), expiry_bytes, expiry_bytes + EXPIRY_LENGTH);
    crypto::utils::append(raw, tag);

    std::string token = crypto::utils::base64url_encode(raw);

    std::lock_guard<std::mutex> lock(mutex_);
    issued_[context] = IssuedToken{context, token, expiry};
    return token;
}

Result<void> TokenManager::validate(const std::string& context, const std::string& token) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (revoked_.count(token) > 0) {
            return Failure(SBusError::TOKEN_REVOKED, "token revoked");
        }
    }

    auto decoded = crypto::utils::base64url_decode(token);
    if (!decoded || decoded->size() != TOKEN_LENGTH) {
        return Failure(SBusError::INVALID_TOKEN, "malformed token");
    }

    const uint8_t* nonce = decoded->data();
    const uint8_t* expiry_bytes = decoded->data() + NONCE_LENGTH;
    std::vector<uint8_t> tag(decoded->begin() + NONCE_LENGTH + EXPIRY_LENGTH, decoded->end());

    uint64_t expiry = crypto::utils::load_u64_be(expiry_bytes);
    if (clock_->now_seconds() >= expiry) {
        return Failure(SBusError::TOKEN_EXPIRED, "token expired");
    }

    auto expected = SBUS_TRY(sign(context, nonce, expiry_bytes));
    if (!crypto::utils::constant_time_compare(expected, tag)) {
        return Failure(SBusError::INVALID_TOKEN, "token signature mismatch");
    }
    return make_result();
}

Result<void> TokenManager::validate_issued(const std::string& token) const {
    std::string context;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : issued_) {
            if (crypto::utils::constant_time_compare(entry.second.value, token)) {
                context = entry.first;
                break;
            }
        }
    }
    if (context.empty()) {
        return Failure(SBusError::INVALID_TOKEN, "token not issued here");
    }
    return validate(context, token);
}

void TokenManager::drop_expired_revocations_locked(uint64_t now) {
    for (auto it = revoked_.begin(); it != revoked_.end();) {
        if (now >= it->second) {
            it = revoked_.erase(it);
        } else {
            ++it;
        }
    }
}

void TokenManager::revoke(const std::string& token) {
    // A token that does not decode can never validate
    auto decoded = crypto::utils::base64url_decode(token);
    if (!decoded || decoded->size() != TOKEN_LENGTH) {
        return;
    }
    const uint64_t expiry = crypto::utils::load_u64_be(decoded->data() + NONCE_LENGTH);
    const uint64_t now = clock_->now_seconds();

    std::lock_guard<std::mutex> lock(mutex_);
    drop_expired_revocations_locked(now);
    if (now < expiry) {
        revoked_.emplace(token, expiry);
    }
}

size_t TokenManager::revoked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revoked_.size();
}

std::vector<TokenManager::IssuedToken> TokenManager::list_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<IssuedToken> out;
    out.reserve(issued_.size());
    for (const auto& entry : issued_) {
        out.push_back(entry.second);
    }
    return out;
}

size_t TokenManager::purge_expired() {
    uint64_t now = clock_->now_seconds();
    std::lock_guard<std::mutex> lock(mutex_);
    drop_expired_revocations_locked(now);
    size_t purged = 0;
    for (auto it = issued_.begin(); it != issued_.end();) {
        if (now >= it->second.expires_at_secs) {
            it = issued_.erase(it);
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
