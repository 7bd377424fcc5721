#include <sbus/security/honeypot.h>
#include <sbus/crypto/crypto_utils.h>

#include <cstdio>

namespace sbus {
namespace v1 {
namespace security {

Result<std::shared_ptr<Honeypot>> Honeypot::create(const HoneypotConfig& config,
                                                   std::shared_ptr<crypto::CryptoProvider> provider,
                                                   std::shared_ptr<Clock> clock,
                                                   std::shared_ptr<ErrorReporter> reporter) {
    if (!provider || !clock) {
        return make_error<std::shared_ptr<Honeypot>>(SBusError::NOT_INITIALIZED, "honeypot dependencies");
    }
    if (config.batch_size == 0 || config.max_pool_size < config.batch_size) {
        return make_error<std::shared_ptr<Honeypot>>(SBusError::INVALID_CONFIGURATION, "honeypot pool size");
    }

    std::shared_ptr<Honeypot> honeypot(new Honeypot(config, std::move(provider),
                                                    std::move(clock), std::move(reporter)));
    {
        std::lock_guard<std::mutex> lock(honeypot->mutex_);
        SBUS_TRY_VOID(honeypot->add_decoys_locked(config.batch_size));
    }
    return honeypot;
}

Honeypot::Honeypot(const HoneypotConfig& config,
                   std::shared_ptr<crypto::CryptoProvider> provider,
                   std::shared_ptr<Clock> clock,
                   std::shared_ptr<ErrorReporter> reporter)
    : config_(config)
    , provider_(std::move(provider))
    , clock_(std::move(clock))
    , reporter_(std::move(reporter)) {}

std::string Honeypot::decoy_name(uint64_t index) {
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "hp_%08llu", static_cast<unsigned long long>(index));
    return buffer;
}

Result<void> Honeypot::add_decoys_locked(size_t count) {
    size_t room = config_.max_pool_size > decoys_.size() ? config_.max_pool_size - decoys_.size() : 0;
    if (count > room) {
        count = room;
    }

    for (size_t i = 0; i < count; ++i) {
        // Same decoded size as a TokenManager token, so decoys are indistinguishable
        auto raw = SBUS_TRY(crypto::utils::generate_random(*provider_, DECOY_TOKEN_LENGTH));
        std::string value = crypto::utils::base64url_encode(raw);
        decoy_values_.insert(value);
        decoys_.emplace(decoy_name(next_index_++), std::move(value));
    }
    return make_result();
}

Result<void> Honeypot::signal_attempt(const std::string& source, const std::string& reason) {
    uint64_t attempts = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attempt_count_++;
        attempts = attempt_count_;

        IntrusionAttempt attempt;
        attempt.sequence = attempt_count_;
        attempt.source = source;
        attempt.reason = reason;
        attempt.at = clock_->now();
        attempts_.push_back(std::move(attempt));
        while (attempts_.size() > config_.max_logged_attempts) {
            attempts_.pop_front();
        }

        size_t target = static_cast<size_t>(attempt_count_) * config_.batch_size;
        if (target > decoys_.size()) {
            SBUS_TRY_VOID(add_decoys_locked(target - decoys_.size()));
        }
    }

    if (reporter_) {
        (void)reporter_->report_security_incident(SBusError::UNAUTHORIZED_COMPONENT,
                                                  "intrusion_attempt:" + reason,
                                                  attempts > 1 ? 0.8 : 0.5,
                                                  source);
    }
    return make_result();
}

Result<void> Honeypot::add_decoys(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    return add_decoys_locked(count);
}

bool Honeypot::is_decoy(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decoys_.count(token) > 0 || decoy_values_.count(token) > 0;
}

std::optional<std::string> Honeypot::decoy_value(const std::string& decoy_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = decoys_.find(decoy_id);
    if (it == decoys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<IntrusionAttempt> Honeypot::attempt_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<IntrusionAttempt>(attempts_.begin(), attempts_.end());
}

uint64_t Honeypot::attempt_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_count_;
}

size_t Honeypot::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decoys_.size();
}

} // namespace security
} // namespace v1
} // namespace sbus
