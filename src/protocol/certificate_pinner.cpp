#include "sbus/protocol/certificate_pinner.h"
#include "sbus/crypto/crypto_utils.h"
#include <mutex>

namespace sbus::v1::protocol {

Result<CertificatePin> CertificatePin::from_certificate(crypto::CryptoProvider& provider, const Bytes& cert_der) {
    if (cert_der.empty()) {
        return make_error<CertificatePin>(SBusError::EMPTY_CERTIFICATE, "cannot pin empty certificate");
    }
    auto hash = SBUS_TRY(crypto::utils::sha256(provider, cert_der));
    return from_hash(std::move(hash));
}

CertificatePin CertificatePin::from_hash(Bytes sha256) {
    CertificatePin pin;
    pin.type = Type::CERTIFICATE_HASH;
    pin.value = std::move(sha256);
    return pin;
}

CertificatePin CertificatePin::from_der(Bytes cert_der) {
    CertificatePin pin;
    pin.type = Type::CERTIFICATE_DER;
    pin.value = std::move(cert_der);
    return pin;
}

CertificatePinner::CertificatePinner(std::shared_ptr<crypto::CryptoProvider> provider,
                                     std::shared_ptr<Clock> clock,
                                     std::chrono::seconds pin_ttl,
                                     bool require_pin)
    : provider_(std::move(provider))
    , clock_(std::move(clock))
    , pin_ttl_(pin_ttl)
    , require_pin_(require_pin) {}

bool CertificatePinner::expired(const PinEntry& entry, Timestamp now) const {
    if (pin_ttl_.count() == 0) {
        return false;
    }
    return now - entry.pinned_at >= std::chrono::duration_cast<Timestamp>(pin_ttl_);
}

Result<void> CertificatePinner::pin_certificate(const std::string& hostname, CertificatePin pin) {
    if (hostname.empty() || pin.value.empty()) {
        return Failure(SBusError::INVALID_PARAMETER, "empty hostname or pin");
    }
    if (pin.type == CertificatePin::Type::CERTIFICATE_HASH && pin.value.size() != 32) {
        return Failure(SBusError::INVALID_PARAMETER, "pin hash must be SHA-256");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    pins_[hostname] = PinEntry{std::move(pin), clock_->now()};
    return make_result();
}

Result<void> CertificatePinner::validate(const std::string& hostname, const Bytes& leaf_der) const {
    if (leaf_der.empty()) {
        return Failure(SBusError::EMPTY_CERTIFICATE, "empty leaf certificate");
    }

    CertificatePin pin;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = pins_.find(hostname);
        if (it == pins_.end()) {
            if (require_pin_) {
                return Failure(SBusError::CERTIFICATE_PIN_MISMATCH, "no pin for " + hostname);
            }
            return make_result();
        }
        if (expired(it->second, clock_->now())) {
            return Failure(SBusError::CERTIFICATE_EXPIRED, "pin for " + hostname + " expired");
        }
        pin = it->second.pin;
    }

    bool matches = false;
    if (pin.type == CertificatePin::Type::CERTIFICATE_DER) {
        matches = crypto::utils::constant_time_compare(pin.value, leaf_der);
    } else {
        auto hash = crypto::utils::sha256(*provider_, leaf_der);
        if (!hash) {
            return hash.failure();
        }
        matches = crypto::utils::constant_time_compare(pin.value, *hash);
    }

    if (!matches) {
        return Failure(SBusError::CERTIFICATE_PIN_MISMATCH, "leaf does not match pin for " + hostname);
    }
    return make_result();
}

bool CertificatePinner::has_pin(const std::string& hostname) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return pins_.count(hostname) > 0;
}

bool CertificatePinner::remove_pin(const std::string& hostname) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return pins_.erase(hostname) > 0;
}

size_t CertificatePinner::pin_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return pins_.size();
}

size_t CertificatePinner::cleanup_expired() {
    Timestamp now = clock_->now();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = pins_.begin(); it != pins_.end();) {
        if (expired(it->second, now)) {
            it = pins_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

void CertificatePinner::clear_all() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    pins_.clear();
}

} // namespace sbus::v1::protocol
