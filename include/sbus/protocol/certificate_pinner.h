#ifndef SBUS_PROTOCOL_CERTIFICATE_PINNER_H
#define SBUS_PROTOCOL_CERTIFICATE_PINNER_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/crypto/provider.h>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace sbus {
namespace v1 {
namespace protocol {

struct CertificatePin {
    enum class Type : uint8_t {
        CERTIFICATE_HASH,   // SHA-256 of the DER leaf
        CERTIFICATE_DER     // Exact DER leaf
    };

    Type type = Type::CERTIFICATE_HASH;
    Bytes value;

    static Result<CertificatePin> from_certificate(crypto::CryptoProvider& provider, const Bytes& cert_der);
    static CertificatePin from_hash(Bytes sha256);
    static CertificatePin from_der(Bytes cert_der);
};

/**
 * Hostname to leaf-certificate pins, the only peer validation on the bus.
 *
 * A peer with a pin must present a matching leaf; a peer without one is
 * accepted unless require_pin is set. Pins expire pin_ttl after they were
 * added (zero ttl means never).
 */
class SBUS_API CertificatePinner {
public:
    CertificatePinner(std::shared_ptr<crypto::CryptoProvider> provider,
                      std::shared_ptr<Clock> clock,
                      std::chrono::seconds pin_ttl = std::chrono::seconds{7 * 24 * 3600},
                      bool require_pin = false);

    CertificatePinner(const CertificatePinner&) = delete;
    CertificatePinner& operator=(const CertificatePinner&) = delete;

    Result<void> pin_certificate(const std::string& hostname, CertificatePin pin);

    /**
     * Check the leaf certificate presented by hostname
     * @return CERTIFICATE_PIN_MISMATCH on a wrong leaf or a missing pin in
     *         require_pin mode, CERTIFICATE_EXPIRED if the pin has expired
     */
    Result<void> validate(const std::string& hostname, const Bytes& leaf_der) const;

    bool has_pin(const std::string& hostname) const;
    bool remove_pin(const std::string& hostname);
    size_t pin_count() const;
    size_t cleanup_expired();
    void clear_all();

private:
    struct PinEntry {
        CertificatePin pin;
        Timestamp pinned_at{0};
    };

    bool expired(const PinEntry& entry, Timestamp now) const;

    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::shared_ptr<Clock> clock_;
    std::chrono::seconds pin_ttl_;
    bool require_pin_;

    std::map<std::string, PinEntry> pins_;
    mutable std::shared_mutex mutex_;
};

} // namespace protocol
} // namespace v1
} // namespace sbus

#endif // SBUS_PROTOCOL_CERTIFICATE_PINNER_H
