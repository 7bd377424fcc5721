#ifndef SBUS_CRYPTO_OPENSSL_PROVIDER_H
#define SBUS_CRYPTO_OPENSSL_PROVIDER_H

#include <sbus/config.h>
#include <sbus/crypto/provider.h>
#include <memory>
#include <string>

namespace sbus {
namespace v1 {
namespace crypto {

/**
 * OpenSSL-based cryptographic provider implementation
 *
 * Uses the EVP interface for every primitive. Must be initialized before
 * use; every operation on an uninitialized provider fails with
 * NOT_INITIALIZED.
 */
class SBUS_API OpenSSLProvider : public CryptoProvider {
public:
    OpenSSLProvider();
    ~OpenSSLProvider() override;

    // Non-copyable, movable
    OpenSSLProvider(const OpenSSLProvider&) = delete;
    OpenSSLProvider& operator=(const OpenSSLProvider&) = delete;
    OpenSSLProvider(OpenSSLProvider&&) noexcept;
    OpenSSLProvider& operator=(OpenSSLProvider&&) noexcept;

    std::string name() const override;
    std::string version() const override;
    bool is_available() const override;
    Result<void> initialize() override;
    void cleanup() override;

    Result<std::vector<uint8_t>> generate_random(const RandomParams& params) override;
    Result<std::vector<uint8_t>> derive_key_hkdf(const KeyDerivationParams& params) override;

    Result<AEADEncryptionOutput> encrypt_aead(const AEADEncryptionParams& params) override;
    Result<std::vector<uint8_t>> decrypt_aead(const AEADDecryptionParams& params) override;

    Result<std::vector<uint8_t>> compute_hash(const HashParams& params) override;
    Result<std::vector<uint8_t>> compute_hmac(const HMACParams& params) override;
    Result<bool> verify_hmac(const MACValidationParams& params) override;

    Result<KeyPair> generate_x25519_key_pair() override;
    Result<std::vector<uint8_t>> perform_key_exchange(const KeyExchangeParams& params) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;

    Result<void> validate_aead_params(AEADCipher cipher,
                                      const std::vector<uint8_t>& key,
                                      const std::vector<uint8_t>& nonce) const;
    SBusError map_openssl_error_detailed() const;
    void secure_cleanup(std::vector<uint8_t>& buffer) const;
};

/**
 * Creates and initializes an OpenSSL provider.
 */
SBUS_API Result<std::shared_ptr<CryptoProvider>> make_openssl_provider();

namespace openssl_utils {

SBUS_API std::string get_openssl_version();
SBUS_API SBusError map_openssl_error(unsigned long openssl_error);

} // namespace openssl_utils

} // namespace crypto
} // namespace v1
} // namespace sbus

#endif // SBUS_CRYPTO_OPENSSL_PROVIDER_H
