#ifndef SBUS_CRYPTO_CRYPTO_KEY_H
#define SBUS_CRYPTO_CRYPTO_KEY_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/crypto/provider.h>
#include <memory>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace crypto {

/**
 * Symmetric AES-256-GCM key derived from a master secret and a context.
 *
 * The key is HKDF-SHA256(master) with
 *   salt = SHA-256(context ‖ "hkdf_salt_v1")[0..16)
 *   info = "secure-bus/v1:" ‖ context
 * so the same master yields independent keys per context. Every encryption
 * draws a fresh random nonce; the text form is base64url(nonce ‖ ct ‖ tag).
 *
 * Key bytes are cleansed on destruction.
 */
class SBUS_API CryptoKey {
public:
    static constexpr size_t KEY_LENGTH = 32;
    static constexpr size_t SALT_LENGTH = 16;

    static Result<CryptoKey> create(std::shared_ptr<CryptoProvider> provider,
                                    const std::vector<uint8_t>& master,
                                    const std::string& context);

    CryptoKey(const CryptoKey& other);
    CryptoKey& operator=(const CryptoKey& other);
    CryptoKey(CryptoKey&& other) noexcept;
    CryptoKey& operator=(CryptoKey&& other) noexcept;
    ~CryptoKey();

    Result<std::string> encrypt(const std::vector<uint8_t>& plaintext) const;
    Result<std::string> encrypt(const std::string& plaintext) const;

    // DECRYPT_ERROR for malformed text as well as authentication failure
    Result<std::vector<uint8_t>> decrypt(const std::string& text) const;

    // nonce ‖ ciphertext ‖ tag
    Result<std::vector<uint8_t>> encrypt_raw(const std::vector<uint8_t>& plaintext,
                                             const std::vector<uint8_t>& aad = {}) const;
    Result<std::vector<uint8_t>> decrypt_raw(const std::vector<uint8_t>& sealed,
                                             const std::vector<uint8_t>& aad = {}) const;

    const std::string& context() const { return context_; }

private:
    CryptoKey(std::shared_ptr<CryptoProvider> provider,
              std::vector<uint8_t> key,
              std::string context);

    std::shared_ptr<CryptoProvider> provider_;
    std::vector<uint8_t> key_;
    std::string context_;
};

} // namespace crypto
} // namespace v1
} // namespace sbus

#endif // SBUS_CRYPTO_CRYPTO_KEY_H
