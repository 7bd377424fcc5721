/**
 * @file provider.h
 * @brief Secure bus cryptographic provider interface
 *
 * Abstracts the primitives the bus needs (random, hashing, HKDF, AEAD,
 * HMAC, X25519) behind one interface so components never call a crypto
 * library directly.
 *
 * @thread_safety All provider implementations must be thread-safe
 */

#ifndef SBUS_CRYPTO_PROVIDER_H
#define SBUS_CRYPTO_PROVIDER_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <memory>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace crypto {

enum class HashAlgorithm : uint8_t {
    SHA256,
    SHA384,
    SHA512
};

enum class AEADCipher : uint8_t {
    AES_128_GCM,
    AES_256_GCM
};

/**
 * Key derivation parameters for HKDF (RFC 5869).
 *
 * With expand_only set, `secret` is used as the pseudorandom key and only
 * HKDF-Expand runs.
 */
struct KeyDerivationParams {
    std::vector<uint8_t> secret;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> info;
    size_t output_length{0};
    HashAlgorithm hash_algorithm{HashAlgorithm::SHA256};
    bool expand_only{false};
};

struct AEADEncryptionParams {
    std::vector<uint8_t> key;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> additional_data;
    std::vector<uint8_t> plaintext;
    AEADCipher cipher{AEADCipher::AES_256_GCM};
};

struct AEADDecryptionParams {
    std::vector<uint8_t> key;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> additional_data;
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;
    AEADCipher cipher{AEADCipher::AES_256_GCM};
};

struct AEADEncryptionOutput {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;
};

struct RandomParams {
    size_t length{0};
};

struct HashParams {
    std::vector<uint8_t> data;
    HashAlgorithm algorithm{HashAlgorithm::SHA256};
};

struct HMACParams {
    std::vector<uint8_t> key;
    std::vector<uint8_t> data;
    HashAlgorithm algorithm{HashAlgorithm::SHA256};
};

// MAC validation; the comparison is always constant-time
struct MACValidationParams {
    std::vector<uint8_t> key;
    std::vector<uint8_t> data;
    std::vector<uint8_t> expected_mac;
    HashAlgorithm algorithm{HashAlgorithm::SHA256};
    size_t max_data_length{0};                  // 0 = no limit
};

// Raw X25519 key pair; private bytes are cleansed by their owner
struct KeyPair {
    std::vector<uint8_t> private_key;
    std::vector<uint8_t> public_key;
};

struct KeyExchangeParams {
    std::vector<uint8_t> private_key;
    std::vector<uint8_t> peer_public_key;
};

constexpr size_t X25519_KEY_LENGTH = 32;

/**
 * Abstract cryptographic provider.
 *
 * @see OpenSSLProvider for the concrete implementation.
 */
class SBUS_API CryptoProvider {
public:
    virtual ~CryptoProvider() = default;

    virtual std::string name() const = 0;
    virtual std::string version() const = 0;
    virtual bool is_available() const = 0;

    virtual Result<void> initialize() = 0;
    virtual void cleanup() = 0;

    /**
     * Generates cryptographically secure random bytes.
     * @return RANDOM_GENERATION_FAILED if the generator is unavailable
     */
    virtual Result<std::vector<uint8_t>> generate_random(const RandomParams& params) = 0;

    /**
     * Derives key material with HKDF.
     * @return KEY_DERIVATION_FAILED on any backend failure
     */
    virtual Result<std::vector<uint8_t>> derive_key_hkdf(const KeyDerivationParams& params) = 0;

    virtual Result<AEADEncryptionOutput> encrypt_aead(const AEADEncryptionParams& params) = 0;

    /**
     * Decrypts and authenticates.
     * @return DECRYPT_ERROR when the tag does not verify
     */
    virtual Result<std::vector<uint8_t>> decrypt_aead(const AEADDecryptionParams& params) = 0;

    virtual Result<std::vector<uint8_t>> compute_hash(const HashParams& params) = 0;
    virtual Result<std::vector<uint8_t>> compute_hmac(const HMACParams& params) = 0;
    virtual Result<bool> verify_hmac(const MACValidationParams& params) = 0;

    virtual Result<KeyPair> generate_x25519_key_pair() = 0;
    virtual Result<std::vector<uint8_t>> perform_key_exchange(const KeyExchangeParams& params) = 0;

    size_t get_aead_key_length(AEADCipher cipher) const;
    size_t get_aead_nonce_length(AEADCipher cipher) const;
    size_t get_aead_tag_length(AEADCipher cipher) const;
    size_t get_hash_length(HashAlgorithm algorithm) const;
};

} // namespace crypto
} // namespace v1
} // namespace sbus

#endif // SBUS_CRYPTO_PROVIDER_H
