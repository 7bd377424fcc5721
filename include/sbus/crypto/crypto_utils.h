#ifndef SBUS_CRYPTO_UTILS_H
#define SBUS_CRYPTO_UTILS_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/crypto/provider.h>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace crypto {

/**
 * Cryptographic utility functions for the secure bus
 *
 * High-level functions that work with any crypto provider, plus the
 * encodings used by tokens and control messages.
 */
namespace utils {

// Key derivation utilities
SBUS_API Result<std::vector<uint8_t>> hkdf_extract(
    CryptoProvider& provider,
    HashAlgorithm hash,
    const std::vector<uint8_t>& salt,
    const std::vector<uint8_t>& input_key_material);

SBUS_API Result<std::vector<uint8_t>> hkdf_expand(
    CryptoProvider& provider,
    HashAlgorithm hash,
    const std::vector<uint8_t>& pseudo_random_key,
    const std::vector<uint8_t>& info,
    size_t output_length);

/**
 * HKDF-Expand with info = "secure-bus " ‖ label ‖ context.
 */
SBUS_API Result<std::vector<uint8_t>> hkdf_expand_label(
    CryptoProvider& provider,
    const std::vector<uint8_t>& secret,
    const std::string& label,
    const std::vector<uint8_t>& context,
    size_t length);

SBUS_API Result<std::vector<uint8_t>> sha256(CryptoProvider& provider,
                                             const std::vector<uint8_t>& data);

SBUS_API Result<std::vector<uint8_t>> hmac_sha256(CryptoProvider& provider,
                                                  const std::vector<uint8_t>& key,
                                                  const std::vector<uint8_t>& data);

SBUS_API Result<std::vector<uint8_t>> generate_random(CryptoProvider& provider, size_t length);

// Timing-safe comparison
SBUS_API bool constant_time_compare(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);
SBUS_API bool constant_time_compare(const std::string& a, const std::string& b);

// Secure memory utilities
SBUS_API void secure_zero(std::vector<uint8_t>& data);
SBUS_API void secure_zero(std::string& data);

// Encodings
SBUS_API std::string base64url_encode(const std::vector<uint8_t>& data);
SBUS_API Result<std::vector<uint8_t>> base64url_decode(const std::string& text);

// Lower-case hex
SBUS_API std::string to_hex(const std::vector<uint8_t>& data);
// Accepts either case; odd length or non-hex characters are INVALID_HEX
SBUS_API Result<std::vector<uint8_t>> from_hex(const std::string& text);

SBUS_API std::vector<uint8_t> to_bytes(const std::string& text);

// Integer packing
SBUS_API void store_u64_le(uint64_t value, uint8_t* out);
SBUS_API uint64_t load_u64_le(const uint8_t* in);
SBUS_API void store_u64_be(uint64_t value, uint8_t* out);
SBUS_API uint64_t load_u64_be(const uint8_t* in);

SBUS_API void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& data);
SBUS_API void append(std::vector<uint8_t>& out, const std::string& data);

} // namespace utils

} // namespace crypto
} // namespace v1
} // namespace sbus

#endif // SBUS_CRYPTO_UTILS_H
