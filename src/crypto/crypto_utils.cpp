#include <sbus/crypto/crypto_utils.h>
#include <openssl/crypto.h>

namespace sbus {
namespace v1 {
namespace crypto {
namespace utils {

namespace {

const char BASE64URL_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int base64url_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Result<std::vector<uint8_t>> hkdf_extract(
    CryptoProvider& provider,
    HashAlgorithm hash,
    const std::vector<uint8_t>& salt,
    const std::vector<uint8_t>& input_key_material) {

    // RFC 5869: a missing salt is HashLen zero bytes
    HMACParams params;
    params.key = salt.empty() ? std::vector<uint8_t>(provider.get_hash_length(hash), 0) : salt;
    params.data = input_key_material;
    params.algorithm = hash;
    return provider.compute_hmac(params);
}

Result<std::vector<uint8_t>> hkdf_expand(
    CryptoProvider& provider,
    HashAlgorithm hash,
    const std::vector<uint8_t>& pseudo_random_key,
    const std::vector<uint8_t>& info,
    size_t output_length) {

    KeyDerivationParams params;
    params.secret = pseudo_random_key;
    params.info = info;
    params.output_length = output_length;
    params.hash_algorithm = hash;
    params.expand_only = true;
    return provider.derive_key_hkdf(params);
}

Result<std::vector<uint8_t>> hkdf_expand_label(
    CryptoProvider& provider,
    const std::vector<uint8_t>& secret,
    const std::string& label,
    const std::vector<uint8_t>& context,
    size_t length) {

    std::vector<uint8_t> info = to_bytes("secure-bus " + label);
    append(info, context);
    return hkdf_expand(provider, HashAlgorithm::SHA256, secret, info, length);
}

Result<std::vector<uint8_t>> sha256(CryptoProvider& provider, const std::vector<uint8_t>& data) {
    HashParams params;
    params.data = data;
    params.algorithm = HashAlgorithm::SHA256;
    return provider.compute_hash(params);
}

Result<std::vector<uint8_t>> hmac_sha256(CryptoProvider& provider,
                                         const std::vector<uint8_t>& key,
                                         const std::vector<uint8_t>& data) {
    HMACParams params;
    params.key = key;
    params.data = data;
    params.algorithm = HashAlgorithm::SHA256;
    return provider.compute_hmac(params);
}

Result<std::vector<uint8_t>> generate_random(CryptoProvider& provider, size_t length) {
    RandomParams params;
    params.length = length;
    return provider.generate_random(params);
}

bool constant_time_compare(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool constant_time_compare(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void secure_zero(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
        data.clear();
    }
}

void secure_zero(std::string& data) {
    if (!data.empty()) {
        OPENSSL_cleanse(&data[0], data.size());
        data.clear();
    }
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve((data.size() * 4 + 2) / 3);

    size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out += BASE64URL_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64URL_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64URL_ALPHABET[(n >> 6) & 0x3F];
        out += BASE64URL_ALPHABET[n & 0x3F];
        i += 3;
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out += BASE64URL_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64URL_ALPHABET[(n >> 12) & 0x3F];
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        out += BASE64URL_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64URL_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64URL_ALPHABET[(n >> 6) & 0x3F];
    }

    return out;
}

Result<std::vector<uint8_t>> base64url_decode(const std::string& text) {
    if (text.size() % 4 == 1) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_MESSAGE_FORMAT, "base64url length");
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int v = base64url_value(c);
        if (v < 0) {
            return make_error<std::vector<uint8_t>>(SBusError::INVALID_MESSAGE_FORMAT,
                                                    "base64url character");
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    // Leftover bits must be zero for a canonical encoding
    if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_MESSAGE_FORMAT,
                                                "base64url trailing bits");
    }

    return out;
}

std::string to_hex(const std::vector<uint8_t>& data) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

Result<std::vector<uint8_t>> from_hex(const std::string& text) {
    if (text.size() % 2 != 0) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_HEX, "odd length");
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return make_error<std::vector<uint8_t>>(SBusError::INVALID_HEX, "non-hex character");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

void store_u64_le(uint64_t value, uint8_t* out) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

uint64_t load_u64_le(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | in[i];
    }
    return value;
}

void store_u64_be(uint64_t value, uint8_t* out) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * (7 - i)));
    }
}

uint64_t load_u64_be(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | in[i];
    }
    return value;
}

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& data) {
    out.insert(out.end(), data.begin(), data.end());
}

void append(std::vector<uint8_t>& out, const std::string& data) {
    out.insert(out.end(), data.begin(), data.end());
}

} // namespace utils
} // namespace crypto
} // namespace v1
} // namespace sbus
