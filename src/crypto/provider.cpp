#include <sbus/crypto/provider.h>

namespace sbus {
namespace v1 {
namespace crypto {

size_t CryptoProvider::get_aead_key_length(AEADCipher cipher) const {
    switch (cipher) {
        case AEADCipher::AES_128_GCM: return 16;
        case AEADCipher::AES_256_GCM: return 32;
    }
    return 0;
}

size_t CryptoProvider::get_aead_nonce_length(AEADCipher cipher) const {
    switch (cipher) {
        case AEADCipher::AES_128_GCM:
        case AEADCipher::AES_256_GCM:
            return AEAD_NONCE_LENGTH;
    }
    return 0;
}

size_t CryptoProvider::get_aead_tag_length(AEADCipher cipher) const {
    switch (cipher) {
        case AEADCipher::AES_128_GCM:
        case AEADCipher::AES_256_GCM:
            return AEAD_TAG_LENGTH;
    }
    return 0;
}

size_t CryptoProvider::get_hash_length(HashAlgorithm algorithm) const {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return 32;
        case HashAlgorithm::SHA384: return 48;
        case HashAlgorithm::SHA512: return 64;
    }
    return 0;
}

} // namespace crypto
} // namespace v1
} // namespace sbus
