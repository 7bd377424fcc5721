#include <sbus/crypto/crypto_key.h>
#include <sbus/crypto/crypto_utils.h>

namespace sbus {
namespace v1 {
namespace crypto {

Result<CryptoKey> CryptoKey::create(std::shared_ptr<CryptoProvider> provider,
                                    const std::vector<uint8_t>& master,
                                    const std::string& context) {
    if (!provider) {
        return make_error<CryptoKey>(SBusError::NOT_INITIALIZED, "no crypto provider");
    }
    if (master.empty()) {
        return make_error<CryptoKey>(SBusError::INVALID_PARAMETER, "empty master key");
    }

    auto salt_digest = utils::sha256(*provider, utils::to_bytes(context + "hkdf_salt_v1"));
    if (!salt_digest) {
        return salt_digest.failure();
    }

    KeyDerivationParams params;
    params.secret = master;
    params.salt.assign(salt_digest->begin(), salt_digest->begin() + SALT_LENGTH);
    params.info = utils::to_bytes("secure-bus/v1:" + context);
    params.output_length = KEY_LENGTH;
    params.hash_algorithm = HashAlgorithm::SHA256;

    auto key = provider->derive_key_hkdf(params);
    utils::secure_zero(params.secret);
    if (!key) {
        return key.failure();
    }

    return CryptoKey(std::move(provider), std::move(*key), context);
}

CryptoKey::CryptoKey(std::shared_ptr<CryptoProvider> provider,
                     std::vector<uint8_t> key,
                     std::string context)
    : provider_(std::move(provider))
    , key_(std::move(key))
    , context_(std::move(context)) {}

CryptoKey::CryptoKey(const CryptoKey& other)
    : provider_(other.provider_)
    , key_(other.key_)
    , context_(other.context_) {}

CryptoKey& CryptoKey::operator=(const CryptoKey& other) {
    if (this != &other) {
        utils::secure_zero(key_);
        provider_ = other.provider_;
        key_ = other.key_;
        context_ = other.context_;
    }
    return *this;
}

CryptoKey::CryptoKey(CryptoKey&& other) noexcept
    : provider_(std::move(other.provider_))
    , key_(std::move(other.key_))
    , context_(std::move(other.context_)) {}

CryptoKey& CryptoKey::operator=(CryptoKey&& other) noexcept {
    if (this != &other) {
        utils::secure_zero(key_);
        provider_ = std::move(other.provider_);
        key_ = std::move(other.key_);
        context_ = std::move(other.context_);
    }
    return *this;
}

CryptoKey::~CryptoKey() {
    utils::secure_zero(key_);
}

Result<std::vector<uint8_t>> CryptoKey::encrypt_raw(const std::vector<uint8_t>& plaintext,
                                                    const std::vector<uint8_t>& aad) const {
    if (!provider_ || key_.empty()) {
        return make_error<std::vector<uint8_t>>(SBusError::NOT_INITIALIZED, "key moved from");
    }

    auto nonce = utils::generate_random(*provider_, AEAD_NONCE_LENGTH);
    if (!nonce) {
        return nonce.failure();
    }

    AEADEncryptionParams params;
    params.key = key_;
    params.nonce = *nonce;
    params.additional_data = aad;
    params.plaintext = plaintext;
    params.cipher = AEADCipher::AES_256_GCM;

    auto sealed = provider_->encrypt_aead(params);
    utils::secure_zero(params.key);
    utils::secure_zero(params.plaintext);
    if (!sealed) {
        return sealed.failure();
    }

    std::vector<uint8_t> out;
    out.reserve(AEAD_NONCE_LENGTH + sealed->ciphertext.size() + AEAD_TAG_LENGTH);
    utils::append(out, *nonce);
    utils::append(out, sealed->ciphertext);
    utils::append(out, sealed->tag);
    return out;
}

Result<std::vector<uint8_t>> CryptoKey::decrypt_raw(const std::vector<uint8_t>& sealed,
                                                    const std::vector<uint8_t>& aad) const {
    if (!provider_ || key_.empty()) {
        return make_error<std::vector<uint8_t>>(SBusError::NOT_INITIALIZED, "key moved from");
    }
    if (sealed.size() <= AEAD_NONCE_LENGTH + AEAD_TAG_LENGTH) {
        return make_error<std::vector<uint8_t>>(SBusError::DECRYPT_ERROR, "sealed data too short");
    }

    AEADDecryptionParams params;
    params.key = key_;
    params.nonce.assign(sealed.begin(), sealed.begin() + AEAD_NONCE_LENGTH);
    params.ciphertext.assign(sealed.begin() + AEAD_NONCE_LENGTH, sealed.end() - AEAD_TAG_LENGTH);
    params.tag.assign(sealed.end() - AEAD_TAG_LENGTH, sealed.end());
    params.additional_data = aad;
    params.cipher = AEADCipher::AES_256_GCM;

    auto plaintext = provider_->decrypt_aead(params);
    utils::secure_zero(params.key);
    if (!plaintext) {
        return make_error<std::vector<uint8_t>>(SBusError::DECRYPT_ERROR, plaintext.error_detail());
    }
    return plaintext;
}

Result<std::string> CryptoKey::encrypt(const std::vector<uint8_t>& plaintext) const {
    auto sealed = encrypt_raw(plaintext);
    if (!sealed) {
        return sealed.failure();
    }
    return utils::base64url_encode(*sealed);
}

Result<std::string> CryptoKey::encrypt(const std::string& plaintext) const {
    return encrypt(utils::to_bytes(plaintext));
}

Result<std::vector<uint8_t>> CryptoKey::decrypt(const std::string& text) const {
    auto sealed = utils::base64url_decode(text);
    if (!sealed) {
        return make_error<std::vector<uint8_t>>(SBusError::DECRYPT_ERROR, "malformed encoding");
    }
    return decrypt_raw(*sealed);
}

} // namespace crypto
} // namespace v1
} // namespace sbus
