#include <sbus/crypto/openssl_provider.h>
#include <sbus/crypto/crypto_utils.h>

#include <openssl/opensslv.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/err.h>
#include <atomic>
#include <limits>

namespace sbus {
namespace v1 {
namespace crypto {

class OpenSSLProvider::Impl {
public:
    std::atomic<bool> initialized_{false};

    Impl() = default;
    ~Impl() = default;
};

namespace {

const EVP_MD* select_digest(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA384: return EVP_sha384();
        case HashAlgorithm::SHA512: return EVP_sha512();
    }
    return nullptr;
}

const EVP_CIPHER* select_cipher(AEADCipher cipher) {
    switch (cipher) {
        case AEADCipher::AES_128_GCM: return EVP_aes_128_gcm();
        case AEADCipher::AES_256_GCM: return EVP_aes_256_gcm();
    }
    return nullptr;
}

} // namespace

OpenSSLProvider::OpenSSLProvider()
    : pimpl_(std::make_unique<Impl>()) {}

OpenSSLProvider::~OpenSSLProvider() {
    cleanup();
}

OpenSSLProvider::OpenSSLProvider(OpenSSLProvider&& other) noexcept
    : pimpl_(std::move(other.pimpl_)) {}

OpenSSLProvider& OpenSSLProvider::operator=(OpenSSLProvider&& other) noexcept {
    if (this != &other) {
        cleanup();
        pimpl_ = std::move(other.pimpl_);
    }
    return *this;
}

std::string OpenSSLProvider::name() const {
    return "openssl";
}

std::string OpenSSLProvider::version() const {
    return openssl_utils::get_openssl_version();
}

bool OpenSSLProvider::is_available() const {
    return true;
}

Result<void> OpenSSLProvider::initialize() {
    if (pimpl_->initialized_) {
        return make_error<void>(SBusError::ALREADY_INITIALIZED);
    }

    // OpenSSL 1.1.0+ initializes itself; only the PRNG needs checking
    if (RAND_status() != 1 && RAND_poll() != 1) {
        return make_error<void>(SBusError::RANDOM_GENERATION_FAILED, "PRNG not seeded");
    }

    pimpl_->initialized_ = true;
    return make_result();
}

void OpenSSLProvider::cleanup() {
    if (pimpl_ && pimpl_->initialized_) {
        pimpl_->initialized_ = false;
    }
}

Result<std::vector<uint8_t>> OpenSSLProvider::generate_random(const RandomParams& params) {
    if (!pimpl_->initialized_) {
        return make_error<std::vector<uint8_t>>(SBusError::NOT_INITIALIZED);
    }

    if (params.length == 0 ||
        params.length > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_PARAMETER, "random length");
    }

    std::vector<uint8_t> random_bytes(params.length);
    if (RAND_bytes(random_bytes.data(), static_cast<int>(params.length)) != 1) {
        ERR_clear_error();
        secure_cleanup(random_bytes);
        return make_error<std::vector<uint8_t>>(SBusError::RANDOM_GENERATION_FAILED);
    }

    return random_bytes;
}

Result<std::vector<uint8_t>> OpenSSLProvider::derive_key_hkdf(const KeyDerivationParams& params) {
    if (!pimpl_->initialized_) {
        return make_error<std::vector<uint8_t>>(SBusError::NOT_INITIALIZED);
    }

    if (params.secret.empty() || params.output_length == 0) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_PARAMETER, "hkdf input");
    }

    const EVP_MD* md = select_digest(params.hash_algorithm);
    if (!md) {
        return make_error<std::vector<uint8_t>>(SBusError::OPERATION_NOT_SUPPORTED);
    }

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        return make_error<std::vector<uint8_t>>(SBusError::OUT_OF_MEMORY);
    }

    std::vector<uint8_t> output(params.output_length);
    size_t output_len = params.output_length;

    int result = 1;

    if (result == 1) {
        result = EVP_PKEY_derive_init(pctx);
    }

    if (result == 1 && params.expand_only) {
        result = EVP_PKEY_CTX_hkdf_mode(pctx, EVP_PKEY_HKDEF_MODE_EXPAND_ONLY);
    }

    if (result == 1) {
        result = EVP_PKEY_CTX_set_hkdf_md(pctx, md);
    }

    if (result == 1) {
        result = EVP_PKEY_CTX_set1_hkdf_key(pctx, params.secret.data(),
                                           static_cast<int>(params.secret.size()));
    }

    if (result == 1 && !params.salt.empty() && !params.expand_only) {
        result = EVP_PKEY_CTX_set1_hkdf_salt(pctx, params.salt.data(),
                                            static_cast<int>(params.salt.size()));
    }

    if (result == 1 && !params.info.empty()) {
        result = EVP_PKEY_CTX_add1_hkdf_info(pctx, params.info.data(),
                                            static_cast<int>(params.info.size()));
    }

    if (result == 1) {
        result = EVP_PKEY_derive(pctx, output.data(), &output_len);
    }

    EVP_PKEY_CTX_free(pctx);

    if (result != 1) {
        ERR_clear_error();
        secure_cleanup(output);
        return make_error<std::vector<uint8_t>>(SBusError::KEY_DERIVATION_FAILED);
    }

    output.resize(output_len);
    return output;
}

Result<AEADEncryptionOutput> OpenSSLProvider::encrypt_aead(const AEADEncryptionParams& params) {
    if (!pimpl_->initialized_) {
        return make_error<AEADEncryptionOutput>(SBusError::NOT_INITIALIZED);
    }

    if (params.plaintext.empty()) {
        return make_error<AEADEncryptionOutput>(SBusError::INVALID_PARAMETER, "empty plaintext");
    }

    auto validation_result = validate_aead_params(params.cipher, params.key, params.nonce);
    if (!validation_result) {
        return validation_result.failure();
    }

    const EVP_CIPHER* cipher = select_cipher(params.cipher);
    size_t tag_length = get_aead_tag_length(params.cipher);
    if (!cipher) {
        return make_error<AEADEncryptionOutput>(SBusError::CRYPTO_PROVIDER_ERROR);
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return make_error<AEADEncryptionOutput>(SBusError::OUT_OF_MEMORY);
    }

    std::vector<uint8_t> ciphertext(params.plaintext.size());
    std::vector<uint8_t> tag(tag_length);
    int outlen = 0;
    int result = 1;

    if (result == 1) {
        result = EVP_EncryptInit_ex(ctx, cipher, nullptr, nullptr, nullptr);
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN,
                                    static_cast<int>(params.nonce.size()), nullptr);
    }

    if (result == 1) {
        result = EVP_EncryptInit_ex(ctx, nullptr, nullptr, params.key.data(), params.nonce.data());
    }

    if (result == 1 && !params.additional_data.empty()) {
        result = EVP_EncryptUpdate(ctx, nullptr, &outlen,
                                  params.additional_data.data(),
                                  static_cast<int>(params.additional_data.size()));
    }

    if (result == 1) {
        result = EVP_EncryptUpdate(ctx, ciphertext.data(), &outlen,
                                  params.plaintext.data(), static_cast<int>(params.plaintext.size()));
    }

    int final_len = 0;
    if (result == 1) {
        result = EVP_EncryptFinal_ex(ctx, ciphertext.data() + outlen, &final_len);
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG,
                                    static_cast<int>(tag_length),
                                    tag.data());
    }

    EVP_CIPHER_CTX_free(ctx);

    if (result != 1) {
        SBusError error = map_openssl_error_detailed();
        if (error == SBusError::SUCCESS || error == SBusError::CRYPTO_PROVIDER_ERROR) {
            error = SBusError::ENCRYPT_ERROR;
        }
        return make_error<AEADEncryptionOutput>(error);
    }

    ciphertext.resize(outlen + final_len);

    AEADEncryptionOutput output;
    output.ciphertext = std::move(ciphertext);
    output.tag = std::move(tag);
    return output;
}

Result<std::vector<uint8_t>> OpenSSLProvider::decrypt_aead(const AEADDecryptionParams& params) {
    if (!pimpl_->initialized_) {
        return make_error<std::vector<uint8_t>>(SBusError::NOT_INITIALIZED);
    }

    if (params.ciphertext.empty() || params.tag.empty()) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_PARAMETER, "empty ciphertext");
    }

    auto validation_result = validate_aead_params(params.cipher, params.key, params.nonce);
    if (!validation_result) {
        return validation_result.failure();
    }

    const EVP_CIPHER* cipher = select_cipher(params.cipher);
    size_t expected_tag_length = get_aead_tag_length(params.cipher);
    if (!cipher || params.tag.size() != expected_tag_length) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_PARAMETER, "tag length");
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        return make_error<std::vector<uint8_t>>(SBusError::OUT_OF_MEMORY);
    }

    std::vector<uint8_t> plaintext(params.ciphertext.size());
    int outlen = 0;
    int result = 1;

    if (result == 1) {
        result = EVP_DecryptInit_ex(ctx, cipher, nullptr, nullptr, nullptr);
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN,
                                    static_cast<int>(params.nonce.size()), nullptr);
    }

    if (result == 1) {
        result = EVP_DecryptInit_ex(ctx, nullptr, nullptr, params.key.data(), params.nonce.data());
    }

    if (result == 1 && !params.additional_data.empty()) {
        result = EVP_DecryptUpdate(ctx, nullptr, &outlen,
                                  params.additional_data.data(),
                                  static_cast<int>(params.additional_data.size()));
    }

    if (result == 1) {
        result = EVP_DecryptUpdate(ctx, plaintext.data(), &outlen,
                                  params.ciphertext.data(), static_cast<int>(params.ciphertext.size()));
    }

    if (result == 1) {
        result = EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG,
                                    static_cast<int>(expected_tag_length),
                                    const_cast<uint8_t*>(params.tag.data()));
    }

    // Verifies the tag
    int final_len = 0;
    if (result == 1) {
        result = EVP_DecryptFinal_ex(ctx, plaintext.data() + outlen, &final_len);
    }

    EVP_CIPHER_CTX_free(ctx);

    if (result != 1) {
        ERR_clear_error();
        secure_cleanup(plaintext);
        return make_error<std::vector<uint8_t>>(SBusError::DECRYPT_ERROR, "authentication failed");
    }

    plaintext.resize(outlen + final_len);
    return plaintext;
}

Result<std::vector<uint8_t>> OpenSSLProvider::compute_hash(const HashParams& params) {
    if (!pimpl_->initialized_) {
        return make_error<std::vector<uint8_t>>(SBusError::NOT_INITIALIZED);
    }

    const EVP_MD* md = select_digest(params.algorithm);
    if (!md) {
        return make_error<std::vector<uint8_t>>(SBusError::OPERATION_NOT_SUPPORTED);
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return make_error<std::vector<uint8_t>>(SBusError::OUT_OF_MEMORY);
    }

    std::vector<uint8_t> hash(EVP_MD_size(md));
    unsigned int hash_len = 0;

    int result = EVP_DigestInit_ex(ctx, md, nullptr);
    if (result == 1) {
        result = EVP_DigestUpdate(ctx, params.data.data(), params.data.size());
    }
    if (result == 1) {
        result = EVP_DigestFinal_ex(ctx, hash.data(), &hash_len);
    }

    EVP_MD_CTX_free(ctx);

    if (result != 1) {
        ERR_clear_error();
        return make_error<std::vector<uint8_t>>(SBusError::CRYPTO_PROVIDER_ERROR, "digest");
    }

    hash.resize(hash_len);
    return hash;
}

Result<std::vector<uint8_t>> OpenSSLProvider::compute_hmac(const HMACParams& params) {
    if (!pimpl_->initialized_) {
        return make_error<std::vector<uint8_t>>(SBusError::NOT_INITIALIZED);
    }

    if (params.key.empty()) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_PARAMETER, "empty hmac key");
    }

    const EVP_MD* md = select_digest(params.algorithm);
    if (!md) {
        return make_error<std::vector<uint8_t>>(SBusError::OPERATION_NOT_SUPPORTED);
    }

    std::vector<uint8_t> hmac(EVP_MD_size(md));
    unsigned int hmac_len = 0;

    unsigned char* result = HMAC(md,
                                params.key.data(), static_cast<int>(params.key.size()),
                                params.data.data(), params.data.size(),
                                hmac.data(), &hmac_len);

    if (!result) {
        ERR_clear_error();
        return make_error<std::vector<uint8_t>>(SBusError::CRYPTO_PROVIDER_ERROR, "hmac");
    }

    hmac.resize(hmac_len);
    return hmac;
}

Result<bool> OpenSSLProvider::verify_hmac(const MACValidationParams& params) {
    if (!pimpl_->initialized_) {
        return make_error<bool>(SBusError::NOT_INITIALIZED);
    }

    if (params.key.empty() || params.expected_mac.empty()) {
        return make_error<bool>(SBusError::INVALID_PARAMETER);
    }

    if (params.max_data_length > 0 && params.data.size() > params.max_data_length) {
        return make_error<bool>(SBusError::INVALID_PARAMETER, "data exceeds limit");
    }

    HMACParams hmac_params;
    hmac_params.key = params.key;
    hmac_params.data = params.data;
    hmac_params.algorithm = params.algorithm;

    auto computed_hmac_result = compute_hmac(hmac_params);
    if (!computed_hmac_result) {
        return computed_hmac_result.failure();
    }

    const auto& computed_hmac = computed_hmac_result.value();
    bool is_valid = false;
    if (computed_hmac.size() == params.expected_mac.size()) {
        is_valid = (CRYPTO_memcmp(computed_hmac.data(), params.expected_mac.data(),
                                  computed_hmac.size()) == 0);
    } else {
        is_valid = utils::constant_time_compare(computed_hmac, params.expected_mac);
    }

    return is_valid;
}

Result<KeyPair> OpenSSLProvider::generate_x25519_key_pair() {
    if (!pimpl_->initialized_) {
        return make_error<KeyPair>(SBusError::NOT_INITIALIZED);
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr);
    if (!ctx) {
        return make_error<KeyPair>(SBusError::OUT_OF_MEMORY);
    }

    EVP_PKEY* pkey = nullptr;
    int result = EVP_PKEY_keygen_init(ctx);
    if (result == 1) {
        result = EVP_PKEY_keygen(ctx, &pkey);
    }
    EVP_PKEY_CTX_free(ctx);

    KeyPair pair;
    pair.private_key.resize(X25519_KEY_LENGTH);
    pair.public_key.resize(X25519_KEY_LENGTH);
    size_t private_len = X25519_KEY_LENGTH;
    size_t public_len = X25519_KEY_LENGTH;

    if (result == 1) {
        result = EVP_PKEY_get_raw_private_key(pkey, pair.private_key.data(), &private_len);
    }
    if (result == 1) {
        result = EVP_PKEY_get_raw_public_key(pkey, pair.public_key.data(), &public_len);
    }

    if (pkey) {
        EVP_PKEY_free(pkey);
    }

    if (result != 1 || private_len != X25519_KEY_LENGTH || public_len != X25519_KEY_LENGTH) {
        ERR_clear_error();
        secure_cleanup(pair.private_key);
        return make_error<KeyPair>(SBusError::KEY_EXCHANGE_FAILED, "x25519 keygen");
    }

    return pair;
}

Result<std::vector<uint8_t>> OpenSSLProvider::perform_key_exchange(const KeyExchangeParams& params) {
    if (!pimpl_->initialized_) {
        return make_error<std::vector<uint8_t>>(SBusError::NOT_INITIALIZED);
    }

    if (params.private_key.size() != X25519_KEY_LENGTH ||
        params.peer_public_key.size() != X25519_KEY_LENGTH) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_PARAMETER, "x25519 key length");
    }

    EVP_PKEY* private_key = EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                         params.private_key.data(),
                                                         params.private_key.size());
    EVP_PKEY* peer_key = EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                                     params.peer_public_key.data(),
                                                     params.peer_public_key.size());
    if (!private_key || !peer_key) {
        if (private_key) EVP_PKEY_free(private_key);
        if (peer_key) EVP_PKEY_free(peer_key);
        ERR_clear_error();
        return make_error<std::vector<uint8_t>>(SBusError::KEY_EXCHANGE_FAILED, "x25519 key import");
    }

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(private_key, nullptr);
    if (!ctx) {
        EVP_PKEY_free(private_key);
        EVP_PKEY_free(peer_key);
        return make_error<std::vector<uint8_t>>(SBusError::OUT_OF_MEMORY);
    }

    int result = 1;
    if (result == 1) {
        result = EVP_PKEY_derive_init(ctx);
    }

    if (result == 1) {
        result = EVP_PKEY_derive_set_peer(ctx, peer_key);
    }

    size_t shared_secret_len = 0;
    if (result == 1) {
        result = EVP_PKEY_derive(ctx, nullptr, &shared_secret_len);
    }

    std::vector<uint8_t> shared_secret;
    if (result == 1 && shared_secret_len > 0) {
        shared_secret.resize(shared_secret_len);
        result = EVP_PKEY_derive(ctx, shared_secret.data(), &shared_secret_len);
    }

    EVP_PKEY_CTX_free(ctx);
    EVP_PKEY_free(private_key);
    EVP_PKEY_free(peer_key);

    if (result != 1) {
        ERR_clear_error();
        secure_cleanup(shared_secret);
        return make_error<std::vector<uint8_t>>(SBusError::KEY_EXCHANGE_FAILED);
    }

    shared_secret.resize(shared_secret_len);
    return shared_secret;
}

Result<void> OpenSSLProvider::validate_aead_params(AEADCipher cipher,
                                                   const std::vector<uint8_t>& key,
                                                   const std::vector<uint8_t>& nonce) const {
    size_t expected_key_len = get_aead_key_length(cipher);
    if (expected_key_len == 0) {
        return make_error<void>(SBusError::OPERATION_NOT_SUPPORTED);
    }
    if (key.size() != expected_key_len) {
        return make_error<void>(SBusError::INVALID_PARAMETER, "aead key length");
    }

    size_t expected_nonce_len = get_aead_nonce_length(cipher);
    if (nonce.size() != expected_nonce_len) {
        return make_error<void>(SBusError::INVALID_PARAMETER, "aead nonce length");
    }

    return make_result();
}

SBusError OpenSSLProvider::map_openssl_error_detailed() const {
    unsigned long err = ERR_get_error();
    ERR_clear_error();
    return openssl_utils::map_openssl_error(err);
}

void OpenSSLProvider::secure_cleanup(std::vector<uint8_t>& buffer) const {
    if (!buffer.empty()) {
        OPENSSL_cleanse(buffer.data(), buffer.size());
        buffer.clear();
    }
}

Result<std::shared_ptr<CryptoProvider>> make_openssl_provider() {
    auto provider = std::make_shared<OpenSSLProvider>();
    auto init = provider->initialize();
    if (init.is_error()) {
        return init.failure();
    }
    return std::shared_ptr<CryptoProvider>(std::move(provider));
}

namespace openssl_utils {

std::string get_openssl_version() {
    return OPENSSL_VERSION_TEXT;
}

SBusError map_openssl_error(unsigned long openssl_error) {
    if (openssl_error == 0) {
        return SBusError::SUCCESS;
    }

    if (ERR_GET_LIB(openssl_error) == ERR_LIB_EVP) {
        switch (ERR_GET_REASON(openssl_error)) {
            case EVP_R_BAD_DECRYPT:
                return SBusError::DECRYPT_ERROR;
            case EVP_R_UNSUPPORTED_CIPHER:
                return SBusError::OPERATION_NOT_SUPPORTED;
            case EVP_R_INVALID_KEY_LENGTH:
            case EVP_R_INVALID_IV_LENGTH:
                return SBusError::INVALID_PARAMETER;
            default:
                break;
        }
    }
    return SBusError::CRYPTO_PROVIDER_ERROR;
}

} // namespace openssl_utils

} // namespace crypto
} // namespace v1
} // namespace sbus
