#include <sbus/crypto/session_keys.h>
#include <sbus/crypto/crypto_utils.h>
#include <algorithm>

namespace sbus {
namespace v1 {
namespace crypto {

namespace {

const char KEY_EXPANSION_LABEL[] = "secure-bus key expansion";

bool all_zero(const std::vector<uint8_t>& data) {
    return std::all_of(data.begin(), data.end(), [](uint8_t b) { return b == 0; });
}

Result<void> validate_random(const std::vector<uint8_t>& random, const char* which) {
    if (random.size() != RANDOM_LENGTH) {
        return Failure(SBusError::INVALID_PARAMETER, std::string(which) + " random must be 32 bytes");
    }
    if (all_zero(random)) {
        return Failure(SBusError::INVALID_PARAMETER, std::string(which) + " random is all zero");
    }
    return make_result();
}

} // namespace

SessionKeys::~SessionKeys() {
    clear();
}

void SessionKeys::clear() {
    utils::secure_zero(client_write_key);
    utils::secure_zero(server_write_key);
    utils::secure_zero(client_write_iv);
    utils::secure_zero(server_write_iv);
    utils::secure_zero(client_mac_key);
    utils::secure_zero(server_mac_key);
}

Result<SessionKeys> SessionKeys::derive(CryptoProvider& provider,
                                        const std::vector<uint8_t>& master_key,
                                        const std::vector<uint8_t>& client_random,
                                        const std::vector<uint8_t>& server_random) {
    if (master_key.empty()) {
        return make_error<SessionKeys>(SBusError::INVALID_PARAMETER, "empty master key");
    }
    SBUS_TRY_VOID(validate_random(client_random, "client"));
    SBUS_TRY_VOID(validate_random(server_random, "server"));
    if (utils::constant_time_compare(client_random, server_random)) {
        return make_error<SessionKeys>(SBusError::INVALID_PARAMETER, "client and server randoms are equal");
    }

    const size_t total = 2 * WRITE_KEY_LENGTH + 2 * IV_LENGTH + 2 * MAC_KEY_LENGTH;

    KeyDerivationParams params;
    params.secret = master_key;
    params.salt = client_random;
    utils::append(params.salt, server_random);
    params.info = utils::to_bytes(KEY_EXPANSION_LABEL);
    params.output_length = total;
    params.hash_algorithm = HashAlgorithm::SHA256;

    auto block = provider.derive_key_hkdf(params);
    utils::secure_zero(params.secret);
    if (!block) {
        return block.failure();
    }

    SessionKeys keys;
    auto it = block->begin();
    keys.client_write_key.assign(it, it + WRITE_KEY_LENGTH);
    it += WRITE_KEY_LENGTH;
    keys.server_write_key.assign(it, it + WRITE_KEY_LENGTH);
    it += WRITE_KEY_LENGTH;
    keys.client_write_iv.assign(it, it + IV_LENGTH);
    it += IV_LENGTH;
    keys.server_write_iv.assign(it, it + IV_LENGTH);
    it += IV_LENGTH;
    keys.client_mac_key.assign(it, it + MAC_KEY_LENGTH);
    it += MAC_KEY_LENGTH;
    keys.server_mac_key.assign(it, it + MAC_KEY_LENGTH);

    utils::secure_zero(*block);
    return keys;
}

Result<std::vector<uint8_t>> SessionKeys::next_generation(CryptoProvider& provider,
                                                          const std::vector<uint8_t>& key) {
    if (key.empty()) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_PARAMETER, "empty traffic key");
    }
    return utils::hkdf_expand_label(provider, key, "key update", {}, key.size());
}

Result<std::vector<uint8_t>> SessionKeys::resumption_secret(CryptoProvider& provider,
                                                            const std::vector<uint8_t>& master_key,
                                                            const std::vector<uint8_t>& client_random,
                                                            const std::vector<uint8_t>& server_random) {
    if (master_key.empty()) {
        return make_error<std::vector<uint8_t>>(SBusError::INVALID_PARAMETER, "empty master key");
    }
    std::vector<uint8_t> context = client_random;
    context.insert(context.end(), server_random.begin(), server_random.end());
    return utils::hkdf_expand_label(provider, master_key, "resumption", context, 32);
}

const std::vector<uint8_t>& SessionKeys::write_key(ConnectionRole writer) const {
    return writer == ConnectionRole::CLIENT ? client_write_key : server_write_key;
}

const std::vector<uint8_t>& SessionKeys::write_iv(ConnectionRole writer) const {
    return writer == ConnectionRole::CLIENT ? client_write_iv : server_write_iv;
}

const std::vector<uint8_t>& SessionKeys::mac_key(ConnectionRole writer) const {
    return writer == ConnectionRole::CLIENT ? client_mac_key : server_mac_key;
}

std::string KeyMaterialRegistry::pair_key(ConnectionRole role,
                                          const std::vector<uint8_t>& client_random,
                                          const std::vector<uint8_t>& server_random) {
    return to_string(role) + ":" + utils::to_hex(client_random) + ":" + utils::to_hex(server_random);
}

Result<void> KeyMaterialRegistry::register_pair(ConnectionRole role,
                                                const std::vector<uint8_t>& client_random,
                                                const std::vector<uint8_t>& server_random) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pairs_.insert(pair_key(role, client_random, server_random)).second) {
        return Failure(SBusError::KEY_MATERIAL_REUSED, "random pair already used");
    }
    return make_result();
}

bool KeyMaterialRegistry::contains(ConnectionRole role,
                                   const std::vector<uint8_t>& client_random,
                                   const std::vector<uint8_t>& server_random) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pairs_.count(pair_key(role, client_random, server_random)) > 0;
}

size_t KeyMaterialRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pairs_.size();
}

void KeyMaterialRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    pairs_.clear();
}

} // namespace crypto
} // namespace v1
} // namespace sbus
