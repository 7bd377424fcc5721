#include <sbus/control/control_signer.h>
#include <sbus/crypto/crypto_utils.h>

namespace sbus {
namespace v1 {
namespace control {

Result<ControlSigner> ControlSigner::create(std::shared_ptr<crypto::CryptoProvider> provider,
                                            const Bytes& module_secret,
                                            const std::string& module) {
    if (!provider) {
        return make_error<ControlSigner>(SBusError::INVALID_PARAMETER, "no crypto provider");
    }
    if (module_secret.empty() || module.empty()) {
        return make_error<ControlSigner>(SBusError::INVALID_PARAMETER, "module secret and name are required");
    }

    auto key = SBUS_TRY(crypto::utils::hmac_sha256(*provider, module_secret,
                                                   crypto::utils::to_bytes(KEY_LABEL + module)));
    return ControlSigner(std::move(provider), std::move(key), module);
}

ControlSigner::ControlSigner(std::shared_ptr<crypto::CryptoProvider> provider, Bytes key, std::string module)
    : provider_(std::move(provider))
    , key_(std::move(key))
    , module_(std::move(module)) {}

ControlSigner::~ControlSigner() {
    crypto::utils::secure_zero(key_);
}

Result<std::string> ControlSigner::sign(const ControlMessage& message) const {
    auto mac = SBUS_TRY(crypto::utils::hmac_sha256(*provider_, key_,
                                                   crypto::utils::to_bytes(message.canonical_form())));
    return crypto::utils::to_hex(mac);
}

Result<void> ControlSigner::sign_in_place(ControlMessage& message) const {
    auto signature = SBUS_TRY(sign(message));
    message.set_signature(std::move(signature));
    return make_result();
}

Result<void> ControlSigner::verify(const ControlMessage& message) const {
    if (!message.signature()) {
        return Failure(SBusError::MISSING_FIELD, "unsigned control message");
    }
    auto named = message.module();
    if (named && *named != module_) {
        return Failure(SBusError::UNAUTHORIZED_COMPONENT, "message is for module " + *named);
    }

    auto expected = SBUS_TRY(sign(message));
    if (!crypto::utils::constant_time_compare(expected, *message.signature())) {
        return Failure(SBusError::SIGNATURE_MISMATCH, to_string(message.tag()) + " signature mismatch");
    }
    return make_result();
}

} // namespace control
} // namespace v1
} // namespace sbus
