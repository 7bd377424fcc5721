#ifndef SBUS_CONTROL_CONTROL_SIGNER_H
#define SBUS_CONTROL_CONTROL_SIGNER_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/crypto/provider.h>
#include <sbus/control/control_message.h>

#include <memory>
#include <string>

namespace sbus {
namespace v1 {
namespace control {

/**
 * Signs and verifies control messages for one module.
 *
 * key       = HMAC-SHA256(module_secret, "secure-bus control v1:" ‖ module)
 * signature = HMAC-SHA256(key, canonical_form), lower-case hex
 */
class SBUS_API ControlSigner {
public:
    static constexpr const char* KEY_LABEL = "secure-bus control v1:";

    static Result<ControlSigner> create(std::shared_ptr<crypto::CryptoProvider> provider,
                                        const Bytes& module_secret,
                                        const std::string& module);

    ControlSigner(const ControlSigner& other) = default;
    ControlSigner& operator=(const ControlSigner& other) = default;
    ControlSigner(ControlSigner&& other) noexcept = default;
    ControlSigner& operator=(ControlSigner&& other) noexcept = default;
    ~ControlSigner();

    Result<std::string> sign(const ControlMessage& message) const;

    // Sets the sig field
    Result<void> sign_in_place(ControlMessage& message) const;

    /**
     * @return MISSING_FIELD when unsigned, UNAUTHORIZED_COMPONENT when the
     *         message names another module, SIGNATURE_MISMATCH otherwise
     */
    Result<void> verify(const ControlMessage& message) const;

    const std::string& module() const { return module_; }

private:
    ControlSigner(std::shared_ptr<crypto::CryptoProvider> provider, Bytes key, std::string module);

    std::shared_ptr<crypto::CryptoProvider> provider_;
    Bytes key_;
    std::string module_;
};

} // namespace control
} // namespace v1
} // namespace sbus

#endif // SBUS_CONTROL_CONTROL_SIGNER_H
