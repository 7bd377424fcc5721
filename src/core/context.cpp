#include <sbus/context.h>
#include <sbus/crypto/openssl_provider.h>

namespace sbus {
namespace v1 {

Result<std::shared_ptr<BusContext>> BusContext::create(const BusConfig& config,
                                                       std::shared_ptr<Clock> clock,
                                                       std::shared_ptr<crypto::CryptoProvider> provider) {
    SBUS_TRY_VOID(config.validate());

    if (!clock) {
        return make_error<std::shared_ptr<BusContext>>(SBusError::INVALID_PARAMETER, "no clock");
    }

    if (!provider) {
        provider = SBUS_TRY(crypto::make_openssl_provider());
    } else if (!provider->is_available()) {
        return make_error<std::shared_ptr<BusContext>>(SBusError::CRYPTO_PROVIDER_ERROR,
                                                       provider->name() + " unavailable");
    }

    return std::shared_ptr<BusContext>(new BusContext(config, std::move(clock), std::move(provider)));
}

BusContext::BusContext(const BusConfig& config,
                       std::shared_ptr<Clock> clock,
                       std::shared_ptr<crypto::CryptoProvider> provider)
    : config_(config)
    , clock_(std::move(clock))
    , reporter_(std::make_shared<ErrorReporter>(config.reporting, clock_))
    , crypto_(std::move(provider))
    , key_registry_(std::make_shared<crypto::KeyMaterialRegistry>())
    , sandboxes_(std::make_unique<routing::SandboxRegistry>()) {}

} // namespace v1
} // namespace sbus
