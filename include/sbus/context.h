#ifndef SBUS_CONTEXT_H
#define SBUS_CONTEXT_H

#include <sbus/config.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>
#include <sbus/error_reporter.h>
#include <sbus/crypto/provider.h>
#include <sbus/crypto/session_keys.h>
#include <sbus/routing/sandbox.h>
#include <memory>

namespace sbus {
namespace v1 {

/**
 * Runtime context of one secure bus instance.
 *
 * Created once at startup and handed by shared_ptr to every component that
 * needs the clock, the reporter, the crypto provider, the sandbox flags or
 * the configuration. There are no process-wide singletons.
 */
class SBUS_API BusContext {
public:
    /**
     * Validates the configuration and assembles the context.
     *
     * A null provider selects the OpenSSL provider.
     */
    static Result<std::shared_ptr<BusContext>> create(
        const BusConfig& config,
        std::shared_ptr<Clock> clock = make_steady_clock(),
        std::shared_ptr<crypto::CryptoProvider> provider = nullptr);

    BusContext(const BusContext&) = delete;
    BusContext& operator=(const BusContext&) = delete;

    const BusConfig& config() const { return config_; }
    const std::shared_ptr<Clock>& clock() const { return clock_; }
    const std::shared_ptr<ErrorReporter>& reporter() const { return reporter_; }
    const std::shared_ptr<crypto::CryptoProvider>& crypto() const { return crypto_; }

    // Every (client_random, server_random) pair keys were derived from
    const std::shared_ptr<crypto::KeyMaterialRegistry>& key_registry() const { return key_registry_; }

    routing::SandboxRegistry& sandboxes() { return *sandboxes_; }
    const routing::SandboxRegistry& sandboxes() const { return *sandboxes_; }

private:
    BusContext(const BusConfig& config,
               std::shared_ptr<Clock> clock,
               std::shared_ptr<crypto::CryptoProvider> provider);

    BusConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ErrorReporter> reporter_;
    std::shared_ptr<crypto::CryptoProvider> crypto_;
    std::shared_ptr<crypto::KeyMaterialRegistry> key_registry_;
    std::unique_ptr<routing::SandboxRegistry> sandboxes_;
};

} // namespace v1
} // namespace sbus

#endif // SBUS_CONTEXT_H
