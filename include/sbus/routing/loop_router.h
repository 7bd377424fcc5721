#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/context.h>
#include <sbus/auth/component_token.h>
#include <sbus/crypto/crypto_key.h>
#include <sbus/device/hardware_queue.h>
#include <sbus/security/anomaly_detector.h>
#include <sbus/security/critical_action_guard.h>
#include <sbus/security/honeypot.h>
#include <sbus/transport/channel.h>

#include <array>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace routing {

// Queued payload, sealed with the loop key (from and to are the AAD)
struct LoopMessage {
    std::string from;
    std::string to;
    Bytes sealed;
    Timestamp queued_at{0};
};

struct LoopStats {
    uint64_t messages_routed = 0;
    uint64_t messages_delivered = 0;
    uint64_t authorization_failures = 0;
    uint64_t unknown_destinations = 0;
    uint64_t sandbox_rejections = 0;
    uint64_t queue_overflows = 0;
};

class LoopRouter;

/**
 * Channel bound to one node of one loop.
 *
 * send() routes through the loop on behalf of the node; receive() opens the
 * next message queued for it.
 */
class SBUS_API LoopChannel : public transport::Channel {
public:
    LoopChannel(std::shared_ptr<LoopRouter> router, LoopKind kind, std::string node);

    bool send(const std::string& destination, const Bytes& payload, const std::string& token) override;

    std::optional<Bytes> receive();

    // Result of the last send, for callers that need the reason
    SBusError last_error() const { return last_error_; }

    LoopKind kind() const { return kind_; }
    const std::string& node() const { return node_; }

private:
    std::shared_ptr<LoopRouter> router_;
    LoopKind kind_;
    std::string node_;
    SBusError last_error_ = SBusError::SUCCESS;
};

/**
 * Routes traffic for every loop kind.
 *
 * One routing table per kind, held in a fixed array indexed by the kind.
 * Each table maps node names to inbound queues. All operations require
 * the global transport sandbox and the loop's own sandbox to be active.
 * Tokens are accepted only from the loop's permitted components; a failed
 * authorization is reported to the anomaly detector and the honeypot.
 */
class SBUS_API LoopRouter : public std::enable_shared_from_this<LoopRouter> {
public:
    static constexpr const char* HARDWARE_SOURCE = "bus-kernel";

    static Result<std::shared_ptr<LoopRouter>> create(
        std::shared_ptr<BusContext> context,
        std::shared_ptr<auth::ComponentTokenManager> tokens,
        std::shared_ptr<device::HardwareCommandQueue> hardware = nullptr,
        std::shared_ptr<security::AnomalyDetector> anomalies = nullptr,
        std::shared_ptr<security::Honeypot> honeypot = nullptr);

    LoopRouter(const LoopRouter&) = delete;
    LoopRouter& operator=(const LoopRouter&) = delete;

    static const std::vector<ComponentType>& permitted_components(LoopKind kind);

    Result<void> register_node(LoopKind kind, const std::string& node);
    Result<void> unregister_node(LoopKind kind, const std::string& node);
    std::vector<std::string> list_nodes(LoopKind kind) const;

    /**
     * Validate the token and queue payload for node to
     * @return SANDBOX_INACTIVE, INVALID_TOKEN, TOKEN_EXPIRED, TOKEN_REVOKED,
     *         UNAUTHORIZED_COMPONENT, DESTINATION_NOT_FOUND or QUEUE_FULL
     */
    Result<void> send_message(LoopKind kind,
                              const std::string& from,
                              const std::string& to,
                              const Bytes& payload,
                              const std::string& token);

    // Next payload queued for node; QUEUE_EMPTY when there is none
    Result<Bytes> receive(LoopKind kind, const std::string& node);

    size_t pending(LoopKind kind, const std::string& node) const;

    // Token check alone, with the same side effects as in send_message
    Result<auth::ComponentToken> authorize(LoopKind kind, const std::string& source, const std::string& token);

    std::shared_ptr<LoopChannel> channel(LoopKind kind, const std::string& node);

    /**
     * Queue a hardware command through the kernel loop.
     *
     * Critical commands are refused with CRITICAL_ACTION_COOLDOWN while
     * their cooldown runs.
     */
    Result<device::RequestId> execute_hardware_command(HardwareCommand command,
                                                       const Bytes& params,
                                                       const std::string& token);

    /**
     * Queue a health poll unless one ran less than health_poll_interval ago.
     * @return true when a poll was issued
     */
    Result<bool> trigger_health_poll(Timestamp now);

    LoopStats stats(LoopKind kind) const;

private:
    struct Loop {
        explicit Loop(crypto::CryptoKey loop_key) : key(std::move(loop_key)) {}

        mutable std::mutex mutex;
        std::map<std::string, std::deque<LoopMessage>> nodes;
        crypto::CryptoKey key;
        LoopStats stats;
    };

    LoopRouter(std::shared_ptr<BusContext> context,
               std::shared_ptr<auth::ComponentTokenManager> tokens,
               std::shared_ptr<device::HardwareCommandQueue> hardware,
               std::shared_ptr<security::AnomalyDetector> anomalies,
               std::shared_ptr<security::Honeypot> honeypot);

    Loop& loop(LoopKind kind) { return *loops_[static_cast<size_t>(kind)]; }
    const Loop& loop(LoopKind kind) const { return *loops_[static_cast<size_t>(kind)]; }

    Result<void> check_sandbox(LoopKind kind);
    void signal_intrusion(LoopKind kind, const std::string& source, const std::string& reason);

    std::shared_ptr<BusContext> context_;
    std::shared_ptr<auth::ComponentTokenManager> tokens_;
    std::shared_ptr<device::HardwareCommandQueue> hardware_;
    std::shared_ptr<security::AnomalyDetector> anomalies_;
    std::shared_ptr<security::Honeypot> honeypot_;
    security::CriticalActionGuard guard_;

    std::array<std::unique_ptr<Loop>, LOOP_KIND_COUNT> loops_;

    std::mutex poll_mutex_;
    std::optional<Timestamp> last_health_poll_;
};

} // namespace routing
} // namespace v1
} // namespace sbus
