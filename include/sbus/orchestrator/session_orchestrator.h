#ifndef SBUS_ORCHESTRATOR_SESSION_ORCHESTRATOR_H
#define SBUS_ORCHESTRATOR_SESSION_ORCHESTRATOR_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/context.h>
#include <sbus/device/hardware_queue.h>
#include <sbus/monitoring/metrics.h>
#include <sbus/protocol/certificate_pinner.h>
#include <sbus/protocol/handshake.h>
#include <sbus/protocol/record_layer.h>
#include <sbus/security/critical_action_guard.h>
#include <sbus/security/rate_limiter.h>
#include <sbus/session/session_cache.h>
#include <sbus/session/timeout_manager.h>
#include <sbus/transport/channel.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace orchestrator {

// Client messages that follow the server's first flight
struct ClientFlight {
    protocol::ClientKeyExchange key_exchange;
    protocol::Finished finished;
};

// Server answer to a ClientHello; resumed means no further messages follow
struct ServerFlight {
    protocol::ServerHello server_hello;
    protocol::CertificateMessage certificate;
    bool resumed = false;
};

/**
 * One bus session from configuration to teardown.
 *
 * CONFIGURED -> HANDSHAKING -> ESTABLISHED, with FAILED on any handshake
 * error and CLOSED after teardown(). configure() starts over from FAILED
 * or CLOSED.
 *
 * Client:  start_handshake -> perform_handshake -> complete_handshake,
 *          or resume -> complete_resumption.
 * Server:  accept -> finish_accept (skipped when accept() resumed).
 *
 * Established sessions encrypt through an OutboundRecordLayer and decrypt
 * through an InboundRecordLayer built from the negotiated keys. Completed
 * sessions are cached under the peer hostname for later resumption.
 */
class SBUS_API SessionOrchestrator {
public:
    static Result<std::unique_ptr<SessionOrchestrator>> create(
        std::shared_ptr<BusContext> context,
        ConnectionRole role,
        std::shared_ptr<transport::Channel> channel,
        std::shared_ptr<session::SessionCache> cache = nullptr,
        std::shared_ptr<device::HardwareCommandQueue> hardware = nullptr);

    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    Result<void> configure(const Bytes& master_key,
                           std::vector<Bytes> certificate_chain,
                           const std::string& peer_hostname);

    // Client role
    Result<protocol::ClientHello> start_handshake();
    Result<ClientFlight> perform_handshake(const protocol::ServerHello& server_hello,
                                           const protocol::CertificateMessage& certificate);
    Result<void> complete_handshake(const protocol::Finished& server_finished);

    // SESSION_NOT_FOUND when nothing valid is cached for (hostname, session_id)
    Result<protocol::ClientHello> resume(const std::string& hostname, const Bytes& session_id);
    Result<void> complete_resumption(const protocol::ServerHello& server_hello);

    // Server role
    Result<ServerFlight> accept(const protocol::ClientHello& client_hello);
    Result<protocol::Finished> finish_accept(const protocol::ClientKeyExchange& key_exchange,
                                             const protocol::Finished& client_finished);

    /**
     * Protect plaintext and send it to destination over the channel
     * @return The wire record
     */
    Result<Bytes> encrypt_message(const std::string& destination, const Bytes& plaintext);

    // Token presented to the channel with every record
    void set_channel_token(std::string token);

    Result<Bytes> decrypt_message(const std::string& source, const Bytes& record);

    Result<device::RequestId> execute_hardware_command(HardwareCommand command, const Bytes& params);
    std::optional<device::HardwareResponse> poll_hardware_response();

    // Fails the handshake once its deadline passed; true if it did
    bool check_timeouts();

    void teardown();

    SessionState state() const;
    ConnectionRole role() const { return role_; }
    const std::string& name() const { return name_; }
    Bytes session_id() const;

    uint8_t health_score() const;
    monitoring::MetricsSnapshot metrics() const;
    std::optional<protocol::RecordLayerStats> outbound_stats() const;
    std::optional<protocol::RecordLayerStats> inbound_stats() const;

    const std::shared_ptr<protocol::CertificatePinner>& pinner() const { return pinner_; }

private:
    SessionOrchestrator(std::shared_ptr<BusContext> context,
                        ConnectionRole role,
                        std::shared_ptr<transport::Channel> channel,
                        std::shared_ptr<session::SessionCache> cache,
                        std::shared_ptr<device::HardwareCommandQueue> hardware);

    Result<void> require_state_locked(SessionState expected, const char* step) const;
    Result<void> check_deadline_locked();
    bool session_expired_locked();
    Result<void> admit_handshake_locked();
    Result<void> establish_locked(const crypto::SessionKeys& keys, bool resumed);
    Result<void> cache_session_locked(const Bytes& client_random, const Bytes& server_random);
    void fail_locked(SBusError error, const std::string& reason);
    void release_session_locked();

    template <typename T>
    Result<T> step_failed_locked(const Failure& failure) {
        fail_locked(failure.code, failure.detail);
        return failure;
    }

    std::shared_ptr<BusContext> context_;
    ConnectionRole role_;
    std::shared_ptr<transport::Channel> channel_;
    std::shared_ptr<session::SessionCache> cache_;
    std::shared_ptr<device::HardwareCommandQueue> hardware_;
    std::shared_ptr<protocol::CertificatePinner> pinner_;
    std::string name_;

    security::RateLimiter rate_limiter_;
    security::CriticalActionGuard guard_;
    session::TimeoutManager timeouts_;
    monitoring::MetricsCollector metrics_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::CONFIGURED;
    bool configured_ = false;
    Bytes master_key_;
    std::string peer_hostname_;
    std::vector<Bytes> certificate_chain_;

    std::unique_ptr<protocol::HandshakeStateMachine> handshake_;
    std::unique_ptr<protocol::HandshakeResponder> responder_;
    Bytes pending_resumption_secret_;
    Bytes session_id_;
    uint16_t suite_ = 0;
    std::string channel_token_;
    Timestamp handshake_started_{0};

    std::shared_ptr<const crypto::SessionKeys> keys_;
    // Shared so a send can run outside mutex_ while teardown() proceeds
    std::shared_ptr<protocol::OutboundRecordLayer> outbound_;
    std::shared_ptr<protocol::InboundRecordLayer> inbound_;
};

} // namespace orchestrator
} // namespace v1
} // namespace sbus

#endif // SBUS_ORCHESTRATOR_SESSION_ORCHESTRATOR_H
