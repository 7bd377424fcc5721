#ifndef SBUS_PROTOCOL_HANDSHAKE_H
#define SBUS_PROTOCOL_HANDSHAKE_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>
#include <sbus/error_reporter.h>
#include <sbus/crypto/provider.h>
#include <sbus/crypto/crypto_key.h>
#include <sbus/crypto/session_keys.h>
#include <sbus/protocol/certificate_pinner.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace protocol {

// Null compression, the only method on the bus
constexpr uint8_t COMPRESSION_NULL = 0;
constexpr size_t SESSION_ID_LENGTH = 32;

struct ClientHello {
    uint16_t version = PROTOCOL_VERSION;
    Bytes random;
    Bytes session_id;
    std::vector<CipherSuite> cipher_suites;
    std::vector<uint8_t> compression_methods;
};

struct ServerHello {
    uint16_t version = PROTOCOL_VERSION;
    Bytes random;
    Bytes session_id;
    CipherSuite cipher_suite = CipherSuite::RSA_WITH_AES_128_CBC_SHA;
    uint8_t compression_method = COMPRESSION_NULL;
};

struct CertificateMessage {
    // Leaf first
    std::vector<Bytes> cert_chain;
};

struct ClientKeyExchange {
    // CryptoKey text form of the pre-master value
    std::string encrypted_premaster;
};

struct Finished {
    std::string verify_data;
};

/**
 * Client side of the bus handshake.
 *
 * ClientHello -> ServerHello -> Certificate -> ClientKeyExchange -> Finished,
 * strictly in that order. Each step checks the state it requires and fails
 * with INVALID_STATE otherwise; only reset() goes back to INITIAL. The
 * machine performs no I/O: the caller carries messages to and from the peer.
 *
 * The deadline runs from generate_client_hello(). Once it has passed every
 * step fails with HANDSHAKE_TIMEOUT until reset().
 */
class SBUS_API HandshakeStateMachine {
public:
    static constexpr const char* PREMASTER_VALUE = "premaster_secret_48_bytes_long_fixed_value_v1";
    static constexpr const char* FINISHED_TAG = "finished_verify_data_v1";
    static constexpr const char* KEY_CONTEXT = "handshake";

    static Result<std::unique_ptr<HandshakeStateMachine>> create(
        std::shared_ptr<crypto::CryptoProvider> provider,
        const Bytes& master_key,
        const HandshakeConfig& config,
        std::shared_ptr<Clock> clock,
        std::shared_ptr<crypto::KeyMaterialRegistry> key_registry = nullptr,
        std::shared_ptr<CertificatePinner> pinner = nullptr,
        std::shared_ptr<ErrorReporter> reporter = nullptr);

    ~HandshakeStateMachine();

    HandshakeStateMachine(const HandshakeStateMachine&) = delete;
    HandshakeStateMachine& operator=(const HandshakeStateMachine&) = delete;

    // Hostname the certificate pin is looked up under
    void set_peer_hostname(const std::string& hostname);

    Result<ClientHello> generate_client_hello(std::optional<Bytes> session_id = std::nullopt);

    /**
     * @return PROTOCOL_VERSION_NOT_SUPPORTED on a version mismatch,
     *         HANDSHAKE_FAILURE for a suite that was not offered,
     *         COMPRESSION_DETECTED for a non-null compression method
     */
    Result<void> process_server_hello(const ServerHello& server_hello);

    // EMPTY_CHAIN, EMPTY_CERTIFICATE, or a pinning failure
    Result<void> process_certificate(const CertificateMessage& certificate);

    Result<ClientKeyExchange> generate_client_key_exchange();

    // Also derives the session keys
    Result<Finished> generate_finished();

    // VERIFICATION_FAILED if the server tag does not decrypt to the expected value
    Result<void> verify_server_finished(const Finished& finished);

    /**
     * Abbreviated handshake from a cached session or ticket.
     *
     * Valid only in SERVER_HELLO_RECEIVED. Keys are derived from the
     * resumption secret and the fresh randoms, and the machine goes straight
     * to FINISHED.
     */
    Result<void> complete_with_psk(const std::string& psk_identity, const Bytes& resumption_secret);

    void reset();

    HandshakeState state() const;
    bool is_complete() const;
    bool is_timed_out() const;

    // SESSION_NOT_ESTABLISHED before FINISHED
    Result<crypto::SessionKeys> session_keys() const;

    Bytes client_random() const;
    Bytes server_random() const;
    // Session id assigned by the server, or the one offered for resumption
    Bytes session_id() const;
    std::optional<CipherSuite> negotiated_suite() const;
    std::optional<std::string> psk_identity() const;

private:
    HandshakeStateMachine(std::shared_ptr<crypto::CryptoProvider> provider,
                          const Bytes& master_key,
                          crypto::CryptoKey handshake_key,
                          const HandshakeConfig& config,
                          std::shared_ptr<Clock> clock,
                          std::shared_ptr<crypto::KeyMaterialRegistry> key_registry,
                          std::shared_ptr<CertificatePinner> pinner,
                          std::shared_ptr<ErrorReporter> reporter);

    Result<void> require_state_locked(HandshakeState expected, const char* step);
    Result<void> derive_keys_locked(const Bytes& secret);
    void fail_locked(SBusError error, const std::string& message);

    std::shared_ptr<crypto::CryptoProvider> provider_;
    Bytes master_key_;
    crypto::CryptoKey handshake_key_;
    HandshakeConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<crypto::KeyMaterialRegistry> key_registry_;
    std::shared_ptr<CertificatePinner> pinner_;
    std::shared_ptr<ErrorReporter> reporter_;

    mutable std::mutex mutex_;
    HandshakeState state_ = HandshakeState::INITIAL;
    std::string peer_hostname_;
    Timestamp started_at_{0};
    bool timed_out_ = false;
    Bytes client_random_;
    Bytes server_random_;
    Bytes session_id_;
    std::optional<CipherSuite> suite_;
    std::optional<std::string> psk_identity_;
    bool server_verified_ = false;
    crypto::SessionKeys keys_;
};

/**
 * Server side counterpart used by the responding end of a bus session.
 *
 * Picks the first suite from its own preference list that the client
 * offered, serves the configured certificate chain, checks the client's
 * key exchange and Finished, and answers with its own Finished.
 */
class SBUS_API HandshakeResponder {
public:
    static Result<std::unique_ptr<HandshakeResponder>> create(
        std::shared_ptr<crypto::CryptoProvider> provider,
        const Bytes& master_key,
        const HandshakeConfig& config,
        std::vector<Bytes> certificate_chain,
        std::shared_ptr<crypto::KeyMaterialRegistry> key_registry = nullptr);

    ~HandshakeResponder();

    HandshakeResponder(const HandshakeResponder&) = delete;
    HandshakeResponder& operator=(const HandshakeResponder&) = delete;

    Result<ServerHello> process_client_hello(const ClientHello& client_hello);
    CertificateMessage certificate_message() const;
    Result<void> process_client_key_exchange(const ClientKeyExchange& exchange);

    // Verifies the client Finished, derives keys, returns the server Finished
    Result<Finished> process_client_finished(const Finished& finished);

    /**
     * Abbreviated handshake: after process_client_hello() accepted a
     * resumption offer, derive keys from the cached resumption secret.
     */
    Result<void> complete_with_psk(const Bytes& resumption_secret);

    bool is_complete() const;
    Result<crypto::SessionKeys> session_keys() const;

    Bytes client_random() const;
    Bytes server_random() const;
    Bytes session_id() const;

private:
    enum class Stage : uint8_t {
        AWAIT_CLIENT_HELLO,
        AWAIT_KEY_EXCHANGE,
        AWAIT_FINISHED,
        DONE
    };

    HandshakeResponder(std::shared_ptr<crypto::CryptoProvider> provider,
                       const Bytes& master_key,
                       crypto::CryptoKey handshake_key,
                       const HandshakeConfig& config,
                       std::vector<Bytes> certificate_chain,
                       std::shared_ptr<crypto::KeyMaterialRegistry> key_registry);

    std::shared_ptr<crypto::CryptoProvider> provider_;
    Bytes master_key_;
    crypto::CryptoKey handshake_key_;
    HandshakeConfig config_;
    std::vector<Bytes> certificate_chain_;
    std::shared_ptr<crypto::KeyMaterialRegistry> key_registry_;

    mutable std::mutex mutex_;
    Stage stage_ = Stage::AWAIT_CLIENT_HELLO;
    Bytes client_random_;
    Bytes server_random_;
    Bytes session_id_;
    crypto::SessionKeys keys_;
};

} // namespace protocol
} // namespace v1
} // namespace sbus

#endif // SBUS_PROTOCOL_HANDSHAKE_H
