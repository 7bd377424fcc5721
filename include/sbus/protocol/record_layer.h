#ifndef SBUS_PROTOCOL_RECORD_LAYER_H
#define SBUS_PROTOCOL_RECORD_LAYER_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>
#include <sbus/error_reporter.h>
#include <sbus/crypto/provider.h>
#include <sbus/crypto/session_keys.h>
#include <sbus/protocol/compression_detector.h>
#include <sbus/protocol/replay_registry.h>
#include <sbus/security/circuit_breaker.h>
#include <sbus/security/rate_limiter.h>
#include <sbus/transport/channel.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {
namespace protocol {

// Wire record: nonce ‖ AEAD(envelope) ‖ tag
constexpr size_t RECORD_NONCE_LENGTH = AEAD_NONCE_LENGTH;
constexpr size_t RECORD_TAG_LENGTH = AEAD_TAG_LENGTH;
// Envelope: sequence (LE) ‖ HMAC-SHA256(payload) ‖ payload
constexpr size_t ENVELOPE_HEADER_LENGTH = SEQUENCE_LENGTH + HMAC_TAG_LENGTH;
constexpr size_t RECORD_OVERHEAD = RECORD_NONCE_LENGTH + ENVELOPE_HEADER_LENGTH + RECORD_TAG_LENGTH;

/**
 * Record layer statistics, one set per direction
 */
struct RecordLayerStats {
    uint64_t records_processed = 0;
    uint64_t bytes_processed = 0;
    uint64_t transport_errors = 0;

    uint64_t rejected_circuit_open = 0;
    uint64_t rejected_size = 0;
    uint64_t rejected_compression = 0;
    uint64_t rejected_rate_limited = 0;
    uint64_t rejected_replay = 0;
    uint64_t rejected_tampered = 0;
    uint64_t rejected_decrypt = 0;

    uint64_t key_generation = 0;
    uint64_t key_rotations = 0;
    security::CircuitState circuit_state = security::CircuitState::CLOSED;
};

/**
 * Chain of traffic keys for one direction.
 *
 * Generation 0 is the handshake key; generation n+1 is
 * SessionKeys::next_generation(generation n). Older generations are
 * dropped once the schedule advances past them.
 */
class SBUS_API TrafficKeySchedule {
public:
    TrafficKeySchedule(std::shared_ptr<crypto::CryptoProvider> provider, Bytes initial_key);
    ~TrafficKeySchedule();

    TrafficKeySchedule(const TrafficKeySchedule&) = delete;
    TrafficKeySchedule& operator=(const TrafficKeySchedule&) = delete;

    // Derives forward as needed; KEY_NOT_FOUND for dropped generations
    Result<Bytes> key_for(uint64_t generation);

    Result<void> advance_to(uint64_t generation);

    uint64_t current_generation() const { return base_generation_; }

private:
    std::shared_ptr<crypto::CryptoProvider> provider_;
    // keys_[i] is generation base_generation_ + i
    std::vector<Bytes> keys_;
    uint64_t base_generation_ = 0;
};

/**
 * Sending direction of a bus session.
 *
 * Pipeline per message: circuit breaker -> size bound -> anti-CRIME check
 * -> per-destination rate limit -> key rotation -> sequence and nonce ->
 * HMAC over the payload -> envelope -> AES-GCM -> channel. A channel that
 * refuses a record counts as a transport failure; error_threshold
 * consecutive failures open the breaker.
 */
class SBUS_API OutboundRecordLayer {
public:
    OutboundRecordLayer(const RecordLayerConfig& config,
                        std::shared_ptr<const crypto::SessionKeys> keys,
                        ConnectionRole writer,
                        std::shared_ptr<transport::Channel> channel,
                        std::shared_ptr<crypto::CryptoProvider> provider,
                        std::shared_ptr<Clock> clock,
                        std::shared_ptr<ErrorReporter> reporter = nullptr);
    ~OutboundRecordLayer();

    OutboundRecordLayer(const OutboundRecordLayer&) = delete;
    OutboundRecordLayer& operator=(const OutboundRecordLayer&) = delete;

    // Token presented to the channel with every record
    void set_channel_token(std::string token);

    /**
     * Protect payload and hand it to the channel
     * @return The wire record that was sent
     */
    Result<Bytes> send(const std::string& destination, const Bytes& payload);

    RecordLayerStats stats() const;
    void reset_circuit_breaker();
    bool is_circuit_open() const;

private:
    Result<void> validate(const std::string& destination, const Bytes& payload);
    Result<void> rotate_if_due_locked(Timestamp now);
    Result<Bytes> seal_locked(const Bytes& payload);
    void count_rejection(SBusError error);

    RecordLayerConfig config_;
    std::shared_ptr<const crypto::SessionKeys> keys_;
    ConnectionRole writer_;
    std::shared_ptr<transport::Channel> channel_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ErrorReporter> reporter_;

    security::CircuitBreaker breaker_;
    std::unique_ptr<security::RateLimiter> rate_limiter_;
    CompressionDetector compression_;
    SequenceNumberManager sequences_;
    NonceRegistry nonces_;

    mutable std::mutex mutex_;
    TrafficKeySchedule schedule_;
    Timestamp last_rotation_{0};
    std::string token_;
    RecordLayerStats stats_;
};

/**
 * Receiving direction of a bus session.
 *
 * decrypt (current key generation or up to max_key_lookahead ahead) ->
 * split envelope -> sequence strictly above the last accepted one from
 * this direction's writer -> HMAC check -> non-empty payload -> deliver.
 * The source label only selects the rate limit bucket. Rejected records
 * are counted but never trip the breaker.
 */
class SBUS_API InboundRecordLayer {
public:
    InboundRecordLayer(const RecordLayerConfig& config,
                       std::shared_ptr<const crypto::SessionKeys> keys,
                       ConnectionRole writer,
                       std::shared_ptr<crypto::CryptoProvider> provider,
                       std::shared_ptr<Clock> clock,
                       std::shared_ptr<ErrorReporter> reporter = nullptr);
    ~InboundRecordLayer();

    InboundRecordLayer(const InboundRecordLayer&) = delete;
    InboundRecordLayer& operator=(const InboundRecordLayer&) = delete;

    /**
     * Authenticate and open one record from source
     * @return The payload
     */
    Result<Bytes> receive(const std::string& source, const Bytes& record);

    // Last sequence accepted from the writer of this direction
    std::optional<uint64_t> last_sequence() const;

    RecordLayerStats stats() const;
    void reset_circuit_breaker();
    bool is_circuit_open() const;

private:
    Result<Bytes> open_locked(const Bytes& record, uint64_t& generation_out);
    void count_rejection(SBusError error);

    RecordLayerConfig config_;
    std::shared_ptr<const crypto::SessionKeys> keys_;
    ConnectionRole writer_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ErrorReporter> reporter_;

    security::CircuitBreaker breaker_;
    std::unique_ptr<security::RateLimiter> rate_limiter_;
    CompressionDetector compression_;
    SequenceTracker sequences_;
    NonceRegistry nonces_;
    std::string peer_;

    mutable std::mutex mutex_;
    TrafficKeySchedule schedule_;
    RecordLayerStats stats_;
};

} // namespace protocol
} // namespace v1
} // namespace sbus

#endif // SBUS_PROTOCOL_RECORD_LAYER_H
