#include "sbus/protocol/record_layer.h"
#include "sbus/crypto/crypto_utils.h"
#include <algorithm>
#include <cstring>

namespace sbus::v1::protocol {

namespace {

crypto::AEADCipher cipher_for_key(const Bytes& key) {
    return key.size() == 32 ? crypto::AEADCipher::AES_256_GCM : crypto::AEADCipher::AES_128_GCM;
}

// write IV XOR big-endian sequence over the trailing eight bytes
Bytes record_nonce(const Bytes& iv, uint64_t sequence) {
    Bytes nonce = iv;
    nonce.resize(RECORD_NONCE_LENGTH, 0);
    uint8_t seq_be[SEQUENCE_LENGTH];
    crypto::utils::store_u64_be(sequence, seq_be);
    for (size_t i = 0; i < SEQUENCE_LENGTH; ++i) {
        nonce[RECORD_NONCE_LENGTH - SEQUENCE_LENGTH + i] ^= seq_be[i];
    }
    return nonce;
}

CircuitBreakerConfig breaker_config(const RecordLayerConfig& config) {
    CircuitBreakerConfig breaker;
    breaker.failure_threshold = config.error_threshold;
    breaker.success_threshold = config.breaker_success_threshold;
    breaker.timeout = config.breaker_timeout;
    return breaker;
}

std::unique_ptr<security::RateLimiter> make_rate_limiter(const RecordLayerConfig& config,
                                                         std::shared_ptr<Clock> clock) {
    RateLimitConfig limits;
    limits.window = config.rate_window;
    limits.default_budget = config.rate_limit_per_window;
    limits.enable_whitelist = false;
    return std::make_unique<security::RateLimiter>(limits, std::move(clock));
}

void count_into(RecordLayerStats& stats, SBusError error) {
    switch (error) {
        case SBusError::CIRCUIT_OPEN:
            stats.rejected_circuit_open++;
            break;
        case SBusError::MESSAGE_TOO_LARGE:
        case SBusError::INVALID_MESSAGE_FORMAT:
        case SBusError::EMPTY_PAYLOAD:
        case SBusError::EMPTY_PLAINTEXT:
            stats.rejected_size++;
            break;
        case SBusError::COMPRESSION_DETECTED:
            stats.rejected_compression++;
            break;
        case SBusError::RATE_LIMITED:
        case SBusError::BLACKLISTED:
            stats.rejected_rate_limited++;
            break;
        case SBusError::REPLAY_OR_OUT_OF_ORDER:
        case SBusError::DUPLICATE_NONCE:
            stats.rejected_replay++;
            break;
        case SBusError::TAMPERED_PAYLOAD:
            stats.rejected_tampered++;
            break;
        case SBusError::DECRYPT_ERROR:
            stats.rejected_decrypt++;
            break;
        default:
            break;
    }
}

} // namespace

// ============================================================================
// TrafficKeySchedule Implementation
// ============================================================================

TrafficKeySchedule::TrafficKeySchedule(std::shared_ptr<crypto::CryptoProvider> provider, Bytes initial_key)
    : provider_(std::move(provider)) {
    keys_.push_back(std::move(initial_key));
}

TrafficKeySchedule::~TrafficKeySchedule() {
    for (auto& key : keys_) {
        crypto::utils::secure_zero(key);
    }
}

Result<Bytes> TrafficKeySchedule::key_for(uint64_t generation) {
    if (generation < base_generation_ || keys_.empty() || keys_.front().empty()) {
        return make_error<Bytes>(SBusError::KEY_NOT_FOUND, "traffic key generation not available");
    }
    if (!provider_) {
        return make_error<Bytes>(SBusError::NOT_INITIALIZED, "no crypto provider");
    }

    const uint64_t index = generation - base_generation_;
    while (keys_.size() <= index) {
        auto next = SBUS_TRY(crypto::SessionKeys::next_generation(*provider_, keys_.back()));
        keys_.push_back(std::move(next));
    }
    return keys_[index];
}

Result<void> TrafficKeySchedule::advance_to(uint64_t generation) {
    if (generation <= base_generation_) {
        return make_result();
    }
    SBUS_TRY_VOID(key_for(generation));

    const uint64_t drop = generation - base_generation_;
    for (uint64_t i = 0; i < drop; ++i) {
        crypto::utils::secure_zero(keys_[i]);
    }
    keys_.erase(keys_.begin(), keys_.begin() + static_cast<std::ptrdiff_t>(drop));
    base_generation_ = generation;
    return make_result();
}

// ============================================================================
// OutboundRecordLayer Implementation
// ============================================================================

OutboundRecordLayer::OutboundRecordLayer(const RecordLayerConfig& config,
                                         std::shared_ptr<const crypto::SessionKeys> keys,
                                         ConnectionRole writer,
                                         std::shared_ptr<transport::Channel> channel,
                                         std::shared_ptr<crypto::CryptoProvider> provider,
                                         std::shared_ptr<Clock> clock,
                                         std::shared_ptr<ErrorReporter> reporter)
    : config_(config)
    , keys_(std::move(keys))
    , writer_(writer)
    , channel_(std::move(channel))
    , provider_(provider)
    , clock_(clock)
    , reporter_(std::move(reporter))
    , breaker_(breaker_config(config))
    , rate_limiter_(make_rate_limiter(config, clock))
    , nonces_(config.nonce_registry_capacity)
    , schedule_(provider, keys_ ? keys_->write_key(writer) : Bytes{}) {
    if (clock_) {
        last_rotation_ = clock_->now();
    }
}

OutboundRecordLayer::~OutboundRecordLayer() = default;

void OutboundRecordLayer::set_channel_token(std::string token) {
    std::lock_guard<std::mutex> lock(mutex_);
    token_ = std::move(token);
}

void OutboundRecordLayer::count_rejection(SBusError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_into(stats_, error);
}

Result<void> OutboundRecordLayer::validate(const std::string& destination, const Bytes& payload) {
    if (payload.empty()) {
        return Failure(SBusError::EMPTY_PAYLOAD, "record payload is empty");
    }
    if (payload.size() > config_.max_payload_size) {
        return Failure(SBusError::MESSAGE_TOO_LARGE,
                       "payload of " + std::to_string(payload.size()) + " bytes exceeds " +
                       std::to_string(config_.max_payload_size));
    }
    SBUS_TRY_VOID(compression_.check_payload(payload));
    SBUS_TRY_VOID(rate_limiter_->acquire(destination));
    return make_result();
}

Result<void> OutboundRecordLayer::rotate_if_due_locked(Timestamp now) {
    if (!config_.enable_key_rotation) {
        return make_result();
    }
    if (now - last_rotation_ < std::chrono::duration_cast<Timestamp>(config_.key_update_interval)) {
        return make_result();
    }

    SBUS_TRY_VOID(schedule_.advance_to(schedule_.current_generation() + 1));
    last_rotation_ = now;
    stats_.key_rotations++;
    SBUS_REPORT_DEBUG(reporter_, SBusError::SUCCESS,
                      "traffic key rotated to generation " + std::to_string(schedule_.current_generation()));
    return make_result();
}

Result<Bytes> OutboundRecordLayer::seal_locked(const Bytes& payload) {
    const uint64_t sequence = SBUS_TRY(sequences_.next());

    uint8_t seq_le[SEQUENCE_LENGTH];
    crypto::utils::store_u64_le(sequence, seq_le);
    SBUS_TRY_VOID(nonces_.insert(Bytes(seq_le, seq_le + SEQUENCE_LENGTH)));

    auto mac = SBUS_TRY(crypto::utils::hmac_sha256(*provider_, keys_->mac_key(writer_), payload));

    Bytes envelope;
    envelope.reserve(ENVELOPE_HEADER_LENGTH + payload.size());
    envelope.insert(envelope.end(), seq_le, seq_le + SEQUENCE_LENGTH);
    crypto::utils::append(envelope, mac);
    crypto::utils::append(envelope, payload);

    auto key = SBUS_TRY(schedule_.key_for(schedule_.current_generation()));

    crypto::AEADEncryptionParams params;
    params.key = key;
    params.nonce = record_nonce(keys_->write_iv(writer_), sequence);
    params.plaintext = envelope;
    params.cipher = cipher_for_key(key);

    auto sealed = provider_->encrypt_aead(params);
    crypto::utils::secure_zero(envelope);
    crypto::utils::secure_zero(params.plaintext);
    crypto::utils::secure_zero(params.key);
    crypto::utils::secure_zero(key);
    if (!sealed) {
        return make_error<Bytes>(SBusError::ENCRYPT_ERROR, "record encryption failed");
    }

    Bytes record;
    record.reserve(RECORD_NONCE_LENGTH + sealed->ciphertext.size() + RECORD_TAG_LENGTH);
    crypto::utils::append(record, params.nonce);
    crypto::utils::append(record, sealed->ciphertext);
    crypto::utils::append(record, sealed->tag);
    return record;
}

Result<Bytes> OutboundRecordLayer::send(const std::string& destination, const Bytes& payload) {
    if (!keys_ || keys_->empty()) {
        return make_error<Bytes>(SBusError::SESSION_NOT_ESTABLISHED, "no session keys");
    }
    if (!channel_ || !provider_ || !clock_) {
        return make_error<Bytes>(SBusError::NOT_INITIALIZED, "record layer has no channel");
    }

    const Timestamp now = clock_->now();
    if (!breaker_.allow_request(now)) {
        count_rejection(SBusError::CIRCUIT_OPEN);
        return make_error<Bytes>(SBusError::CIRCUIT_OPEN, "outbound circuit open");
    }

    auto valid = validate(destination, payload);
    if (!valid) {
        breaker_.cancel_probe();
        count_rejection(valid.error());
        return valid.failure();
    }

    Bytes record;
    std::string token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto rotated = rotate_if_due_locked(now);
        auto sealed = rotated ? seal_locked(payload) : Result<Bytes>(rotated.failure());
        if (!sealed) {
            breaker_.cancel_probe();
            count_into(stats_, sealed.error());
            return sealed.failure();
        }
        record = std::move(*sealed);
        token = token_;
    }

    // No lock held across the transport call
    if (!channel_->send(destination, record, token)) {
        breaker_.record_failure(clock_->now());
        const bool opened = breaker_.is_open();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.transport_errors++;
        }
        if (opened) {
            SBUS_REPORT_SECURITY(reporter_, SBusError::CIRCUIT_OPEN, "outbound_circuit_open", 0.5);
        }
        return make_error<Bytes>(SBusError::CHANNEL_SEND_FAILED,
                                 opened ? "channel refused record; circuit opened"
                                        : "channel refused record");
    }

    breaker_.record_success();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.records_processed++;
        stats_.bytes_processed += payload.size();
    }
    return record;
}

RecordLayerStats OutboundRecordLayer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RecordLayerStats stats = stats_;
    stats.key_generation = schedule_.current_generation();
    stats.circuit_state = breaker_.state();
    return stats;
}

void OutboundRecordLayer::reset_circuit_breaker() {
    breaker_.reset();
}

bool OutboundRecordLayer::is_circuit_open() const {
    return breaker_.is_open();
}

// ============================================================================
// InboundRecordLayer Implementation
// ============================================================================

InboundRecordLayer::InboundRecordLayer(const RecordLayerConfig& config,
                                       std::shared_ptr<const crypto::SessionKeys> keys,
                                       ConnectionRole writer,
                                       std::shared_ptr<crypto::CryptoProvider> provider,
                                       std::shared_ptr<Clock> clock,
                                       std::shared_ptr<ErrorReporter> reporter)
    : config_(config)
    , keys_(std::move(keys))
    , writer_(writer)
    , provider_(provider)
    , clock_(clock)
    , reporter_(std::move(reporter))
    , breaker_(breaker_config(config))
    , rate_limiter_(make_rate_limiter(config, clock))
    , nonces_(config.nonce_registry_capacity)
    , peer_(to_string(writer))
    , schedule_(provider, keys_ ? keys_->write_key(writer) : Bytes{}) {}

InboundRecordLayer::~InboundRecordLayer() = default;

void InboundRecordLayer::count_rejection(SBusError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    count_into(stats_, error);
}

Result<Bytes> InboundRecordLayer::open_locked(const Bytes& record, uint64_t& generation_out) {
    crypto::AEADDecryptionParams params;
    params.nonce.assign(record.begin(), record.begin() + RECORD_NONCE_LENGTH);
    params.ciphertext.assign(record.begin() + RECORD_NONCE_LENGTH, record.end() - RECORD_TAG_LENGTH);
    params.tag.assign(record.end() - RECORD_TAG_LENGTH, record.end());

    const uint64_t first = schedule_.current_generation();
    const uint64_t last = first + config_.max_key_lookahead;
    for (uint64_t generation = first; generation <= last; ++generation) {
        auto key = schedule_.key_for(generation);
        if (!key) {
            return key.failure();
        }
        params.key = std::move(*key);
        params.cipher = cipher_for_key(params.key);

        auto opened = provider_->decrypt_aead(params);
        crypto::utils::secure_zero(params.key);
        if (opened) {
            generation_out = generation;
            return std::move(*opened);
        }
    }
    return make_error<Bytes>(SBusError::DECRYPT_ERROR, "record authentication failed");
}

Result<Bytes> InboundRecordLayer::receive(const std::string& source, const Bytes& record) {
    if (!keys_ || keys_->empty()) {
        return make_error<Bytes>(SBusError::SESSION_NOT_ESTABLISHED, "no session keys");
    }
    if (!provider_ || !clock_) {
        return make_error<Bytes>(SBusError::NOT_INITIALIZED, "record layer not initialized");
    }

    const Timestamp now = clock_->now();
    if (!breaker_.allow_request(now)) {
        count_rejection(SBusError::CIRCUIT_OPEN);
        return make_error<Bytes>(SBusError::CIRCUIT_OPEN, "inbound circuit open");
    }

    // Records are attacker-reachable input: rejecting them never counts
    // against the breaker. Only local crypto faults do.
    auto reject = [this](SBusError error, const std::string& detail) -> Result<Bytes> {
        breaker_.cancel_probe();
        count_into(stats_, error);
        return make_error<Bytes>(error, detail);
    };
    auto fault = [this](const Failure& failure) -> Result<Bytes> {
        breaker_.record_failure(clock_->now());
        return failure;
    };

    std::lock_guard<std::mutex> lock(mutex_);

    if (record.size() < RECORD_OVERHEAD) {
        return reject(SBusError::INVALID_MESSAGE_FORMAT, "record shorter than its framing");
    }
    if (record.size() > config_.max_payload_size + RECORD_OVERHEAD) {
        return reject(SBusError::MESSAGE_TOO_LARGE, "record exceeds maximum size");
    }

    auto allowed = rate_limiter_->acquire(source);
    if (!allowed) {
        return reject(allowed.error(), "source " + source + " over its record budget");
    }

    uint64_t generation = 0;
    auto opened = open_locked(record, generation);
    if (!opened) {
        if (opened.error() != SBusError::DECRYPT_ERROR) {
            return fault(opened.failure());
        }
        SBUS_REPORT_WARNING(reporter_, opened.error(), "undecryptable record from " + source);
        return reject(SBusError::DECRYPT_ERROR, opened.error_detail());
    }
    Bytes envelope = std::move(*opened);

    if (envelope.size() < ENVELOPE_HEADER_LENGTH) {
        crypto::utils::secure_zero(envelope);
        return reject(SBusError::TAMPERED_PAYLOAD, "envelope truncated");
    }

    const uint64_t sequence = crypto::utils::load_u64_le(envelope.data());
    const Bytes expected_nonce = record_nonce(keys_->write_iv(writer_), sequence);
    if (!std::equal(expected_nonce.begin(), expected_nonce.end(), record.begin())) {
        crypto::utils::secure_zero(envelope);
        SBUS_REPORT_SECURITY(reporter_, SBusError::TAMPERED_PAYLOAD, "record_nonce_mismatch", 0.8);
        return reject(SBusError::TAMPERED_PAYLOAD, "record nonce does not match its sequence");
    }

    // One writer key per direction, so the sequence space is per direction
    // whatever label the caller attaches to the record
    auto in_order = sequences_.check(peer_, sequence);
    if (!in_order) {
        crypto::utils::secure_zero(envelope);
        SBUS_REPORT_SECURITY(reporter_, SBusError::REPLAY_OR_OUT_OF_ORDER, "record_replay", 0.7);
        return reject(SBusError::REPLAY_OR_OUT_OF_ORDER, in_order.error_detail());
    }

    Bytes received_mac(envelope.begin() + SEQUENCE_LENGTH, envelope.begin() + ENVELOPE_HEADER_LENGTH);
    Bytes payload(envelope.begin() + ENVELOPE_HEADER_LENGTH, envelope.end());
    crypto::utils::secure_zero(envelope);

    auto mac = crypto::utils::hmac_sha256(*provider_, keys_->mac_key(writer_), payload);
    if (!mac) {
        crypto::utils::secure_zero(payload);
        return fault(mac.failure());
    }
    if (!crypto::utils::constant_time_compare(*mac, received_mac)) {
        crypto::utils::secure_zero(payload);
        SBUS_REPORT_SECURITY(reporter_, SBusError::TAMPERED_PAYLOAD, "record_hmac_mismatch", 0.9);
        return reject(SBusError::TAMPERED_PAYLOAD, "payload HMAC mismatch");
    }

    if (payload.empty()) {
        return reject(SBusError::EMPTY_PLAINTEXT, "record carries no payload");
    }

    auto plain = compression_.check_payload(payload);
    if (!plain) {
        crypto::utils::secure_zero(payload);
        return reject(SBusError::COMPRESSION_DETECTED, plain.error_detail());
    }

    auto fresh = nonces_.insert(Bytes(record.begin(), record.begin() + RECORD_NONCE_LENGTH));
    if (!fresh) {
        crypto::utils::secure_zero(payload);
        return reject(SBusError::DUPLICATE_NONCE, fresh.error_detail());
    }

    SBUS_TRY_VOID(sequences_.accept(peer_, sequence));
    if (generation > schedule_.current_generation()) {
        SBUS_TRY_VOID(schedule_.advance_to(generation));
        stats_.key_rotations++;
    }

    breaker_.record_success();
    stats_.records_processed++;
    stats_.bytes_processed += payload.size();
    return payload;
}

std::optional<uint64_t> InboundRecordLayer::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequences_.last_seen(peer_);
}

RecordLayerStats InboundRecordLayer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RecordLayerStats stats = stats_;
    stats.key_generation = schedule_.current_generation();
    stats.circuit_state = breaker_.state();
    return stats;
}

void InboundRecordLayer::reset_circuit_breaker() {
    breaker_.reset();
}

bool InboundRecordLayer::is_circuit_open() const {
    return breaker_.is_open();
}

} // namespace sbus::v1::protocol
