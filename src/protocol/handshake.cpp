#include "sbus/protocol/handshake.h"
#include "sbus/crypto/crypto_utils.h"
#include <algorithm>
#include <cstring>

namespace sbus::v1::protocol {

namespace {

bool offered(const std::vector<CipherSuite>& suites, CipherSuite suite) {
    return std::find(suites.begin(), suites.end(), suite) != suites.end();
}

} // namespace

// ============================================================================
// HandshakeStateMachine Implementation
// ============================================================================

Result<std::unique_ptr<HandshakeStateMachine>> HandshakeStateMachine::create(
    std::shared_ptr<crypto::CryptoProvider> provider,
    const Bytes& master_key,
    const HandshakeConfig& config,
    std::shared_ptr<Clock> clock,
    std::shared_ptr<crypto::KeyMaterialRegistry> key_registry,
    std::shared_ptr<CertificatePinner> pinner,
    std::shared_ptr<ErrorReporter> reporter) {

    if (!clock) {
        return make_error<std::unique_ptr<HandshakeStateMachine>>(SBusError::INVALID_PARAMETER, "no clock");
    }
    if (config.offered_suites.empty()) {
        return make_error<std::unique_ptr<HandshakeStateMachine>>(SBusError::INVALID_CONFIGURATION,
                                                                  "no cipher suites offered");
    }
    for (auto suite : config.offered_suites) {
        if (!is_supported_cipher_suite(static_cast<uint16_t>(suite))) {
            return make_error<std::unique_ptr<HandshakeStateMachine>>(SBusError::INVALID_CONFIGURATION,
                                                                      "unsupported cipher suite offered");
        }
    }

    auto key = SBUS_TRY(crypto::CryptoKey::create(provider, master_key, KEY_CONTEXT));

    return std::unique_ptr<HandshakeStateMachine>(new HandshakeStateMachine(
        std::move(provider), master_key, std::move(key), config, std::move(clock),
        std::move(key_registry), std::move(pinner), std::move(reporter)));
}

HandshakeStateMachine::HandshakeStateMachine(std::shared_ptr<crypto::CryptoProvider> provider,
                                             const Bytes& master_key,
                                             crypto::CryptoKey handshake_key,
                                             const HandshakeConfig& config,
                                             std::shared_ptr<Clock> clock,
                                             std::shared_ptr<crypto::KeyMaterialRegistry> key_registry,
                                             std::shared_ptr<CertificatePinner> pinner,
                                             std::shared_ptr<ErrorReporter> reporter)
    : provider_(std::move(provider))
    , master_key_(master_key)
    , handshake_key_(std::move(handshake_key))
    , config_(config)
    , clock_(std::move(clock))
    , key_registry_(std::move(key_registry))
    , pinner_(std::move(pinner))
    , reporter_(std::move(reporter)) {}

HandshakeStateMachine::~HandshakeStateMachine() {
    crypto::utils::secure_zero(master_key_);
}

void HandshakeStateMachine::set_peer_hostname(const std::string& hostname) {
    std::lock_guard<std::mutex> lock(mutex_);
    peer_hostname_ = hostname;
}

void HandshakeStateMachine::fail_locked(SBusError error, const std::string& message) {
    SBUS_REPORT_WARNING(reporter_, error, message);
}

Result<void> HandshakeStateMachine::require_state_locked(HandshakeState expected, const char* step) {
    if (!timed_out_ && state_ != HandshakeState::INITIAL &&
        clock_->now() - started_at_ > config_.deadline) {
        timed_out_ = true;
        fail_locked(SBusError::HANDSHAKE_TIMEOUT, std::string("deadline passed before ") + step);
    }
    if (timed_out_) {
        return Failure(SBusError::HANDSHAKE_TIMEOUT, step);
    }
    if (state_ != expected) {
        return Failure(SBusError::INVALID_STATE,
                       std::string(step) + " requires " + to_string(expected) + ", in " + to_string(state_));
    }
    return make_result();
}

Result<ClientHello> HandshakeStateMachine::generate_client_hello(std::optional<Bytes> session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != HandshakeState::INITIAL) {
        return make_error<ClientHello>(SBusError::INVALID_STATE,
                                       "ClientHello requires INITIAL, in " + to_string(state_));
    }

    auto random = SBUS_TRY(crypto::utils::generate_random(*provider_, RANDOM_LENGTH));

    ClientHello hello;
    hello.version = PROTOCOL_VERSION;
    hello.random = random;
    hello.session_id = session_id.value_or(Bytes{});
    hello.cipher_suites = config_.offered_suites;
    hello.compression_methods = {COMPRESSION_NULL};

    client_random_ = std::move(random);
    session_id_ = hello.session_id;
    started_at_ = clock_->now();
    timed_out_ = false;
    state_ = HandshakeState::CLIENT_HELLO_SENT;
    return hello;
}

Result<void> HandshakeStateMachine::process_server_hello(const ServerHello& server_hello) {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(HandshakeState::CLIENT_HELLO_SENT, "ServerHello"));

    if (server_hello.version != PROTOCOL_VERSION) {
        fail_locked(SBusError::PROTOCOL_VERSION_NOT_SUPPORTED, "server version mismatch");
        return Failure(SBusError::PROTOCOL_VERSION_NOT_SUPPORTED,
                       "server version " + std::to_string(server_hello.version));
    }
    if (!offered(config_.offered_suites, server_hello.cipher_suite)) {
        fail_locked(SBusError::HANDSHAKE_FAILURE, "server selected a suite that was not offered");
        return Failure(SBusError::HANDSHAKE_FAILURE, "cipher suite not offered");
    }
    if (server_hello.compression_method != COMPRESSION_NULL) {
        fail_locked(SBusError::COMPRESSION_DETECTED, "server selected compression");
        return Failure(SBusError::COMPRESSION_DETECTED, "non-null compression method");
    }
    if (server_hello.random.size() != RANDOM_LENGTH) {
        return Failure(SBusError::INVALID_MESSAGE_FORMAT, "server random length");
    }

    server_random_ = server_hello.random;
    suite_ = server_hello.cipher_suite;
    if (!server_hello.session_id.empty()) {
        session_id_ = server_hello.session_id;
    }
    state_ = HandshakeState::SERVER_HELLO_RECEIVED;
    return make_result();
}

Result<void> HandshakeStateMachine::process_certificate(const CertificateMessage& certificate) {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(HandshakeState::SERVER_HELLO_RECEIVED, "Certificate"));

    if (certificate.cert_chain.empty()) {
        return Failure(SBusError::EMPTY_CHAIN, "empty certificate chain");
    }
    for (size_t i = 0; i < certificate.cert_chain.size(); ++i) {
        if (certificate.cert_chain[i].empty()) {
            return Failure(SBusError::EMPTY_CERTIFICATE, "empty certificate at index " + std::to_string(i));
        }
    }

    if (pinner_) {
        auto pinned = pinner_->validate(peer_hostname_, certificate.cert_chain.front());
        if (!pinned) {
            SBUS_REPORT_SECURITY(reporter_, pinned.error(), "certificate_pin_failure", 0.8);
            return pinned;
        }
    }

    state_ = HandshakeState::CERTIFICATE_RECEIVED;
    return make_result();
}

Result<ClientKeyExchange> HandshakeStateMachine::generate_client_key_exchange() {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(HandshakeState::CERTIFICATE_RECEIVED, "ClientKeyExchange"));

    ClientKeyExchange exchange;
    exchange.encrypted_premaster = SBUS_TRY(handshake_key_.encrypt(std::string(PREMASTER_VALUE)));

    state_ = HandshakeState::CLIENT_KEY_EXCHANGE_SENT;
    return exchange;
}

Result<void> HandshakeStateMachine::derive_keys_locked(const Bytes& secret) {
    auto keys = SBUS_TRY(crypto::SessionKeys::derive(*provider_, secret, client_random_, server_random_));
    if (key_registry_) {
        SBUS_TRY_VOID(key_registry_->register_pair(ConnectionRole::CLIENT, client_random_, server_random_));
    }
    keys_ = std::move(keys);
    return make_result();
}

Result<Finished> HandshakeStateMachine::generate_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(HandshakeState::CLIENT_KEY_EXCHANGE_SENT, "Finished"));

    Finished finished;
    finished.verify_data = SBUS_TRY(handshake_key_.encrypt(std::string(FINISHED_TAG)));

    SBUS_TRY_VOID(derive_keys_locked(master_key_));

    state_ = HandshakeState::FINISHED;
    return finished;
}

Result<void> HandshakeStateMachine::verify_server_finished(const Finished& finished) {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(HandshakeState::FINISHED, "server Finished"));

    auto decrypted = handshake_key_.decrypt(finished.verify_data);
    if (!decrypted) {
        fail_locked(SBusError::VERIFICATION_FAILED, "server Finished does not decrypt");
        return Failure(SBusError::VERIFICATION_FAILED, "server Finished does not decrypt");
    }

    Bytes expected = crypto::utils::to_bytes(FINISHED_TAG);
    bool matches = crypto::utils::constant_time_compare(*decrypted, expected);
    crypto::utils::secure_zero(*decrypted);
    if (!matches) {
        fail_locked(SBusError::VERIFICATION_FAILED, "server Finished mismatch");
        return Failure(SBusError::VERIFICATION_FAILED, "server Finished mismatch");
    }

    server_verified_ = true;
    return make_result();
}

Result<void> HandshakeStateMachine::complete_with_psk(const std::string& psk_identity,
                                                     const Bytes& resumption_secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(HandshakeState::SERVER_HELLO_RECEIVED, "PSK completion"));

    if (psk_identity.empty() || resumption_secret.empty()) {
        return Failure(SBusError::INVALID_PARAMETER, "empty PSK identity or secret");
    }

    SBUS_TRY_VOID(derive_keys_locked(resumption_secret));

    psk_identity_ = psk_identity;
    server_verified_ = true;
    state_ = HandshakeState::FINISHED;
    return make_result();
}

void HandshakeStateMachine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = HandshakeState::INITIAL;
    started_at_ = Timestamp{0};
    timed_out_ = false;
    crypto::utils::secure_zero(client_random_);
    crypto::utils::secure_zero(server_random_);
    session_id_.clear();
    suite_.reset();
    psk_identity_.reset();
    server_verified_ = false;
    keys_.clear();
}

HandshakeState HandshakeStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool HandshakeStateMachine::is_complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == HandshakeState::FINISHED && server_verified_;
}

bool HandshakeStateMachine::is_timed_out() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timed_out_) {
        return true;
    }
    return state_ != HandshakeState::INITIAL && clock_->now() - started_at_ > config_.deadline;
}

Result<crypto::SessionKeys> HandshakeStateMachine::session_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != HandshakeState::FINISHED || keys_.empty()) {
        return make_error<crypto::SessionKeys>(SBusError::SESSION_NOT_ESTABLISHED, "handshake not finished");
    }
    return keys_;
}

Bytes HandshakeStateMachine::client_random() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_random_;
}

Bytes HandshakeStateMachine::server_random() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_random_;
}

Bytes HandshakeStateMachine::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

std::optional<CipherSuite> HandshakeStateMachine::negotiated_suite() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return suite_;
}

std::optional<std::string> HandshakeStateMachine::psk_identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return psk_identity_;
}

// ============================================================================
// HandshakeResponder Implementation
// ============================================================================

Result<std::unique_ptr<HandshakeResponder>> HandshakeResponder::create(
    std::shared_ptr<crypto::CryptoProvider> provider,
    const Bytes& master_key,
    const HandshakeConfig& config,
    std::vector<Bytes> certificate_chain,
    std::shared_ptr<crypto::KeyMaterialRegistry> key_registry) {

    if (certificate_chain.empty()) {
        return make_error<std::unique_ptr<HandshakeResponder>>(SBusError::EMPTY_CHAIN, "responder has no chain");
    }

    auto key = SBUS_TRY(crypto::CryptoKey::create(provider, master_key, HandshakeStateMachine::KEY_CONTEXT));

    return std::unique_ptr<HandshakeResponder>(new HandshakeResponder(
        std::move(provider), master_key, std::move(key), config,
        std::move(certificate_chain), std::move(key_registry)));
}

HandshakeResponder::HandshakeResponder(std::shared_ptr<crypto::CryptoProvider> provider,
                                       const Bytes& master_key,
                                       crypto::CryptoKey handshake_key,
                                       const HandshakeConfig& config,
                                       std::vector<Bytes> certificate_chain,
                                       std::shared_ptr<crypto::KeyMaterialRegistry> key_registry)
    : provider_(std::move(provider))
    , master_key_(master_key)
    , handshake_key_(std::move(handshake_key))
    , config_(config)
    , certificate_chain_(std::move(certificate_chain))
    , key_registry_(std::move(key_registry)) {}

HandshakeResponder::~HandshakeResponder() {
    crypto::utils::secure_zero(master_key_);
}

Result<ServerHello> HandshakeResponder::process_client_hello(const ClientHello& client_hello) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage_ != Stage::AWAIT_CLIENT_HELLO) {
        return make_error<ServerHello>(SBusError::INVALID_STATE, "unexpected ClientHello");
    }
    if (client_hello.version != PROTOCOL_VERSION) {
        return make_error<ServerHello>(SBusError::PROTOCOL_VERSION_NOT_SUPPORTED, "client version");
    }
    if (client_hello.random.size() != RANDOM_LENGTH) {
        return make_error<ServerHello>(SBusError::INVALID_MESSAGE_FORMAT, "client random length");
    }
    if (std::find(client_hello.compression_methods.begin(), client_hello.compression_methods.end(),
                  COMPRESSION_NULL) == client_hello.compression_methods.end()) {
        return make_error<ServerHello>(SBusError::COMPRESSION_DETECTED, "client offers no null compression");
    }

    std::optional<CipherSuite> selected;
    for (auto suite : config_.offered_suites) {
        if (offered(client_hello.cipher_suites, suite)) {
            selected = suite;
            break;
        }
    }
    if (!selected) {
        return make_error<ServerHello>(SBusError::HANDSHAKE_FAILURE, "no common cipher suite");
    }

    auto random = SBUS_TRY(crypto::utils::generate_random(*provider_, RANDOM_LENGTH));

    // A fresh id for a full handshake; an offered id is echoed
    Bytes session_id = client_hello.session_id;
    if (session_id.empty()) {
        session_id = SBUS_TRY(crypto::utils::generate_random(*provider_, SESSION_ID_LENGTH));
    }

    ServerHello hello;
    hello.version = PROTOCOL_VERSION;
    hello.random = random;
    hello.session_id = session_id;
    hello.cipher_suite = *selected;
    hello.compression_method = COMPRESSION_NULL;

    client_random_ = client_hello.random;
    server_random_ = std::move(random);
    session_id_ = std::move(session_id);
    stage_ = Stage::AWAIT_KEY_EXCHANGE;
    return hello;
}

CertificateMessage HandshakeResponder::certificate_message() const {
    CertificateMessage message;
    message.cert_chain = certificate_chain_;
    return message;
}

Result<void> HandshakeResponder::process_client_key_exchange(const ClientKeyExchange& exchange) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage_ != Stage::AWAIT_KEY_EXCHANGE) {
        return Failure(SBusError::INVALID_STATE, "unexpected ClientKeyExchange");
    }

    auto premaster = handshake_key_.decrypt(exchange.encrypted_premaster);
    if (!premaster) {
        return Failure(SBusError::HANDSHAKE_FAILURE, "pre-master does not decrypt");
    }
    bool matches = crypto::utils::constant_time_compare(
        *premaster, crypto::utils::to_bytes(HandshakeStateMachine::PREMASTER_VALUE));
    crypto::utils::secure_zero(*premaster);
    if (!matches) {
        return Failure(SBusError::HANDSHAKE_FAILURE, "unexpected pre-master value");
    }

    stage_ = Stage::AWAIT_FINISHED;
    return make_result();
}

Result<Finished> HandshakeResponder::process_client_finished(const Finished& finished) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage_ != Stage::AWAIT_FINISHED) {
        return make_error<Finished>(SBusError::INVALID_STATE, "unexpected Finished");
    }

    auto tag = handshake_key_.decrypt(finished.verify_data);
    if (!tag || !crypto::utils::constant_time_compare(
                    *tag, crypto::utils::to_bytes(HandshakeStateMachine::FINISHED_TAG))) {
        return make_error<Finished>(SBusError::VERIFICATION_FAILED, "client Finished mismatch");
    }

    auto keys = SBUS_TRY(crypto::SessionKeys::derive(*provider_, master_key_, client_random_, server_random_));
    if (key_registry_) {
        SBUS_TRY_VOID(key_registry_->register_pair(ConnectionRole::SERVER, client_random_, server_random_));
    }
    keys_ = std::move(keys);

    Finished reply;
    reply.verify_data = SBUS_TRY(handshake_key_.encrypt(std::string(HandshakeStateMachine::FINISHED_TAG)));

    stage_ = Stage::DONE;
    return reply;
}

Result<void> HandshakeResponder::complete_with_psk(const Bytes& resumption_secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage_ != Stage::AWAIT_KEY_EXCHANGE) {
        return Failure(SBusError::INVALID_STATE, "PSK completion requires a processed ClientHello");
    }
    if (resumption_secret.empty()) {
        return Failure(SBusError::INVALID_PARAMETER, "empty resumption secret");
    }

    auto keys = SBUS_TRY(crypto::SessionKeys::derive(*provider_, resumption_secret, client_random_, server_random_));
    if (key_registry_) {
        SBUS_TRY_VOID(key_registry_->register_pair(ConnectionRole::SERVER, client_random_, server_random_));
    }
    keys_ = std::move(keys);
    stage_ = Stage::DONE;
    return make_result();
}

bool HandshakeResponder::is_complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stage_ == Stage::DONE;
}

Result<crypto::SessionKeys> HandshakeResponder::session_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage_ != Stage::DONE) {
        return make_error<crypto::SessionKeys>(SBusError::SESSION_NOT_ESTABLISHED, "handshake not finished");
    }
    return keys_;
}

Bytes HandshakeResponder::client_random() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_random_;
}

Bytes HandshakeResponder::server_random() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_random_;
}

Bytes HandshakeResponder::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

} // namespace sbus::v1::protocol
