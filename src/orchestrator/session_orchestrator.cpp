#include <sbus/orchestrator/session_orchestrator.h>
#include <sbus/crypto/crypto_utils.h>
#include <sbus/crypto/session_keys.h>

namespace sbus {
namespace v1 {
namespace orchestrator {

namespace {

constexpr size_t SESSION_NAME_BYTES = 8;

ConnectionRole peer_of(ConnectionRole role) {
    return role == ConnectionRole::CLIENT ? ConnectionRole::SERVER : ConnectionRole::CLIENT;
}

bool is_security_rejection(SBusError error) {
    switch (error) {
        case SBusError::TAMPERED_PAYLOAD:
        case SBusError::REPLAY_OR_OUT_OF_ORDER:
        case SBusError::DUPLICATE_NONCE:
        case SBusError::DECRYPT_ERROR:
        case SBusError::COMPRESSION_DETECTED:
            return true;
        default:
            return false;
    }
}

} // namespace

Result<std::unique_ptr<SessionOrchestrator>> SessionOrchestrator::create(
    std::shared_ptr<BusContext> context,
    ConnectionRole role,
    std::shared_ptr<transport::Channel> channel,
    std::shared_ptr<session::SessionCache> cache,
    std::shared_ptr<device::HardwareCommandQueue> hardware) {
    if (!context) {
        return make_error<std::unique_ptr<SessionOrchestrator>>(SBusError::INVALID_PARAMETER, "no bus context");
    }
    if (role == ConnectionRole::CLIENT && !channel) {
        return make_error<std::unique_ptr<SessionOrchestrator>>(SBusError::INVALID_PARAMETER,
                                                                "a client session needs a channel");
    }

    std::unique_ptr<SessionOrchestrator> orchestrator(
        new SessionOrchestrator(context, role, std::move(channel), std::move(cache), std::move(hardware)));

    auto suffix = SBUS_TRY(crypto::utils::generate_random(*context->crypto(), SESSION_NAME_BYTES));
    orchestrator->name_ = "session-" + crypto::utils::to_hex(suffix);
    return std::move(orchestrator);
}

SessionOrchestrator::SessionOrchestrator(std::shared_ptr<BusContext> context,
                                         ConnectionRole role,
                                         std::shared_ptr<transport::Channel> channel,
                                         std::shared_ptr<session::SessionCache> cache,
                                         std::shared_ptr<device::HardwareCommandQueue> hardware)
    : context_(std::move(context))
    , role_(role)
    , channel_(std::move(channel))
    , cache_(std::move(cache))
    , hardware_(std::move(hardware))
    , pinner_(std::make_shared<protocol::CertificatePinner>(context_->crypto(),
                                                            context_->clock(),
                                                            context_->config().handshake.pin_ttl,
                                                            context_->config().handshake.require_pin))
    , rate_limiter_(context_->config().rate_limit, context_->clock())
    , guard_(context_->config().routing.critical_action_cooldown, context_->clock())
    , timeouts_(context_->config().timeouts, context_->clock())
    , metrics_(context_->clock()) {}

SessionOrchestrator::~SessionOrchestrator() {
    std::lock_guard<std::mutex> lock(mutex_);
    release_session_locked();
    crypto::utils::secure_zero(master_key_);
}

Result<void> SessionOrchestrator::configure(const Bytes& master_key,
                                            std::vector<Bytes> certificate_chain,
                                            const std::string& peer_hostname) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::HANDSHAKING || state_ == SessionState::ESTABLISHED) {
        return Failure(SBusError::INVALID_STATE, "cannot reconfigure a live session");
    }
    if (master_key.empty()) {
        return Failure(SBusError::INVALID_PARAMETER, "master key is required");
    }
    if (peer_hostname.empty()) {
        return Failure(SBusError::INVALID_PARAMETER, "peer hostname is required");
    }
    if (role_ == ConnectionRole::SERVER && certificate_chain.empty()) {
        return Failure(SBusError::EMPTY_CHAIN, "a server session needs a certificate chain");
    }

    release_session_locked();
    crypto::utils::secure_zero(master_key_);
    master_key_ = master_key;
    certificate_chain_ = std::move(certificate_chain);
    peer_hostname_ = peer_hostname;
    session_id_.clear();
    suite_ = 0;
    configured_ = true;
    state_ = SessionState::CONFIGURED;
    return make_result();
}

// ============================================================================
// Client role
// ============================================================================

Result<protocol::ClientHello> SessionOrchestrator::start_handshake() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (role_ != ConnectionRole::CLIENT) {
        return make_error<protocol::ClientHello>(SBusError::INVALID_STATE, "start_handshake on a server session");
    }
    SBUS_TRY_VOID(require_state_locked(SessionState::CONFIGURED, "start_handshake"));
    SBUS_TRY_VOID(admit_handshake_locked());

    const auto& config = context_->config();
    auto machine = protocol::HandshakeStateMachine::create(context_->crypto(), master_key_, config.handshake,
                                                           context_->clock(), context_->key_registry(),
                                                           pinner_, context_->reporter());
    if (!machine) {
        return step_failed_locked<protocol::ClientHello>(machine.failure());
    }
    handshake_ = std::move(*machine);
    handshake_->set_peer_hostname(peer_hostname_);

    auto hello = handshake_->generate_client_hello();
    if (!hello) {
        return step_failed_locked<protocol::ClientHello>(hello.failure());
    }

    handshake_started_ = context_->clock()->now();
    timeouts_.register_timeout(name_, session::TimeoutType::HANDSHAKE);
    state_ = SessionState::HANDSHAKING;
    return hello;
}

Result<ClientFlight> SessionOrchestrator::perform_handshake(const protocol::ServerHello& server_hello,
                                                            const protocol::CertificateMessage& certificate) {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(SessionState::HANDSHAKING, "perform_handshake"));
    if (!handshake_ || !pending_resumption_secret_.empty()) {
        return make_error<ClientFlight>(SBusError::INVALID_STATE, "no full handshake in progress");
    }
    SBUS_TRY_VOID(check_deadline_locked());

    auto hello = handshake_->process_server_hello(server_hello);
    if (!hello) {
        return step_failed_locked<ClientFlight>(hello.failure());
    }
    auto cert = handshake_->process_certificate(certificate);
    if (!cert) {
        return step_failed_locked<ClientFlight>(cert.failure());
    }
    auto exchange = handshake_->generate_client_key_exchange();
    if (!exchange) {
        return step_failed_locked<ClientFlight>(exchange.failure());
    }
    auto finished = handshake_->generate_finished();
    if (!finished) {
        return step_failed_locked<ClientFlight>(finished.failure());
    }

    suite_ = static_cast<uint16_t>(server_hello.cipher_suite);
    return ClientFlight{std::move(*exchange), std::move(*finished)};
}

Result<void> SessionOrchestrator::complete_handshake(const protocol::Finished& server_finished) {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(SessionState::HANDSHAKING, "complete_handshake"));
    if (!handshake_ || !pending_resumption_secret_.empty()) {
        return Failure(SBusError::INVALID_STATE, "no full handshake in progress");
    }
    SBUS_TRY_VOID(check_deadline_locked());

    auto verified = handshake_->verify_server_finished(server_finished);
    if (!verified) {
        return step_failed_locked<void>(verified.failure());
    }
    auto keys = handshake_->session_keys();
    if (!keys) {
        return step_failed_locked<void>(keys.failure());
    }

    session_id_ = handshake_->session_id();
    const Bytes client_random = handshake_->client_random();
    const Bytes server_random = handshake_->server_random();
    SBUS_TRY_VOID(establish_locked(*keys, false));

    auto cached = cache_session_locked(client_random, server_random);
    if (!cached) {
        SBUS_REPORT_WARNING(context_->reporter(), cached.error(),
                            name_ + ": session not cached: " + cached.error_detail());
    }
    return make_result();
}

Result<protocol::ClientHello> SessionOrchestrator::resume(const std::string& hostname, const Bytes& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (role_ != ConnectionRole::CLIENT) {
        return make_error<protocol::ClientHello>(SBusError::INVALID_STATE, "resume on a server session");
    }
    SBUS_TRY_VOID(require_state_locked(SessionState::CONFIGURED, "resume"));
    if (!cache_) {
        return make_error<protocol::ClientHello>(SBusError::NOT_INITIALIZED, "no session cache");
    }
    if (session_id.empty()) {
        return make_error<protocol::ClientHello>(SBusError::INVALID_PARAMETER, "empty session id");
    }

    auto entry = cache_->get_session(hostname, session_id);
    if (!entry) {
        return make_error<protocol::ClientHello>(SBusError::SESSION_NOT_FOUND,
                                                 "no cached session for " + hostname);
    }
    SBUS_TRY_VOID(admit_handshake_locked());

    const auto& config = context_->config();
    auto machine = protocol::HandshakeStateMachine::create(context_->crypto(), master_key_, config.handshake,
                                                           context_->clock(), context_->key_registry(),
                                                           pinner_, context_->reporter());
    if (!machine) {
        return step_failed_locked<protocol::ClientHello>(machine.failure());
    }
    handshake_ = std::move(*machine);
    handshake_->set_peer_hostname(hostname);

    auto hello = handshake_->generate_client_hello(session_id);
    if (!hello) {
        return step_failed_locked<protocol::ClientHello>(hello.failure());
    }

    peer_hostname_ = hostname;
    session_id_ = session_id;
    suite_ = entry->cipher_suite;
    pending_resumption_secret_ = std::move(entry->master_secret);
    handshake_started_ = context_->clock()->now();
    timeouts_.register_timeout(name_, session::TimeoutType::HANDSHAKE);
    state_ = SessionState::HANDSHAKING;
    return hello;
}

Result<void> SessionOrchestrator::complete_resumption(const protocol::ServerHello& server_hello) {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(SessionState::HANDSHAKING, "complete_resumption"));
    if (!handshake_ || pending_resumption_secret_.empty()) {
        return Failure(SBusError::INVALID_STATE, "no resumption in progress");
    }
    SBUS_TRY_VOID(check_deadline_locked());

    if (server_hello.session_id != session_id_) {
        return step_failed_locked<void>(Failure(SBusError::HANDSHAKE_FAILURE, "server declined resumption"));
    }
    auto hello = handshake_->process_server_hello(server_hello);
    if (!hello) {
        return step_failed_locked<void>(hello.failure());
    }
    auto completed = handshake_->complete_with_psk(crypto::utils::to_hex(session_id_), pending_resumption_secret_);
    if (!completed) {
        return step_failed_locked<void>(completed.failure());
    }
    auto keys = handshake_->session_keys();
    if (!keys) {
        return step_failed_locked<void>(keys.failure());
    }
    return establish_locked(*keys, true);
}

// ============================================================================
// Server role
// ============================================================================

Result<ServerFlight> SessionOrchestrator::accept(const protocol::ClientHello& client_hello) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (role_ != ConnectionRole::SERVER) {
        return make_error<ServerFlight>(SBusError::INVALID_STATE, "accept on a client session");
    }
    SBUS_TRY_VOID(require_state_locked(SessionState::CONFIGURED, "accept"));
    SBUS_TRY_VOID(admit_handshake_locked());

    // An offered id resumes only when it is cached; otherwise a fresh id is assigned
    std::optional<session::CachedSession> cached;
    if (cache_ && !client_hello.session_id.empty()) {
        cached = cache_->get_session(peer_hostname_, client_hello.session_id);
    }
    protocol::ClientHello hello = client_hello;
    if (!cached) {
        hello.session_id.clear();
    }

    const auto& config = context_->config();
    auto responder = protocol::HandshakeResponder::create(context_->crypto(), master_key_, config.handshake,
                                                          certificate_chain_, context_->key_registry());
    if (!responder) {
        return step_failed_locked<ServerFlight>(responder.failure());
    }
    responder_ = std::move(*responder);

    auto server_hello = responder_->process_client_hello(hello);
    if (!server_hello) {
        return step_failed_locked<ServerFlight>(server_hello.failure());
    }

    handshake_started_ = context_->clock()->now();
    timeouts_.register_timeout(name_, session::TimeoutType::HANDSHAKE);
    state_ = SessionState::HANDSHAKING;
    session_id_ = responder_->session_id();
    suite_ = static_cast<uint16_t>(server_hello->cipher_suite);

    ServerFlight flight{*server_hello, responder_->certificate_message(), false};
    if (!cached) {
        return flight;
    }

    auto completed = responder_->complete_with_psk(cached->master_secret);
    crypto::utils::secure_zero(cached->master_secret);
    if (!completed) {
        return step_failed_locked<ServerFlight>(completed.failure());
    }
    auto keys = responder_->session_keys();
    if (!keys) {
        return step_failed_locked<ServerFlight>(keys.failure());
    }
    SBUS_TRY_VOID(establish_locked(*keys, true));
    flight.resumed = true;
    return flight;
}

Result<protocol::Finished> SessionOrchestrator::finish_accept(const protocol::ClientKeyExchange& key_exchange,
                                                              const protocol::Finished& client_finished) {
    std::lock_guard<std::mutex> lock(mutex_);
    SBUS_TRY_VOID(require_state_locked(SessionState::HANDSHAKING, "finish_accept"));
    if (!responder_) {
        return make_error<protocol::Finished>(SBusError::INVALID_STATE, "no ClientHello accepted");
    }
    SBUS_TRY_VOID(check_deadline_locked());

    auto exchanged = responder_->process_client_key_exchange(key_exchange);
    if (!exchanged) {
        return step_failed_locked<protocol::Finished>(exchanged.failure());
    }
    auto reply = responder_->process_client_finished(client_finished);
    if (!reply) {
        return step_failed_locked<protocol::Finished>(reply.failure());
    }
    auto keys = responder_->session_keys();
    if (!keys) {
        return step_failed_locked<protocol::Finished>(keys.failure());
    }

    const Bytes client_random = responder_->client_random();
    const Bytes server_random = responder_->server_random();
    SBUS_TRY_VOID(establish_locked(*keys, false));

    auto cached = cache_session_locked(client_random, server_random);
    if (!cached) {
        SBUS_REPORT_WARNING(context_->reporter(), cached.error(),
                            name_ + ": session not cached: " + cached.error_detail());
    }
    return reply;
}

// ============================================================================
// Established session
// ============================================================================

void SessionOrchestrator::set_channel_token(std::string token) {
    std::lock_guard<std::mutex> lock(mutex_);
    channel_token_ = std::move(token);
    if (outbound_) {
        outbound_->set_channel_token(channel_token_);
    }
}

Result<Bytes> SessionOrchestrator::encrypt_message(const std::string& destination, const Bytes& plaintext) {
    std::shared_ptr<protocol::OutboundRecordLayer> outbound;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SBUS_TRY_VOID(require_state_locked(SessionState::ESTABLISHED, "encrypt_message"));
        if (session_expired_locked()) {
            return make_error<Bytes>(SBusError::SESSION_NOT_ESTABLISHED, "session expired");
        }
        if (!outbound_) {
            return make_error<Bytes>(SBusError::NOT_INITIALIZED, "no outbound channel");
        }
        outbound = outbound_;
    }

    auto record = outbound->send(destination, plaintext);
    if (!record) {
        metrics_.record_rejection();
        return record;
    }
    metrics_.record_encryption(plaintext.size());
    return record;
}

Result<Bytes> SessionOrchestrator::decrypt_message(const std::string& source, const Bytes& record) {
    std::shared_ptr<protocol::InboundRecordLayer> inbound;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SBUS_TRY_VOID(require_state_locked(SessionState::ESTABLISHED, "decrypt_message"));
        if (session_expired_locked()) {
            return make_error<Bytes>(SBusError::SESSION_NOT_ESTABLISHED, "session expired");
        }
        inbound = inbound_;
    }

    auto payload = inbound->receive(source, record);
    if (!payload) {
        metrics_.record_rejection();
        if (is_security_rejection(payload.error())) {
            metrics_.record_security_incident();
        }
        return payload;
    }
    metrics_.record_decryption(payload->size());
    return payload;
}

Result<device::RequestId> SessionOrchestrator::execute_hardware_command(HardwareCommand command,
                                                                        const Bytes& params) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SBUS_TRY_VOID(require_state_locked(SessionState::ESTABLISHED, "execute_hardware_command"));
    }
    if (!hardware_) {
        return make_error<device::RequestId>(SBusError::NOT_INITIALIZED, "no hardware queue attached");
    }
    SBUS_TRY_VOID(context_->sandboxes().check(LoopKind::KERNEL));

    auto allowed = guard_.check_and_record(command);
    if (!allowed) {
        SBUS_REPORT_WARNING(context_->reporter(), allowed.error(),
                            name_ + ": " + to_string(command) + " refused: " + allowed.error_detail());
        return allowed.failure();
    }
    return hardware_->enqueue_request(command, params, context_->config().hardware_queue.default_timeout);
}

std::optional<device::HardwareResponse> SessionOrchestrator::poll_hardware_response() {
    if (!hardware_) {
        return std::nullopt;
    }
    return hardware_->dequeue_response();
}

bool SessionOrchestrator::check_timeouts() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::HANDSHAKING || !timeouts_.has_timed_out(name_)) {
        return false;
    }
    fail_locked(SBusError::HANDSHAKE_TIMEOUT, "handshake deadline passed");
    return true;
}

void SessionOrchestrator::teardown() {
    std::lock_guard<std::mutex> lock(mutex_);
    release_session_locked();
    timeouts_.remove_timeout(name_);
    state_ = SessionState::CLOSED;
}

SessionState SessionOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Bytes SessionOrchestrator::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

uint8_t SessionOrchestrator::health_score() const {
    return metrics_.health_score();
}

monitoring::MetricsSnapshot SessionOrchestrator::metrics() const {
    return metrics_.snapshot();
}

std::optional<protocol::RecordLayerStats> SessionOrchestrator::outbound_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!outbound_) {
        return std::nullopt;
    }
    return outbound_->stats();
}

std::optional<protocol::RecordLayerStats> SessionOrchestrator::inbound_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!inbound_) {
        return std::nullopt;
    }
    return inbound_->stats();
}

// ============================================================================
// Internals
// ============================================================================

Result<void> SessionOrchestrator::require_state_locked(SessionState expected, const char* step) const {
    if (!configured_) {
        return Failure(SBusError::NOT_INITIALIZED, std::string(step) + ": session not configured");
    }
    if (state_ == expected) {
        return make_result();
    }
    if (expected == SessionState::ESTABLISHED) {
        return Failure(SBusError::SESSION_NOT_ESTABLISHED, std::string(step) + " in state " + to_string(state_));
    }
    return Failure(SBusError::INVALID_STATE, std::string(step) + " in state " + to_string(state_));
}

Result<void> SessionOrchestrator::check_deadline_locked() {
    if (!timeouts_.has_timed_out(name_)) {
        return make_result();
    }
    fail_locked(SBusError::HANDSHAKE_TIMEOUT, "handshake deadline passed");
    return Failure(SBusError::HANDSHAKE_TIMEOUT, "handshake deadline passed");
}

bool SessionOrchestrator::session_expired_locked() {
    if (!timeouts_.has_timed_out(name_)) {
        return false;
    }
    SBUS_REPORT_DEBUG(context_->reporter(), SBusError::SESSION_NOT_ESTABLISHED, name_ + ": session expired");
    release_session_locked();
    timeouts_.remove_timeout(name_);
    state_ = SessionState::CLOSED;
    return true;
}

Result<void> SessionOrchestrator::admit_handshake_locked() {
    if (!context_->sandboxes().is_transport_active()) {
        return Failure(SBusError::SANDBOX_INACTIVE, "transport sandbox inactive");
    }
    auto admitted = rate_limiter_.acquire(name_, ComponentType::KERNEL);
    if (!admitted) {
        metrics_.record_handshake_failure();
        return admitted;
    }
    return make_result();
}

Result<void> SessionOrchestrator::establish_locked(const crypto::SessionKeys& keys, bool resumed) {
    const auto& config = context_->config();
    keys_ = std::make_shared<const crypto::SessionKeys>(keys);

    if (channel_) {
        outbound_ = std::make_shared<protocol::OutboundRecordLayer>(config.record, keys_, role_, channel_,
                                                                    context_->crypto(), context_->clock(),
                                                                    context_->reporter());
        if (!channel_token_.empty()) {
            outbound_->set_channel_token(channel_token_);
        }
    }
    inbound_ = std::make_shared<protocol::InboundRecordLayer>(config.record, keys_, peer_of(role_),
                                                              context_->crypto(), context_->clock(),
                                                              context_->reporter());

    const auto elapsed = context_->clock()->now() - handshake_started_;
    metrics_.record_latency(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed));
    metrics_.record_handshake_success();
    if (resumed) {
        metrics_.record_resumption();
    }
    metrics_.set_active_sessions(1);

    crypto::utils::secure_zero(pending_resumption_secret_);
    handshake_.reset();
    responder_.reset();

    timeouts_.register_timeout(name_, session::TimeoutType::SESSION);
    state_ = SessionState::ESTABLISHED;
    SBUS_REPORT_DEBUG(context_->reporter(), SBusError::SUCCESS,
                      name_ + (resumed ? ": session resumed" : ": session established"));
    return make_result();
}

Result<void> SessionOrchestrator::cache_session_locked(const Bytes& client_random, const Bytes& server_random) {
    if (!cache_ || session_id_.empty()) {
        return make_result();
    }
    auto secret = SBUS_TRY(crypto::SessionKeys::resumption_secret(*context_->crypto(), master_key_,
                                                                  client_random, server_random));
    auto stored = cache_->cache_session(peer_hostname_, session_id_, secret, suite_);
    crypto::utils::secure_zero(secret);
    return stored;
}

void SessionOrchestrator::fail_locked(SBusError error, const std::string& reason) {
    metrics_.record_handshake_failure();
    if (error == SBusError::HANDSHAKE_TIMEOUT) {
        metrics_.record_timeout();
    }
    SBUS_REPORT_WARNING(context_->reporter(), error, name_ + ": handshake failed: " + reason);

    release_session_locked();
    timeouts_.remove_timeout(name_);
    state_ = SessionState::FAILED;
}

void SessionOrchestrator::release_session_locked() {
    outbound_.reset();
    inbound_.reset();
    keys_.reset();
    handshake_.reset();
    responder_.reset();
    crypto::utils::secure_zero(pending_resumption_secret_);
    metrics_.set_active_sessions(0);
}

} // namespace orchestrator
} // namespace v1
} // namespace sbus
