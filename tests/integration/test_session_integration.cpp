#include <gtest/gtest.h>

#include <sbus/orchestrator/session_orchestrator.h>
#include <sbus/crypto/crypto_utils.h>

#include "test_infrastructure/test_utilities.h"

using namespace sbus::v1;
using namespace sbus::v1::orchestrator;
using sbus::test::SessionPairFixture;

class SessionIntegrationTest : public SessionPairFixture {
protected:
    static Bytes text(const std::string& s) { return Bytes(s.begin(), s.end()); }

    void establish() {
        client_ = make_session(ConnectionRole::CLIENT);
        server_ = make_session(ConnectionRole::SERVER);
        ASSERT_TRUE(sbus::test::perform_full_handshake(*client_, *server_));
    }

    std::unique_ptr<SessionOrchestrator> client_;
    std::unique_ptr<SessionOrchestrator> server_;
};

TEST_F(SessionIntegrationTest, FullHandshakeEstablishesBothSides) {
    establish();

    EXPECT_EQ(client_->state(), SessionState::ESTABLISHED);
    EXPECT_EQ(server_->state(), SessionState::ESTABLISHED);
    EXPECT_FALSE(client_->session_id().empty());
    EXPECT_EQ(client_->session_id(), server_->session_id());
    EXPECT_EQ(client_->name().rfind("session-", 0), 0u);
    EXPECT_NE(client_->name(), server_->name());

    EXPECT_EQ(client_->metrics().handshakes_completed, 1u);
    EXPECT_EQ(server_->metrics().handshakes_completed, 1u);
    EXPECT_EQ(client_->metrics().active_sessions, 1u);
    EXPECT_EQ(client_->health_score(), 100);

    EXPECT_EQ(client_cache_->stats().total_sessions, 1u);
    EXPECT_EQ(server_cache_->stats().total_sessions, 1u);
}

TEST_F(SessionIntegrationTest, MessagesFlowInBothDirections) {
    establish();
    client_->set_channel_token("cpu:1:token");

    auto request = client_->encrypt_message(SERVER_HOST, text("GET_CPU_STATUS"));
    ASSERT_TRUE(request.is_success());
    ASSERT_EQ(client_channel_->sent_count(), 1u);
    EXPECT_EQ(client_channel_->sent()[0].destination, SERVER_HOST);
    EXPECT_EQ(client_channel_->sent()[0].token, "cpu:1:token");

    auto received = server_->decrypt_message(CLIENT_HOST, client_channel_->last_payload());
    ASSERT_TRUE(received.is_success());
    EXPECT_EQ(*received, text("GET_CPU_STATUS"));

    auto reply = server_->encrypt_message(CLIENT_HOST, text("cpu 2400MHz"));
    ASSERT_TRUE(reply.is_success());
    auto answer = client_->decrypt_message(SERVER_HOST, *reply);
    ASSERT_TRUE(answer.is_success());
    EXPECT_EQ(*answer, text("cpu 2400MHz"));

    EXPECT_EQ(client_->metrics().messages_encrypted, 1u);
    EXPECT_EQ(client_->metrics().messages_decrypted, 1u);
    EXPECT_EQ(server_->metrics().bytes_decrypted, 14u);
    EXPECT_EQ(client_->outbound_stats()->records_processed, 1u);
    EXPECT_EQ(server_->inbound_stats()->records_processed, 1u);
}

TEST_F(SessionIntegrationTest, OwnRecordsAreNotAccepted) {
    establish();
    auto record = client_->encrypt_message(SERVER_HOST, text("echo"));
    ASSERT_TRUE(record.is_success());

    auto reflected = client_->decrypt_message(SERVER_HOST, *record);
    ASSERT_FALSE(reflected.is_success());
    EXPECT_EQ(reflected.error(), SBusError::DECRYPT_ERROR);
}

TEST_F(SessionIntegrationTest, TamperedRecordCountsAsIncident) {
    establish();
    auto record = client_->encrypt_message(SERVER_HOST, text("set thermal throttle"));
    ASSERT_TRUE(record.is_success());

    Bytes tampered = *record;
    tampered.back() ^= 0x01;
    auto result = server_->decrypt_message(CLIENT_HOST, tampered);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::DECRYPT_ERROR);

    auto metrics = server_->metrics();
    EXPECT_EQ(metrics.messages_rejected, 1u);
    EXPECT_EQ(metrics.security_incidents, 1u);
    EXPECT_EQ(server_->health_score(), 99);

    EXPECT_TRUE(server_->decrypt_message(CLIENT_HOST, *record).is_success());
}

TEST_F(SessionIntegrationTest, ReplayIsRejected) {
    establish();
    auto record = client_->encrypt_message(SERVER_HOST, text("recover gpu"));
    ASSERT_TRUE(record.is_success());
    ASSERT_TRUE(server_->decrypt_message(CLIENT_HOST, *record).is_success());

    auto replay = server_->decrypt_message(CLIENT_HOST, *record);
    ASSERT_FALSE(replay.is_success());
    EXPECT_EQ(replay.error(), SBusError::REPLAY_OR_OUT_OF_ORDER);
    EXPECT_EQ(server_->metrics().security_incidents, 1u);
}

TEST_F(SessionIntegrationTest, EncryptBeforeEstablished) {
    client_ = make_session(ConnectionRole::CLIENT);
    auto result = client_->encrypt_message(SERVER_HOST, text("too early"));
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::SESSION_NOT_ESTABLISHED);
}

// Resumption

TEST_F(SessionIntegrationTest, CachedSessionResumes) {
    establish();
    const Bytes session_id = client_->session_id();

    auto client = make_session(ConnectionRole::CLIENT);
    auto server = make_session(ConnectionRole::SERVER);

    auto hello = client->resume(SERVER_HOST, session_id);
    ASSERT_TRUE(hello.is_success()) << hello.failure().to_string();
    EXPECT_EQ(hello->session_id, session_id);

    auto flight = server->accept(*hello);
    ASSERT_TRUE(flight.is_success()) << flight.failure().to_string();
    EXPECT_TRUE(flight->resumed);
    EXPECT_EQ(server->state(), SessionState::ESTABLISHED);

    ASSERT_TRUE(client->complete_resumption(flight->server_hello));
    EXPECT_EQ(client->state(), SessionState::ESTABLISHED);
    EXPECT_EQ(client->metrics().resumptions, 1u);
    EXPECT_EQ(server->metrics().resumptions, 1u);

    auto record = client->encrypt_message(SERVER_HOST, text("resumed traffic"));
    ASSERT_TRUE(record.is_success());
    auto payload = server->decrypt_message(CLIENT_HOST, *record);
    ASSERT_TRUE(payload.is_success());
    EXPECT_EQ(*payload, text("resumed traffic"));
}

TEST_F(SessionIntegrationTest, UnknownSessionIsNotResumed) {
    client_ = make_session(ConnectionRole::CLIENT);
    auto hello = client_->resume(SERVER_HOST, Bytes(32, 0x42));
    ASSERT_FALSE(hello.is_success());
    EXPECT_EQ(hello.error(), SBusError::SESSION_NOT_FOUND);
    EXPECT_EQ(client_->state(), SessionState::CONFIGURED);
}

TEST_F(SessionIntegrationTest, ServerAssignsFreshIdWhenNotCached) {
    establish();
    const Bytes session_id = client_->session_id();

    auto client = make_session(ConnectionRole::CLIENT);
    auto hello = client->resume(SERVER_HOST, session_id);
    ASSERT_TRUE(hello.is_success());

    server_cache_->clear_all();
    auto server = make_session(ConnectionRole::SERVER);
    auto flight = server->accept(*hello);
    ASSERT_TRUE(flight.is_success());
    EXPECT_FALSE(flight->resumed);
    EXPECT_NE(flight->server_hello.session_id, session_id);

    auto declined = client->complete_resumption(flight->server_hello);
    ASSERT_FALSE(declined.is_success());
    EXPECT_EQ(declined.error(), SBusError::HANDSHAKE_FAILURE);
    EXPECT_EQ(client->state(), SessionState::FAILED);
}

TEST_F(SessionIntegrationTest, ExpiredCacheEntryIsNotResumed) {
    establish();
    const Bytes session_id = client_->session_id();
    clock_->advance(client_context_->config().session_cache.ttl);

    auto client = make_session(ConnectionRole::CLIENT);
    EXPECT_EQ(client->resume(SERVER_HOST, session_id).error(), SBusError::SESSION_NOT_FOUND);
}

// Timeouts and lifecycle

TEST_F(SessionIntegrationTest, HandshakeDeadline) {
    client_ = make_session(ConnectionRole::CLIENT);
    server_ = make_session(ConnectionRole::SERVER);

    auto hello = client_->start_handshake();
    ASSERT_TRUE(hello.is_success());
    auto flight = server_->accept(*hello);
    ASSERT_TRUE(flight.is_success());

    clock_->advance(std::chrono::milliseconds(client_context_->config().timeouts.handshake) +
                    std::chrono::milliseconds(1));

    EXPECT_TRUE(client_->check_timeouts());
    EXPECT_EQ(client_->state(), SessionState::FAILED);
    EXPECT_EQ(client_->metrics().timeouts, 1u);
    EXPECT_FALSE(client_->check_timeouts());

    auto late = server_->finish_accept(protocol::ClientKeyExchange{}, protocol::Finished{});
    ASSERT_FALSE(late.is_success());
    EXPECT_EQ(late.error(), SBusError::HANDSHAKE_TIMEOUT);
    EXPECT_EQ(server_->state(), SessionState::FAILED);
}

TEST_F(SessionIntegrationTest, NoTimeoutBeforeDeadline) {
    client_ = make_session(ConnectionRole::CLIENT);
    ASSERT_TRUE(client_->start_handshake().is_success());

    clock_->advance(std::chrono::milliseconds(client_context_->config().timeouts.handshake));
    EXPECT_FALSE(client_->check_timeouts());
    EXPECT_EQ(client_->state(), SessionState::HANDSHAKING);
}

TEST_F(SessionIntegrationTest, SessionExpiresAfterLifetime) {
    establish();
    clock_->advance(std::chrono::milliseconds(client_context_->config().timeouts.session) +
                    std::chrono::milliseconds(1));

    auto result = client_->encrypt_message(SERVER_HOST, text("stale"));
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::SESSION_NOT_ESTABLISHED);
    EXPECT_EQ(client_->state(), SessionState::CLOSED);
    EXPECT_FALSE(client_->outbound_stats().has_value());
}

TEST_F(SessionIntegrationTest, TeardownAndReconfigure) {
    establish();
    client_->teardown();
    EXPECT_EQ(client_->state(), SessionState::CLOSED);
    EXPECT_EQ(client_->metrics().active_sessions, 0u);
    EXPECT_EQ(client_->encrypt_message(SERVER_HOST, text("closed")).error(), SBusError::SESSION_NOT_ESTABLISHED);

    ASSERT_TRUE(client_->configure(sbus::test::test_master_key(), {}, SERVER_HOST));
    EXPECT_EQ(client_->state(), SessionState::CONFIGURED);

    server_ = make_session(ConnectionRole::SERVER);
    EXPECT_TRUE(sbus::test::perform_full_handshake(*client_, *server_));
}

TEST_F(SessionIntegrationTest, LiveSessionCannotBeReconfigured) {
    establish();
    auto result = client_->configure(sbus::test::test_master_key(), {}, SERVER_HOST);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::INVALID_STATE);
}

TEST_F(SessionIntegrationTest, ConfigureValidation) {
    auto client = SessionOrchestrator::create(client_context_, ConnectionRole::CLIENT, client_channel_).value();
    EXPECT_EQ(client->start_handshake().error(), SBusError::NOT_INITIALIZED);
    EXPECT_EQ(client->configure(Bytes{}, {}, SERVER_HOST).error(), SBusError::INVALID_PARAMETER);
    EXPECT_EQ(client->configure(sbus::test::test_master_key(), {}, "").error(), SBusError::INVALID_PARAMETER);

    auto server = SessionOrchestrator::create(server_context_, ConnectionRole::SERVER, server_channel_).value();
    EXPECT_EQ(server->configure(sbus::test::test_master_key(), {}, CLIENT_HOST).error(), SBusError::EMPTY_CHAIN);

    EXPECT_EQ(SessionOrchestrator::create(nullptr, ConnectionRole::CLIENT, client_channel_).error(),
              SBusError::INVALID_PARAMETER);
    EXPECT_EQ(SessionOrchestrator::create(client_context_, ConnectionRole::CLIENT, nullptr).error(),
              SBusError::INVALID_PARAMETER);
}

TEST_F(SessionIntegrationTest, RoleChecks) {
    client_ = make_session(ConnectionRole::CLIENT);
    server_ = make_session(ConnectionRole::SERVER);

    EXPECT_EQ(server_->start_handshake().error(), SBusError::INVALID_STATE);
    EXPECT_EQ(client_->accept(protocol::ClientHello{}).error(), SBusError::INVALID_STATE);
    EXPECT_EQ(client_->complete_handshake(protocol::Finished{}).error(), SBusError::INVALID_STATE);
}

// Handshake failures

TEST_F(SessionIntegrationTest, InactiveTransportSandboxBlocksHandshake) {
    client_ = make_session(ConnectionRole::CLIENT);
    client_context_->sandboxes().set_transport_active(false);

    auto hello = client_->start_handshake();
    ASSERT_FALSE(hello.is_success());
    EXPECT_EQ(hello.error(), SBusError::SANDBOX_INACTIVE);
    EXPECT_EQ(client_->state(), SessionState::CONFIGURED);
}

TEST_F(SessionIntegrationTest, MismatchedMasterKeysFail) {
    client_ = make_session(ConnectionRole::CLIENT);
    server_ = make_session(ConnectionRole::SERVER);
    ASSERT_TRUE(server_->configure(Bytes(32, 0x01), sbus::test::test_certificate_chain(), CLIENT_HOST));

    auto hello = client_->start_handshake();
    ASSERT_TRUE(hello.is_success());
    auto flight = server_->accept(*hello);
    ASSERT_TRUE(flight.is_success());
    auto client_flight = client_->perform_handshake(flight->server_hello, flight->certificate);
    ASSERT_TRUE(client_flight.is_success());

    auto finished = server_->finish_accept(client_flight->key_exchange, client_flight->finished);
    ASSERT_FALSE(finished.is_success());
    EXPECT_EQ(finished.error(), SBusError::HANDSHAKE_FAILURE);
    EXPECT_EQ(server_->state(), SessionState::FAILED);
    EXPECT_EQ(server_->metrics().handshakes_failed, 1u);

    ASSERT_TRUE(server_->configure(sbus::test::test_master_key(), sbus::test::test_certificate_chain(),
                                   CLIENT_HOST));
    EXPECT_EQ(server_->state(), SessionState::CONFIGURED);
}

TEST_F(SessionIntegrationTest, PinnedCertificateMismatch) {
    client_ = make_session(ConnectionRole::CLIENT);
    server_ = make_session(ConnectionRole::SERVER);

    auto pin = protocol::CertificatePin::from_certificate(*client_context_->crypto(),
                                                          crypto::utils::to_bytes("some other leaf"));
    ASSERT_TRUE(pin.is_success());
    ASSERT_TRUE(client_->pinner()->pin_certificate(SERVER_HOST, *pin));

    auto hello = client_->start_handshake();
    ASSERT_TRUE(hello.is_success());
    auto flight = server_->accept(*hello);
    ASSERT_TRUE(flight.is_success());

    auto client_flight = client_->perform_handshake(flight->server_hello, flight->certificate);
    ASSERT_FALSE(client_flight.is_success());
    EXPECT_EQ(client_flight.error(), SBusError::CERTIFICATE_PIN_MISMATCH);
    EXPECT_EQ(client_->state(), SessionState::FAILED);
}

TEST_F(SessionIntegrationTest, PinnedCertificateMatches) {
    client_ = make_session(ConnectionRole::CLIENT);
    server_ = make_session(ConnectionRole::SERVER);

    auto pin = protocol::CertificatePin::from_certificate(*client_context_->crypto(),
                                                          sbus::test::test_certificate_chain().front());
    ASSERT_TRUE(client_->pinner()->pin_certificate(SERVER_HOST, pin.value()));
    EXPECT_TRUE(sbus::test::perform_full_handshake(*client_, *server_));
}

// Both ends on one context

class SharedContextTest : public SessionIntegrationTest {
protected:
    void SetUp() override {
        SessionIntegrationTest::SetUp();
        server_context_ = client_context_;
        server_cache_ = std::make_shared<session::SessionCache>(client_context_->config().session_cache, clock_);
    }
};

TEST_F(SharedContextTest, FullHandshakeOnOneContext) {
    establish();
    EXPECT_EQ(client_->state(), SessionState::ESTABLISHED);
    EXPECT_EQ(server_->state(), SessionState::ESTABLISHED);
    EXPECT_EQ(client_context_->key_registry()->size(), 2u);

    auto record = client_->encrypt_message(SERVER_HOST, text("one context"));
    ASSERT_TRUE(record.is_success());
    auto received = server_->decrypt_message(CLIENT_HOST, *record);
    ASSERT_TRUE(received.is_success());
    EXPECT_EQ(*received, text("one context"));
}

TEST_F(SharedContextTest, ResumptionOnOneContext) {
    establish();
    const Bytes session_id = client_->session_id();

    auto client = make_session(ConnectionRole::CLIENT);
    auto server = make_session(ConnectionRole::SERVER);
    auto hello = client->resume(SERVER_HOST, session_id);
    ASSERT_TRUE(hello.is_success()) << hello.failure().to_string();
    auto flight = server->accept(*hello);
    ASSERT_TRUE(flight.is_success()) << flight.failure().to_string();
    EXPECT_TRUE(flight->resumed);
    ASSERT_TRUE(client->complete_resumption(flight->server_hello));
    EXPECT_EQ(client->state(), SessionState::ESTABLISHED);
    EXPECT_EQ(server->state(), SessionState::ESTABLISHED);
}

// Hardware commands

class SessionHardwareTest : public SessionIntegrationTest {
protected:
    void SetUp() override {
        SessionIntegrationTest::SetUp();
        hardware_ = std::make_shared<device::InMemoryHardwareQueue>(client_context_->config().hardware_queue, clock_);
        client_ = SessionOrchestrator::create(client_context_, ConnectionRole::CLIENT, client_channel_,
                                              client_cache_, hardware_).value();
        ASSERT_TRUE(client_->configure(sbus::test::test_master_key(), {}, SERVER_HOST));
        server_ = make_session(ConnectionRole::SERVER);
    }

    std::shared_ptr<device::InMemoryHardwareQueue> hardware_;
};

TEST_F(SessionHardwareTest, CommandNeedsEstablishedSession) {
    auto result = client_->execute_hardware_command(HardwareCommand::GET_CPU_STATUS, Bytes{});
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::SESSION_NOT_ESTABLISHED);
}

TEST_F(SessionHardwareTest, CommandAndResponse) {
    ASSERT_TRUE(sbus::test::perform_full_handshake(*client_, *server_));

    auto id = client_->execute_hardware_command(HardwareCommand::SET_GPU_FREQ, Bytes{0x05, 0xdc});
    ASSERT_TRUE(id.is_success());

    auto request = hardware_->dequeue_request();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->request_id, *id);
    EXPECT_EQ(request->command, HardwareCommand::SET_GPU_FREQ);

    EXPECT_FALSE(client_->poll_hardware_response().has_value());
    ASSERT_TRUE(hardware_->post_response(device::HardwareResponse{*id, true, 1500, std::nullopt}));
    auto response = client_->poll_hardware_response();
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->request_id, *id);
    EXPECT_EQ(response->data, 1500u);
}

TEST_F(SessionHardwareTest, CriticalCommandCooldown) {
    ASSERT_TRUE(sbus::test::perform_full_handshake(*client_, *server_));

    ASSERT_TRUE(client_->execute_hardware_command(HardwareCommand::SET_THERMAL_THROTTLE, Bytes{1}));
    auto repeat = client_->execute_hardware_command(HardwareCommand::SET_THERMAL_THROTTLE, Bytes{1});
    ASSERT_FALSE(repeat.is_success());
    EXPECT_EQ(repeat.error(), SBusError::CRITICAL_ACTION_COOLDOWN);

    clock_->advance(client_context_->config().routing.critical_action_cooldown);
    EXPECT_TRUE(client_->execute_hardware_command(HardwareCommand::SET_THERMAL_THROTTLE, Bytes{1}).is_success());
}

TEST_F(SessionHardwareTest, KernelSandboxMustBeActive) {
    ASSERT_TRUE(sbus::test::perform_full_handshake(*client_, *server_));
    client_context_->sandboxes().set_loop_active(LoopKind::KERNEL, false);

    auto result = client_->execute_hardware_command(HardwareCommand::GET_RAM_STATUS, Bytes{});
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::SANDBOX_INACTIVE);
}

TEST_F(SessionHardwareTest, SessionWithoutQueue) {
    auto client = make_session(ConnectionRole::CLIENT);
    auto server = make_session(ConnectionRole::SERVER);
    ASSERT_TRUE(sbus::test::perform_full_handshake(*client, *server));

    EXPECT_EQ(client->execute_hardware_command(HardwareCommand::GET_CPU_STATUS, Bytes{}).error(),
              SBusError::NOT_INITIALIZED);
    EXPECT_FALSE(client->poll_hardware_response().has_value());
}
