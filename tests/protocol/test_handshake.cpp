#include <gtest/gtest.h>
#include <sbus/protocol/handshake.h>
#include <sbus/crypto/crypto_utils.h>
#include <sbus/crypto/openssl_provider.h>
#include <memory>

using namespace sbus::v1::protocol;
using namespace sbus::v1;

class HandshakeTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{10000});
        provider_ = crypto::make_openssl_provider().value();
        master_ = Bytes(32, 0x4e);
        chain_ = {crypto::utils::to_bytes("leaf-certificate:ai.bus"),
                  crypto::utils::to_bytes("intermediate-certificate:bus-ca")};
        client_registry_ = std::make_shared<crypto::KeyMaterialRegistry>();
        server_registry_ = std::make_shared<crypto::KeyMaterialRegistry>();
    }

    std::unique_ptr<HandshakeStateMachine> make_client(std::shared_ptr<CertificatePinner> pinner = nullptr) {
        auto client = HandshakeStateMachine::create(provider_, master_, config_, clock_,
                                                    client_registry_, std::move(pinner)).value();
        client->set_peer_hostname("ai.bus");
        return client;
    }

    std::unique_ptr<HandshakeResponder> make_server() {
        return HandshakeResponder::create(provider_, master_, config_, chain_, server_registry_).value();
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    Bytes master_;
    std::vector<Bytes> chain_;
    HandshakeConfig config_;
    std::shared_ptr<crypto::KeyMaterialRegistry> client_registry_;
    std::shared_ptr<crypto::KeyMaterialRegistry> server_registry_;
};

TEST_F(HandshakeTest, FullHandshakeDerivesMatchingKeys) {
    auto client = make_client();
    auto server = make_server();

    auto hello = client->generate_client_hello();
    ASSERT_TRUE(hello);
    EXPECT_EQ(hello->random.size(), RANDOM_LENGTH);
    EXPECT_EQ(hello->compression_methods, std::vector<uint8_t>{COMPRESSION_NULL});
    EXPECT_EQ(client->state(), HandshakeState::CLIENT_HELLO_SENT);

    auto server_hello = server->process_client_hello(*hello);
    ASSERT_TRUE(server_hello);
    EXPECT_EQ(server_hello->session_id.size(), SESSION_ID_LENGTH);

    ASSERT_TRUE(client->process_server_hello(*server_hello));
    ASSERT_TRUE(client->process_certificate(server->certificate_message()));

    auto exchange = client->generate_client_key_exchange();
    ASSERT_TRUE(exchange);
    ASSERT_TRUE(server->process_client_key_exchange(*exchange));

    auto finished = client->generate_finished();
    ASSERT_TRUE(finished);
    EXPECT_FALSE(client->is_complete());

    auto reply = server->process_client_finished(*finished);
    ASSERT_TRUE(reply);
    ASSERT_TRUE(client->verify_server_finished(*reply));
    EXPECT_TRUE(client->is_complete());
    EXPECT_TRUE(server->is_complete());

    auto client_keys = client->session_keys().value();
    auto server_keys = server->session_keys().value();
    EXPECT_EQ(client_keys.client_write_key, server_keys.client_write_key);
    EXPECT_EQ(client_keys.server_write_iv, server_keys.server_write_iv);
    EXPECT_EQ(client->session_id(), server->session_id());
    ASSERT_TRUE(client->negotiated_suite().has_value());
    EXPECT_EQ(*client->negotiated_suite(), config_.offered_suites.front());
    EXPECT_EQ(client_registry_->size(), 1u);
}

TEST_F(HandshakeTest, StepsOutOfOrderAreInvalidState) {
    auto client = make_client();
    EXPECT_EQ(client->generate_client_key_exchange().error(), SBusError::INVALID_STATE);
    EXPECT_EQ(client->session_keys().error(), SBusError::SESSION_NOT_ESTABLISHED);

    ASSERT_TRUE(client->generate_client_hello());
    EXPECT_EQ(client->generate_client_hello().error(), SBusError::INVALID_STATE);
    EXPECT_EQ(client->process_certificate(CertificateMessage{chain_}).error(), SBusError::INVALID_STATE);

    client->reset();
    EXPECT_EQ(client->state(), HandshakeState::INITIAL);
    EXPECT_TRUE(client->generate_client_hello());
}

TEST_F(HandshakeTest, ServerHelloIsValidated) {
    auto client = make_client();
    auto server = make_server();
    auto server_hello = server->process_client_hello(client->generate_client_hello().value()).value();

    auto wrong_version = server_hello;
    wrong_version.version = 0x0301;
    EXPECT_EQ(client->process_server_hello(wrong_version).error(), SBusError::PROTOCOL_VERSION_NOT_SUPPORTED);

    auto compressed = server_hello;
    compressed.compression_method = 1;
    EXPECT_EQ(client->process_server_hello(compressed).error(), SBusError::COMPRESSION_DETECTED);

    config_.offered_suites = {CipherSuite::RSA_WITH_AES_256_CBC_SHA256};
    auto narrow = make_client();
    ASSERT_TRUE(narrow->generate_client_hello());
    auto unoffered = server_hello;
    unoffered.cipher_suite = CipherSuite::RSA_WITH_AES_128_CBC_SHA;
    EXPECT_EQ(narrow->process_server_hello(unoffered).error(), SBusError::HANDSHAKE_FAILURE);
}

TEST_F(HandshakeTest, CertificateChainIsValidated) {
    auto client = make_client();
    auto server = make_server();
    auto server_hello = server->process_client_hello(client->generate_client_hello().value()).value();
    ASSERT_TRUE(client->process_server_hello(server_hello));

    EXPECT_EQ(client->process_certificate(CertificateMessage{}).error(), SBusError::EMPTY_CHAIN);

    CertificateMessage hollow;
    hollow.cert_chain = {chain_[0], Bytes{}};
    EXPECT_EQ(client->process_certificate(hollow).error(), SBusError::EMPTY_CERTIFICATE);
}

TEST_F(HandshakeTest, PinnedCertificateMustMatch) {
    auto pinner = std::make_shared<CertificatePinner>(provider_, clock_);
    ASSERT_TRUE(pinner->pin_certificate("ai.bus", CertificatePin::from_der(crypto::utils::to_bytes("other-leaf"))));

    auto client = make_client(pinner);
    auto server = make_server();
    auto server_hello = server->process_client_hello(client->generate_client_hello().value()).value();
    ASSERT_TRUE(client->process_server_hello(server_hello));
    EXPECT_EQ(client->process_certificate(server->certificate_message()).error(),
              SBusError::CERTIFICATE_PIN_MISMATCH);
}

TEST_F(HandshakeTest, DeadlineFailsEveryStep) {
    auto client = make_client();
    auto server = make_server();
    auto server_hello = server->process_client_hello(client->generate_client_hello().value()).value();

    clock_->advance(config_.deadline + std::chrono::milliseconds{1});
    EXPECT_TRUE(client->is_timed_out());
    EXPECT_EQ(client->process_server_hello(server_hello).error(), SBusError::HANDSHAKE_TIMEOUT);
    EXPECT_EQ(client->generate_finished().error(), SBusError::HANDSHAKE_TIMEOUT);

    client->reset();
    EXPECT_FALSE(client->is_timed_out());
}

TEST_F(HandshakeTest, ForgedFinishedIsRejected) {
    auto client = make_client();
    auto server = make_server();
    auto server_hello = server->process_client_hello(client->generate_client_hello().value()).value();
    ASSERT_TRUE(client->process_server_hello(server_hello));
    ASSERT_TRUE(client->process_certificate(server->certificate_message()));
    ASSERT_TRUE(server->process_client_key_exchange(client->generate_client_key_exchange().value()));
    ASSERT_TRUE(client->generate_finished());

    EXPECT_EQ(client->verify_server_finished(Finished{"forged"}).error(), SBusError::VERIFICATION_FAILED);
    EXPECT_EQ(server->process_client_finished(Finished{"forged"}).error(), SBusError::VERIFICATION_FAILED);
    EXPECT_FALSE(client->is_complete());
}

TEST_F(HandshakeTest, ResponderRejectsBadClientHello) {
    auto server = make_server();
    ClientHello hello;
    hello.random = Bytes(RANDOM_LENGTH, 0x01);
    hello.cipher_suites = config_.offered_suites;
    hello.compression_methods = {1};
    EXPECT_EQ(server->process_client_hello(hello).error(), SBusError::COMPRESSION_DETECTED);

    hello.compression_methods = {COMPRESSION_NULL};
    hello.cipher_suites.clear();
    EXPECT_EQ(server->process_client_hello(hello).error(), SBusError::HANDSHAKE_FAILURE);

    hello.cipher_suites = config_.offered_suites;
    hello.random = Bytes(8, 0x01);
    EXPECT_EQ(server->process_client_hello(hello).error(), SBusError::INVALID_MESSAGE_FORMAT);

    EXPECT_EQ(HandshakeResponder::create(provider_, master_, config_, {}).error(), SBusError::EMPTY_CHAIN);
}

TEST_F(HandshakeTest, ResponderRejectsWrongMasterKey) {
    auto client = HandshakeStateMachine::create(provider_, Bytes(32, 0x99), config_, clock_).value();
    auto server = make_server();
    auto server_hello = server->process_client_hello(client->generate_client_hello().value()).value();
    ASSERT_TRUE(client->process_server_hello(server_hello));
    ASSERT_TRUE(client->process_certificate(server->certificate_message()));

    EXPECT_EQ(server->process_client_key_exchange(client->generate_client_key_exchange().value()).error(),
              SBusError::HANDSHAKE_FAILURE);
}

TEST_F(HandshakeTest, AbbreviatedHandshakeWithResumptionSecret) {
    auto client = make_client();
    auto server = make_server();
    Bytes session_id(SESSION_ID_LENGTH, 0x5a);
    Bytes secret(32, 0x3c);

    auto hello = client->generate_client_hello(session_id).value();
    EXPECT_EQ(hello.session_id, session_id);

    auto server_hello = server->process_client_hello(hello).value();
    EXPECT_EQ(server_hello.session_id, session_id);

    ASSERT_TRUE(client->process_server_hello(server_hello));
    ASSERT_TRUE(client->complete_with_psk("resumed", secret));
    ASSERT_TRUE(server->complete_with_psk(secret));

    EXPECT_TRUE(client->is_complete());
    EXPECT_EQ(client->psk_identity().value_or(""), "resumed");
    EXPECT_EQ(client->session_keys()->server_write_key, server->session_keys()->server_write_key);
}

TEST_F(HandshakeTest, RepeatedRandomsAreRefused) {
    auto client = make_client();
    auto server = make_server();
    auto server_hello = server->process_client_hello(client->generate_client_hello().value()).value();
    ASSERT_TRUE(client->process_server_hello(server_hello));

    ASSERT_TRUE(client_registry_->register_pair(ConnectionRole::CLIENT, client->client_random(), client->server_random()));
    EXPECT_EQ(client->complete_with_psk("resumed", Bytes(32, 0x3c)).error(), SBusError::KEY_MATERIAL_REUSED);
}
