#include <gtest/gtest.h>

#include <sbus/routing/loop_router.h>
#include <sbus/crypto/crypto_utils.h>

#include <algorithm>

#include "test_infrastructure/test_utilities.h"

using namespace sbus::v1::routing;
using namespace sbus::v1;

class LoopRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{50000});
        config_ = sbus::test::make_test_config();
        config_.routing.node_queue_capacity = 2;
        config_.routing.health_poll_interval = std::chrono::milliseconds(100);
        config_.honeypot.batch_size = 10;
        config_.honeypot.max_pool_size = 100;
        context_ = sbus::test::make_test_context(clock_, config_);

        tokens_ = std::make_shared<auth::ComponentTokenManager>(context_->crypto(), config_.master_key, clock_);
        hardware_ = std::make_shared<device::InMemoryHardwareQueue>(config_.hardware_queue, clock_);
        anomalies_ = std::make_shared<security::AnomalyDetector>(config_.anomaly, clock_);
        honeypot_ = security::Honeypot::create(config_.honeypot, context_->crypto(), clock_).value();
        router_ = LoopRouter::create(context_, tokens_, hardware_, anomalies_, honeypot_).value();

        cpu_token_ = tokens_->issue_session_token(ComponentType::CPU, 1, std::chrono::seconds(3600)).value();
        ai_token_ = tokens_->issue_session_token(ComponentType::AI, 1, std::chrono::seconds(3600)).value();

        ASSERT_TRUE(router_->register_node(LoopKind::KERNEL, "scheduler"));
        ASSERT_TRUE(router_->register_node(LoopKind::KERNEL, "cpu0"));
    }

    static Bytes text(const std::string& s) { return Bytes(s.begin(), s.end()); }

    std::shared_ptr<ManualClock> clock_;
    BusConfig config_;
    std::shared_ptr<BusContext> context_;
    std::shared_ptr<auth::ComponentTokenManager> tokens_;
    std::shared_ptr<device::InMemoryHardwareQueue> hardware_;
    std::shared_ptr<security::AnomalyDetector> anomalies_;
    std::shared_ptr<security::Honeypot> honeypot_;
    std::shared_ptr<LoopRouter> router_;
    auth::ComponentToken cpu_token_;
    auth::ComponentToken ai_token_;
};

TEST_F(LoopRouterTest, RoutesAndDeliversMessage) {
    ASSERT_TRUE(router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", text("load 42"),
                                      cpu_token_.token_value));
    EXPECT_EQ(router_->pending(LoopKind::KERNEL, "scheduler"), 1u);

    auto received = router_->receive(LoopKind::KERNEL, "scheduler");
    ASSERT_TRUE(received.is_success());
    EXPECT_EQ(*received, text("load 42"));
    EXPECT_EQ(router_->pending(LoopKind::KERNEL, "scheduler"), 0u);

    auto stats = router_->stats(LoopKind::KERNEL);
    EXPECT_EQ(stats.messages_routed, 1u);
    EXPECT_EQ(stats.messages_delivered, 1u);
}

TEST_F(LoopRouterTest, MessagesAreDeliveredInOrder) {
    ASSERT_TRUE(router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", text("first"),
                                      cpu_token_.token_value));
    ASSERT_TRUE(router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", text("second"),
                                      cpu_token_.token_value));

    EXPECT_EQ(router_->receive(LoopKind::KERNEL, "scheduler").value(), text("first"));
    EXPECT_EQ(router_->receive(LoopKind::KERNEL, "scheduler").value(), text("second"));
}

TEST_F(LoopRouterTest, EmptyQueueAndUnknownNode) {
    auto empty = router_->receive(LoopKind::KERNEL, "scheduler");
    ASSERT_FALSE(empty.is_success());
    EXPECT_EQ(empty.error(), SBusError::QUEUE_EMPTY);

    auto unknown = router_->receive(LoopKind::KERNEL, "nobody");
    ASSERT_FALSE(unknown.is_success());
    EXPECT_EQ(unknown.error(), SBusError::DESTINATION_NOT_FOUND);
}

TEST_F(LoopRouterTest, NodeRegistration) {
    auto empty = router_->register_node(LoopKind::KERNEL, "");
    ASSERT_FALSE(empty.is_success());
    EXPECT_EQ(empty.error(), SBusError::INVALID_PARAMETER);

    auto nodes = router_->list_nodes(LoopKind::KERNEL);
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0], "cpu0");
    EXPECT_EQ(nodes[1], "scheduler");
    EXPECT_TRUE(router_->list_nodes(LoopKind::AI).empty());

    ASSERT_TRUE(router_->unregister_node(LoopKind::KERNEL, "cpu0"));
    EXPECT_EQ(router_->list_nodes(LoopKind::KERNEL).size(), 1u);

    auto again = router_->unregister_node(LoopKind::KERNEL, "cpu0");
    ASSERT_FALSE(again.is_success());
    EXPECT_EQ(again.error(), SBusError::DESTINATION_NOT_FOUND);
}

TEST_F(LoopRouterTest, LoopsAreIsolated) {
    ASSERT_TRUE(router_->register_node(LoopKind::AI, "scheduler"));
    ASSERT_TRUE(router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", text("kernel only"),
                                      cpu_token_.token_value));

    EXPECT_EQ(router_->pending(LoopKind::AI, "scheduler"), 0u);
    EXPECT_EQ(router_->receive(LoopKind::AI, "scheduler").error(), SBusError::QUEUE_EMPTY);
    EXPECT_EQ(router_->pending(LoopKind::KERNEL, "scheduler"), 1u);
}

TEST_F(LoopRouterTest, EmptyPayloadIsRejected) {
    auto result = router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", Bytes{}, cpu_token_.token_value);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::EMPTY_PAYLOAD);
}

TEST_F(LoopRouterTest, QueueCapacityIsEnforced) {
    for (int i = 0; i < 2; ++i) {
        ASSERT_TRUE(router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", text("fill"),
                                          cpu_token_.token_value));
    }
    auto full = router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", text("overflow"),
                                      cpu_token_.token_value);
    ASSERT_FALSE(full.is_success());
    EXPECT_EQ(full.error(), SBusError::QUEUE_FULL);
    EXPECT_EQ(router_->stats(LoopKind::KERNEL).queue_overflows, 1u);
}

// Authorization

TEST_F(LoopRouterTest, PermittedComponentsPerLoop) {
    const auto& power = LoopRouter::permitted_components(LoopKind::POWER);
    ASSERT_EQ(power.size(), 1u);
    EXPECT_EQ(power[0], ComponentType::POWER);

    const auto& kernel = LoopRouter::permitted_components(LoopKind::KERNEL);
    EXPECT_NE(std::find(kernel.begin(), kernel.end(), ComponentType::CPU), kernel.end());
    EXPECT_EQ(std::find(kernel.begin(), kernel.end(), ComponentType::AI), kernel.end());
}

TEST_F(LoopRouterTest, ForeignComponentIsRejected) {
    auto result = router_->send_message(LoopKind::KERNEL, "rogue", "scheduler", text("let me in"),
                                        ai_token_.token_value);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::UNAUTHORIZED_COMPONENT);

    EXPECT_EQ(router_->stats(LoopKind::KERNEL).authorization_failures, 1u);
    EXPECT_EQ(anomalies_->stats().authorization_failures, 1u);
    EXPECT_EQ(honeypot_->attempt_count(), 1u);
    EXPECT_EQ(router_->pending(LoopKind::KERNEL, "scheduler"), 0u);
}

TEST_F(LoopRouterTest, AiTokenIsAcceptedOnAiLoop) {
    ASSERT_TRUE(router_->register_node(LoopKind::AI, "planner"));
    EXPECT_TRUE(router_->send_message(LoopKind::AI, "model", "planner", text("plan"),
                                      ai_token_.token_value));
}

TEST_F(LoopRouterTest, UnknownTokenIsRejected) {
    auto result = router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", text("hello"), "forged");
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::INVALID_TOKEN);
    EXPECT_EQ(honeypot_->attempt_count(), 1u);
}

TEST_F(LoopRouterTest, RevokedTokenIsRejected) {
    ASSERT_TRUE(tokens_->revoke_token(cpu_token_.token_id));
    auto result = router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", text("hello"),
                                        cpu_token_.token_value);
    EXPECT_FALSE(result.is_success());
}

TEST_F(LoopRouterTest, ExpiredTokenIsRejected) {
    auto short_lived = tokens_->issue_session_token(ComponentType::GPU, 2, std::chrono::seconds(10)).value();
    clock_->advance(std::chrono::seconds(10));

    auto result = router_->authorize(LoopKind::KERNEL, "gpu0", short_lived.token_value);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::TOKEN_EXPIRED);
}

TEST_F(LoopRouterTest, DecoyTokenTripsHoneypot) {
    auto decoy = honeypot_->decoy_value("hp_00000001");
    ASSERT_TRUE(decoy.has_value());
    const size_t pool_before = honeypot_->count();

    auto result = router_->authorize(LoopKind::KERNEL, "attacker", *decoy);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::INVALID_TOKEN);
    EXPECT_EQ(honeypot_->attempt_count(), 1u);
    EXPECT_GE(honeypot_->count(), pool_before);

    auto log = honeypot_->attempt_log();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].source, "attacker");
}

TEST_F(LoopRouterTest, UnknownDestinationIsReported) {
    auto result = router_->send_message(LoopKind::KERNEL, "cpu0", "nowhere", text("probe"),
                                        cpu_token_.token_value);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::DESTINATION_NOT_FOUND);
    EXPECT_EQ(router_->stats(LoopKind::KERNEL).unknown_destinations, 1u);
    EXPECT_EQ(honeypot_->attempt_count(), 1u);
}

// Sandbox gating

TEST_F(LoopRouterTest, InactiveLoopSandboxBlocksTraffic) {
    context_->sandboxes().set_loop_active(LoopKind::KERNEL, false);

    auto result = router_->send_message(LoopKind::KERNEL, "cpu0", "scheduler", text("blocked"),
                                        cpu_token_.token_value);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::SANDBOX_INACTIVE);
    EXPECT_EQ(router_->stats(LoopKind::KERNEL).sandbox_rejections, 1u);

    EXPECT_TRUE(router_->register_node(LoopKind::AI, "planner").is_success());
}

TEST_F(LoopRouterTest, InactiveTransportBlocksEveryLoop) {
    context_->sandboxes().set_transport_active(false);
    for (auto kind : ALL_LOOP_KINDS) {
        EXPECT_EQ(router_->register_node(kind, "node").error(), SBusError::SANDBOX_INACTIVE);
    }
    EXPECT_EQ(router_->receive(LoopKind::KERNEL, "scheduler").error(), SBusError::SANDBOX_INACTIVE);
}

// Channels

TEST_F(LoopRouterTest, LoopChannelRoundTrip) {
    auto sender = router_->channel(LoopKind::KERNEL, "cpu0");
    auto receiver = router_->channel(LoopKind::KERNEL, "scheduler");

    EXPECT_TRUE(sender->send("scheduler", text("via channel"), cpu_token_.token_value));
    EXPECT_EQ(sender->last_error(), SBusError::SUCCESS);

    auto payload = receiver->receive();
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, text("via channel"));

    EXPECT_FALSE(receiver->receive().has_value());
    EXPECT_EQ(receiver->last_error(), SBusError::QUEUE_EMPTY);
}

TEST_F(LoopRouterTest, LoopChannelKeepsFailureReason) {
    auto sender = router_->channel(LoopKind::KERNEL, "cpu0");
    EXPECT_FALSE(sender->send("scheduler", text("wrong loop"), ai_token_.token_value));
    EXPECT_EQ(sender->last_error(), SBusError::UNAUTHORIZED_COMPONENT);
    EXPECT_EQ(sender->kind(), LoopKind::KERNEL);
    EXPECT_EQ(sender->node(), "cpu0");
}

// Hardware

TEST_F(LoopRouterTest, HardwareCommandIsQueued) {
    auto id = router_->execute_hardware_command(HardwareCommand::GET_CPU_STATUS, Bytes{0x01},
                                                cpu_token_.token_value);
    ASSERT_TRUE(id.is_success());
    EXPECT_EQ(*id, 1u);

    auto request = hardware_->dequeue_request();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->command, HardwareCommand::GET_CPU_STATUS);
    EXPECT_EQ(request->parameters, Bytes{0x01});
    EXPECT_EQ(request->timeout, config_.hardware_queue.default_timeout);
}

TEST_F(LoopRouterTest, HardwareCommandNeedsKernelComponent) {
    auto result = router_->execute_hardware_command(HardwareCommand::GET_GPU_STATUS, Bytes{},
                                                    ai_token_.token_value);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::UNAUTHORIZED_COMPONENT);
    EXPECT_FALSE(hardware_->dequeue_request().has_value());
}

TEST_F(LoopRouterTest, CriticalCommandCooldown) {
    ASSERT_TRUE(router_->execute_hardware_command(HardwareCommand::RECOVER_COMPONENT, Bytes{},
                                                  cpu_token_.token_value));

    auto repeat = router_->execute_hardware_command(HardwareCommand::RECOVER_COMPONENT, Bytes{},
                                                    cpu_token_.token_value);
    ASSERT_FALSE(repeat.is_success());
    EXPECT_EQ(repeat.error(), SBusError::CRITICAL_ACTION_COOLDOWN);

    EXPECT_TRUE(router_->execute_hardware_command(HardwareCommand::GET_RAM_STATUS, Bytes{},
                                                  cpu_token_.token_value));

    clock_->advance(std::chrono::milliseconds(5000));
    EXPECT_TRUE(router_->execute_hardware_command(HardwareCommand::RECOVER_COMPONENT, Bytes{},
                                                  cpu_token_.token_value));
}

TEST_F(LoopRouterTest, HardwareCommandWithoutQueue) {
    auto bare = LoopRouter::create(context_, tokens_).value();
    auto result = bare->execute_hardware_command(HardwareCommand::GET_CPU_STATUS, Bytes{},
                                                 cpu_token_.token_value);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::NOT_INITIALIZED);
}

TEST_F(LoopRouterTest, HealthPollInterval) {
    EXPECT_TRUE(router_->trigger_health_poll(clock_->now()).value());
    EXPECT_FALSE(router_->trigger_health_poll(clock_->now() + std::chrono::milliseconds(50)).value());
    EXPECT_TRUE(router_->trigger_health_poll(clock_->now() + std::chrono::milliseconds(100)).value());

    EXPECT_EQ(hardware_->stats().pending_requests, 2u);
    auto request = hardware_->dequeue_request();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->command, HardwareCommand::HARDWARE_HEALTH_POLL);
}

TEST_F(LoopRouterTest, CreateNeedsContextAndTokens) {
    auto result = LoopRouter::create(nullptr, tokens_);
    ASSERT_FALSE(result.is_success());
    EXPECT_EQ(result.error(), SBusError::INVALID_PARAMETER);

    EXPECT_FALSE(LoopRouter::create(context_, nullptr).is_success());
}
