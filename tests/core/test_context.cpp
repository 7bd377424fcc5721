#include <gtest/gtest.h>
#include <sbus/context.h>
#include <memory>

using namespace sbus::v1;

class BusContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{0});
        config_.master_key = Bytes(32, 0x5A);
        config_.reporting.write_to_stderr = false;
    }

    std::shared_ptr<ManualClock> clock_;
    BusConfig config_;
};

TEST_F(BusContextTest, CreatesWithOpenSslProvider) {
    auto context = BusContext::create(config_, clock_);
    ASSERT_TRUE(context) << context.error_detail();

    EXPECT_EQ((*context)->clock(), clock_);
    ASSERT_NE((*context)->crypto(), nullptr);
    EXPECT_TRUE((*context)->crypto()->is_available());
    ASSERT_NE((*context)->reporter(), nullptr);
    ASSERT_NE((*context)->key_registry(), nullptr);
    EXPECT_EQ((*context)->config().master_key, config_.master_key);
}

TEST_F(BusContextTest, RejectsInvalidConfiguration) {
    config_.master_key.clear();
    EXPECT_EQ(BusContext::create(config_, clock_).error(), SBusError::INVALID_CONFIGURATION);
}

TEST_F(BusContextTest, RejectsMissingClock) {
    EXPECT_EQ(BusContext::create(config_, nullptr).error(), SBusError::INVALID_PARAMETER);
}

TEST_F(BusContextTest, SandboxesStartInactive) {
    auto context = BusContext::create(config_, clock_).value();
    EXPECT_EQ(context->sandboxes().check(LoopKind::KERNEL).error(), SBusError::SANDBOX_INACTIVE);

    context->sandboxes().set_transport_active(true);
    EXPECT_EQ(context->sandboxes().check(LoopKind::KERNEL).error(), SBusError::SANDBOX_INACTIVE);

    context->sandboxes().set_loop_active(LoopKind::KERNEL, true);
    EXPECT_TRUE(context->sandboxes().check(LoopKind::KERNEL).is_success());
    EXPECT_EQ(context->sandboxes().check(LoopKind::AI).error(), SBusError::SANDBOX_INACTIVE);

    context->sandboxes().activate_all();
    EXPECT_TRUE(context->sandboxes().check(LoopKind::POWER).is_success());
}

TEST_F(BusContextTest, ContextsDoNotShareKeyRegistry) {
    auto first = BusContext::create(config_, clock_).value();
    auto second = BusContext::create(config_, clock_).value();
    EXPECT_NE(first->key_registry(), second->key_registry());
}
