#include <gtest/gtest.h>

#include <sbus/device/hardware_queue.h>

using namespace sbus::v1::device;
using namespace sbus::v1;

class HardwareQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{2000});
        config_.request_capacity = 3;
        config_.response_capacity = 2;
        config_.default_timeout = std::chrono::milliseconds(750);
        queue_ = std::make_unique<InMemoryHardwareQueue>(config_, clock_);
    }

    std::shared_ptr<ManualClock> clock_;
    HardwareQueueConfig config_;
    std::unique_ptr<InMemoryHardwareQueue> queue_;
};

TEST_F(HardwareQueueTest, RequestIdsStartAtOne) {
    auto first = queue_->enqueue_request(HardwareCommand::GET_CPU_STATUS, Bytes{}, std::chrono::milliseconds(100));
    auto second = queue_->enqueue_request(HardwareCommand::GET_GPU_STATUS, Bytes{}, std::chrono::milliseconds(100));
    ASSERT_TRUE(first.is_success());
    ASSERT_TRUE(second.is_success());
    EXPECT_EQ(*first, 1u);
    EXPECT_EQ(*second, 2u);
}

TEST_F(HardwareQueueTest, RequestsAreFifo) {
    ASSERT_TRUE(queue_->enqueue_request(HardwareCommand::SET_CPU_FREQ, Bytes{0x09, 0x60},
                                        std::chrono::milliseconds(200)));
    clock_->advance(std::chrono::milliseconds(5));
    ASSERT_TRUE(queue_->enqueue_request(HardwareCommand::GET_THERMAL_STATUS, Bytes{},
                                        std::chrono::milliseconds(0)));

    auto first = queue_->dequeue_request();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->command, HardwareCommand::SET_CPU_FREQ);
    EXPECT_EQ(first->parameters, (Bytes{0x09, 0x60}));
    EXPECT_EQ(first->timeout, std::chrono::milliseconds(200));
    EXPECT_EQ(first->enqueued_at, Timestamp{2000});

    auto second = queue_->dequeue_request();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->timeout, std::chrono::milliseconds(750));
    EXPECT_EQ(second->enqueued_at, Timestamp{2005});

    EXPECT_FALSE(queue_->dequeue_request().has_value());
}

TEST_F(HardwareQueueTest, RequestQueueIsBounded) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(queue_->enqueue_request(HardwareCommand::HARDWARE_HEALTH_POLL, Bytes{},
                                            std::chrono::milliseconds(0)));
    }
    auto full = queue_->enqueue_request(HardwareCommand::HARDWARE_HEALTH_POLL, Bytes{},
                                        std::chrono::milliseconds(0));
    ASSERT_FALSE(full.is_success());
    EXPECT_EQ(full.error(), SBusError::QUEUE_FULL);
    EXPECT_EQ(queue_->stats().total_errors, 1u);

    ASSERT_TRUE(queue_->dequeue_request().has_value());
    EXPECT_TRUE(queue_->enqueue_request(HardwareCommand::HARDWARE_HEALTH_POLL, Bytes{},
                                        std::chrono::milliseconds(0)).is_success());
}

TEST_F(HardwareQueueTest, ResponsesFlowBack) {
    EXPECT_FALSE(queue_->dequeue_response().has_value());

    HardwareResponse response;
    response.request_id = 1;
    response.success = true;
    response.data = 2400;
    ASSERT_TRUE(queue_->post_response(response));

    auto received = queue_->dequeue_response();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->request_id, 1u);
    EXPECT_TRUE(received->success);
    EXPECT_EQ(received->data, 2400u);
    EXPECT_FALSE(received->error_message.has_value());
}

TEST_F(HardwareQueueTest, ResponseQueueIsBounded) {
    ASSERT_TRUE(queue_->post_response(HardwareResponse{1, true, 0, std::nullopt}));
    ASSERT_TRUE(queue_->post_response(HardwareResponse{2, false, 0, std::string("sensor offline")}));

    auto full = queue_->post_response(HardwareResponse{3, true, 0, std::nullopt});
    ASSERT_FALSE(full.is_success());
    EXPECT_EQ(full.error(), SBusError::QUEUE_FULL);
}

TEST_F(HardwareQueueTest, FlushAndStats) {
    ASSERT_TRUE(queue_->enqueue_request(HardwareCommand::GET_RAM_STATUS, Bytes{}, std::chrono::milliseconds(0)));
    ASSERT_TRUE(queue_->enqueue_request(HardwareCommand::GET_POWER_STATUS, Bytes{}, std::chrono::milliseconds(0)));
    ASSERT_TRUE(queue_->post_response(HardwareResponse{1, true, 0, std::nullopt}));

    auto stats = queue_->stats();
    EXPECT_EQ(stats.pending_requests, 2u);
    EXPECT_EQ(stats.pending_responses, 1u);
    EXPECT_EQ(stats.total_requests, 2u);
    EXPECT_EQ(stats.total_responses, 1u);

    EXPECT_EQ(queue_->flush_requests(), 2u);
    EXPECT_EQ(queue_->flush_responses(), 1u);
    stats = queue_->stats();
    EXPECT_EQ(stats.pending_requests, 0u);
    EXPECT_EQ(stats.pending_responses, 0u);
    EXPECT_EQ(stats.total_requests, 2u);
}

TEST_F(HardwareQueueTest, UsableThroughInterface) {
    std::unique_ptr<HardwareCommandQueue> queue =
        std::make_unique<InMemoryHardwareQueue>(config_, clock_);
    auto id = queue->enqueue_request(HardwareCommand::SET_DISPLAY_BRIGHTNESS, Bytes{80},
                                     std::chrono::milliseconds(0));
    ASSERT_TRUE(id.is_success());
    EXPECT_EQ(*id, 1u);
    EXPECT_FALSE(queue->dequeue_response().has_value());
}
