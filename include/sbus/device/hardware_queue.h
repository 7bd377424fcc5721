#ifndef SBUS_DEVICE_HARDWARE_QUEUE_H
#define SBUS_DEVICE_HARDWARE_QUEUE_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sbus {
namespace v1 {
namespace device {

using RequestId = uint32_t;

struct HardwareRequest {
    RequestId request_id = 0;
    HardwareCommand command = HardwareCommand::HARDWARE_HEALTH_POLL;
    Bytes parameters;
    std::chrono::milliseconds timeout{0};
    Timestamp enqueued_at{0};
};

struct HardwareResponse {
    RequestId request_id = 0;
    bool success = false;
    uint32_t data = 0;
    std::optional<std::string> error_message;
};

struct HardwareQueueStats {
    size_t pending_requests = 0;
    size_t pending_responses = 0;
    uint64_t total_requests = 0;
    uint64_t total_responses = 0;
    uint64_t total_errors = 0;
};

/**
 * Narrow interface to the device control subsystem.
 *
 * The bus only queues commands and collects responses; what a command does
 * is up to the driver on the other side.
 */
class SBUS_API HardwareCommandQueue {
public:
    virtual ~HardwareCommandQueue() = default;

    /**
     * Queue a command for the hardware driver
     * @return Request id, or QUEUE_FULL
     */
    virtual Result<RequestId> enqueue_request(HardwareCommand command,
                                              const Bytes& parameters,
                                              std::chrono::milliseconds timeout) = 0;

    virtual std::optional<HardwareResponse> dequeue_response() = 0;
};

/**
 * Bounded in-process queue pair. Request ids start at 1.
 */
class SBUS_API InMemoryHardwareQueue : public HardwareCommandQueue {
public:
    InMemoryHardwareQueue(const HardwareQueueConfig& config, std::shared_ptr<Clock> clock);
    ~InMemoryHardwareQueue() override = default;

    InMemoryHardwareQueue(const InMemoryHardwareQueue&) = delete;
    InMemoryHardwareQueue& operator=(const InMemoryHardwareQueue&) = delete;

    Result<RequestId> enqueue_request(HardwareCommand command,
                                      const Bytes& parameters,
                                      std::chrono::milliseconds timeout) override;
    std::optional<HardwareResponse> dequeue_response() override;

    // Driver side
    std::optional<HardwareRequest> dequeue_request();
    Result<void> post_response(HardwareResponse response);

    size_t flush_requests();
    size_t flush_responses();

    HardwareQueueStats stats() const;

private:
    HardwareQueueConfig config_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::deque<HardwareRequest> requests_;
    std::deque<HardwareResponse> responses_;
    RequestId next_id_ = 1;
    uint64_t total_requests_ = 0;
    uint64_t total_responses_ = 0;
    uint64_t total_errors_ = 0;
};

} // namespace device
} // namespace v1
} // namespace sbus

#endif // SBUS_DEVICE_HARDWARE_QUEUE_H
