#include <sbus/device/hardware_queue.h>

namespace sbus {
namespace v1 {
namespace device {

InMemoryHardwareQueue::InMemoryHardwareQueue(const HardwareQueueConfig& config, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(std::move(clock)) {}

Result<RequestId> InMemoryHardwareQueue::enqueue_request(HardwareCommand command,
                                                         const Bytes& parameters,
                                                         std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.size() >= config_.request_capacity) {
        total_errors_++;
        return make_error<RequestId>(SBusError::QUEUE_FULL, "hardware request queue full");
    }

    HardwareRequest request;
    request.request_id = next_id_++;
    request.command = command;
    request.parameters = parameters;
    request.timeout = timeout.count() > 0 ? timeout : config_.default_timeout;
    request.enqueued_at = clock_ ? clock_->now() : Timestamp{0};

    const RequestId id = request.request_id;
    requests_.push_back(std::move(request));
    total_requests_++;
    return id;
}

std::optional<HardwareResponse> InMemoryHardwareQueue::dequeue_response() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (responses_.empty()) {
        return std::nullopt;
    }
    HardwareResponse response = std::move(responses_.front());
    responses_.pop_front();
    return response;
}

std::optional<HardwareRequest> InMemoryHardwareQueue::dequeue_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.empty()) {
        return std::nullopt;
    }
    HardwareRequest request = std::move(requests_.front());
    requests_.pop_front();
    return request;
}

Result<void> InMemoryHardwareQueue::post_response(HardwareResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (responses_.size() >= config_.response_capacity) {
        total_errors_++;
        return Failure(SBusError::QUEUE_FULL, "hardware response queue full");
    }
    responses_.push_back(std::move(response));
    total_responses_++;
    return make_result();
}

size_t InMemoryHardwareQueue::flush_requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t count = requests_.size();
    requests_.clear();
    return count;
}

size_t InMemoryHardwareQueue::flush_responses() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t count = responses_.size();
    responses_.clear();
    return count;
}

HardwareQueueStats InMemoryHardwareQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HardwareQueueStats stats;
    stats.pending_requests = requests_.size();
    stats.pending_responses = responses_.size();
    stats.total_requests = total_requests_;
    stats.total_responses = total_responses_;
    stats.total_errors = total_errors_;
    return stats;
}

} // namespace device
} // namespace v1
} // namespace sbus
