#ifndef SBUS_PROTOCOL_RECORD_BATCHER_H
#define SBUS_PROTOCOL_RECORD_BATCHER_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sbus {
namespace v1 {
namespace protocol {

/**
 * Coalesces outbound records into one transport write.
 *
 * A batch is the concatenation of length-prefixed records
 * (u32 big-endian length, then the record). It is flushed once its framed
 * size reaches max_batch_size or once it is older than the batch timeout.
 */
class SBUS_API RecordBatcher {
public:
    static constexpr size_t LENGTH_PREFIX_SIZE = 4;

    RecordBatcher(size_t max_batch_size,
                  std::chrono::milliseconds batch_timeout,
                  std::shared_ptr<Clock> clock);

    RecordBatcher(const RecordBatcher&) = delete;
    RecordBatcher& operator=(const RecordBatcher&) = delete;

    /**
     * Append a record to the current batch
     * @return QUEUE_FULL if it does not fit in a non-empty batch
     */
    Result<void> add_record(const Bytes& record);

    // Flushes when the batch is full or timed out
    std::optional<Bytes> try_flush();

    // Flushes whatever is pending
    std::optional<Bytes> force_flush();

    // Inverse of a flush; INVALID_MESSAGE_FORMAT on truncated framing
    static Result<std::vector<Bytes>> split_batch(const Bytes& batch);

    size_t batch_size() const;
    size_t record_count() const;

    struct BatchingStats {
        size_t current_batch_records = 0;
        size_t current_batch_size = 0;
        uint64_t batches_flushed = 0;
        uint64_t total_records_batched = 0;
        uint64_t total_bytes_batched = 0;
    };
    BatchingStats get_stats() const;
    void reset_stats();

private:
    Bytes take_locked(Timestamp now);

    size_t max_batch_size_;
    std::chrono::milliseconds batch_timeout_;
    std::shared_ptr<Clock> clock_;

    std::vector<Bytes> records_;
    size_t total_size_ = 0;
    Timestamp created_at_{0};
    mutable std::mutex mutex_;

    std::atomic<uint64_t> batches_flushed_{0};
    std::atomic<uint64_t> records_batched_{0};
    std::atomic<uint64_t> bytes_batched_{0};
};

} // namespace protocol
} // namespace v1
} // namespace sbus

#endif // SBUS_PROTOCOL_RECORD_BATCHER_H
