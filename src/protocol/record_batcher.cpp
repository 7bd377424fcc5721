#include "sbus/protocol/record_batcher.h"

namespace sbus::v1::protocol {

RecordBatcher::RecordBatcher(size_t max_batch_size,
                             std::chrono::milliseconds batch_timeout,
                             std::shared_ptr<Clock> clock)
    : max_batch_size_(max_batch_size)
    , batch_timeout_(batch_timeout)
    , clock_(std::move(clock)) {
    created_at_ = clock_->now();
}

Result<void> RecordBatcher::add_record(const Bytes& record) {
    if (record.empty()) {
        return Failure(SBusError::EMPTY_PAYLOAD, "empty record");
    }
    if (record.size() > 0xFFFFFFFFULL) {
        return Failure(SBusError::MESSAGE_TOO_LARGE, "record exceeds length prefix");
    }

    size_t framed = LENGTH_PREFIX_SIZE + record.size();

    std::lock_guard<std::mutex> lock(mutex_);
    // An oversized record still goes out alone in an empty batch
    if (!records_.empty() && total_size_ + framed > max_batch_size_) {
        return Failure(SBusError::QUEUE_FULL, "batch full");
    }
    if (records_.empty()) {
        created_at_ = clock_->now();
    }

    total_size_ += framed;
    records_.push_back(record);
    records_batched_.fetch_add(1);
    bytes_batched_.fetch_add(record.size());
    return make_result();
}

Bytes RecordBatcher::take_locked(Timestamp now) {
    Bytes data;
    data.reserve(total_size_);
    for (const auto& record : records_) {
        uint32_t length = static_cast<uint32_t>(record.size());
        data.push_back(static_cast<uint8_t>(length >> 24));
        data.push_back(static_cast<uint8_t>(length >> 16));
        data.push_back(static_cast<uint8_t>(length >> 8));
        data.push_back(static_cast<uint8_t>(length));
        data.insert(data.end(), record.begin(), record.end());
    }

    records_.clear();
    total_size_ = 0;
    created_at_ = now;
    batches_flushed_.fetch_add(1);
    return data;
}

std::optional<Bytes> RecordBatcher::try_flush() {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.empty()) {
        return std::nullopt;
    }
    if (total_size_ >= max_batch_size_ || now - created_at_ >= batch_timeout_) {
        return take_locked(now);
    }
    return std::nullopt;
}

std::optional<Bytes> RecordBatcher::force_flush() {
    Timestamp now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.empty()) {
        return std::nullopt;
    }
    return take_locked(now);
}

Result<std::vector<Bytes>> RecordBatcher::split_batch(const Bytes& batch) {
    std::vector<Bytes> records;
    size_t offset = 0;
    while (offset < batch.size()) {
        if (batch.size() - offset < LENGTH_PREFIX_SIZE) {
            return make_error<std::vector<Bytes>>(SBusError::INVALID_MESSAGE_FORMAT, "truncated length prefix");
        }
        uint32_t length = (static_cast<uint32_t>(batch[offset]) << 24) |
                          (static_cast<uint32_t>(batch[offset + 1]) << 16) |
                          (static_cast<uint32_t>(batch[offset + 2]) << 8) |
                          static_cast<uint32_t>(batch[offset + 3]);
        offset += LENGTH_PREFIX_SIZE;

        if (length == 0 || batch.size() - offset < length) {
            return make_error<std::vector<Bytes>>(SBusError::INVALID_MESSAGE_FORMAT, "truncated record");
        }
        records.emplace_back(batch.begin() + static_cast<std::ptrdiff_t>(offset),
                             batch.begin() + static_cast<std::ptrdiff_t>(offset + length));
        offset += length;
    }
    return records;
}

size_t RecordBatcher::batch_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_size_;
}

size_t RecordBatcher::record_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

RecordBatcher::BatchingStats RecordBatcher::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BatchingStats stats;
    stats.current_batch_records = records_.size();
    stats.current_batch_size = total_size_;
    stats.batches_flushed = batches_flushed_.load();
    stats.total_records_batched = records_batched_.load();
    stats.total_bytes_batched = bytes_batched_.load();
    return stats;
}

void RecordBatcher::reset_stats() {
    batches_flushed_.store(0);
    records_batched_.store(0);
    bytes_batched_.store(0);
}

} // namespace sbus::v1::protocol
