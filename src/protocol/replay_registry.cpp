#include "sbus/protocol/replay_registry.h"
#include "sbus/crypto/crypto_utils.h"

namespace sbus::v1::protocol {

// ============================================================================
// SequenceTracker Implementation
// ============================================================================

Result<void> SequenceTracker::check(const std::string& source, uint64_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_seen_.find(source);
    if (it != last_seen_.end() && sequence <= it->second) {
        return Failure(SBusError::REPLAY_OR_OUT_OF_ORDER,
                       "sequence " + std::to_string(sequence) + " not above " + std::to_string(it->second));
    }
    return make_result();
}

Result<void> SequenceTracker::accept(const std::string& source, uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_seen_.find(source);
    if (it != last_seen_.end() && sequence <= it->second) {
        stats_.rejected++;
        return Failure(SBusError::REPLAY_OR_OUT_OF_ORDER,
                       "sequence " + std::to_string(sequence) + " not above " + std::to_string(it->second));
    }
    last_seen_[source] = sequence;
    stats_.accepted++;
    return make_result();
}

std::optional<uint64_t> SequenceTracker::last_seen(const std::string& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_seen_.find(source);
    if (it == last_seen_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SequenceTracker::reset(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_seen_.erase(source);
}

void SequenceTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_seen_.clear();
    stats_ = TrackerStats{};
}

size_t SequenceTracker::source_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seen_.size();
}

SequenceTracker::TrackerStats SequenceTracker::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

// ============================================================================
// NonceRegistry Implementation
// ============================================================================

NonceRegistry::NonceRegistry(size_t capacity)
    : capacity_(capacity == 0 ? DEFAULT_CAPACITY : capacity) {}

Result<void> NonceRegistry::insert(const std::string& nonce) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (seen_.count(nonce) > 0) {
        return Failure(SBusError::DUPLICATE_NONCE, "nonce already seen");
    }

    while (order_.size() >= capacity_) {
        seen_.erase(order_.front());
        order_.pop_front();
        evictions_++;
    }

    order_.push_back(nonce);
    seen_.insert(nonce);
    return make_result();
}

Result<void> NonceRegistry::insert(const Bytes& nonce) {
    return insert(crypto::utils::to_hex(nonce));
}

bool NonceRegistry::contains(const std::string& nonce) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.count(nonce) > 0;
}

size_t NonceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

size_t NonceRegistry::evictions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictions_;
}

void NonceRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    seen_.clear();
}

// ============================================================================
// SequenceNumberManager Implementation
// ============================================================================

Result<uint64_t> SequenceNumberManager::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ == MAX_SEQUENCE_NUMBER) {
        return make_error<uint64_t>(SBusError::RESOURCE_EXHAUSTED, "sequence space exhausted");
    }
    return ++current_;
}

uint64_t SequenceNumberManager::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void SequenceNumberManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = 0;
}

} // namespace sbus::v1::protocol
