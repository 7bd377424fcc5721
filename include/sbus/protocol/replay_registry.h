#ifndef SBUS_PROTOCOL_REPLAY_REGISTRY_H
#define SBUS_PROTOCOL_REPLAY_REGISTRY_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace sbus {
namespace v1 {
namespace protocol {

/**
 * Per-source record of the last accepted sequence number.
 *
 * Sequences must strictly increase per source; anything at or below the
 * last accepted value is a replay or an out-of-order record.
 */
class SBUS_API SequenceTracker {
public:
    SequenceTracker() = default;

    // Non-copyable
    SequenceTracker(const SequenceTracker&) = delete;
    SequenceTracker& operator=(const SequenceTracker&) = delete;

    /**
     * Check a sequence without recording it
     * @return REPLAY_OR_OUT_OF_ORDER if sequence <= last accepted
     */
    Result<void> check(const std::string& source, uint64_t sequence) const;

    // Check and record in one step
    Result<void> accept(const std::string& source, uint64_t sequence);

    std::optional<uint64_t> last_seen(const std::string& source) const;

    void reset(const std::string& source);
    void clear();
    size_t source_count() const;

    struct TrackerStats {
        size_t accepted = 0;
        size_t rejected = 0;
    };
    TrackerStats get_stats() const;

private:
    std::unordered_map<std::string, uint64_t> last_seen_;
    TrackerStats stats_;
    mutable std::mutex mutex_;
};

/**
 * Bounded FIFO of recently seen nonces (or tokens).
 *
 * Inserting a nonce already present fails with DUPLICATE_NONCE. Once the
 * capacity is reached the oldest entry is evicted.
 */
class SBUS_API NonceRegistry {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit NonceRegistry(size_t capacity = DEFAULT_CAPACITY);

    NonceRegistry(const NonceRegistry&) = delete;
    NonceRegistry& operator=(const NonceRegistry&) = delete;

    Result<void> insert(const std::string& nonce);
    Result<void> insert(const Bytes& nonce);

    bool contains(const std::string& nonce) const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t evictions() const;
    void clear();

private:
    size_t capacity_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> seen_;
    size_t evictions_ = 0;
    mutable std::mutex mutex_;
};

/**
 * Sender-side sequence numbers, starting at 1
 */
class SBUS_API SequenceNumberManager {
public:
    SequenceNumberManager() = default;

    SequenceNumberManager(const SequenceNumberManager&) = delete;
    SequenceNumberManager& operator=(const SequenceNumberManager&) = delete;

    // RESOURCE_EXHAUSTED once the sequence space is spent
    Result<uint64_t> next();

    uint64_t current() const;
    void reset();

private:
    uint64_t current_{0};
    mutable std::mutex mutex_;

    static constexpr uint64_t MAX_SEQUENCE_NUMBER = ~0ULL;
};

} // namespace protocol
} // namespace v1
} // namespace sbus

#endif // SBUS_PROTOCOL_REPLAY_REGISTRY_H
