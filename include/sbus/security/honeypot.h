#pragma once

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <sbus/bus_config.h>
#include <sbus/error_reporter.h>
#include <sbus/crypto/provider.h>

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sbus {
namespace v1 {
namespace security {

struct IntrusionAttempt {
    uint64_t sequence = 0;
    std::string source;
    std::string reason;
    Timestamp at{0};
};

/**
 * Pool of decoy tokens that no legitimate component ever holds.
 *
 * Decoys are named hp_00000001, hp_00000002, ... and carry a random
 * token-shaped value. Every recorded intrusion attempt grows the pool to
 * attempts x batch_size decoys (capped at max_pool_size), so the pool
 * expands while the bus is being probed.
 */
class SBUS_API Honeypot {
public:
    static constexpr size_t DECOY_TOKEN_LENGTH = 52;

    static Result<std::shared_ptr<Honeypot>> create(const HoneypotConfig& config,
                                                    std::shared_ptr<crypto::CryptoProvider> provider,
                                                    std::shared_ptr<Clock> clock,
                                                    std::shared_ptr<ErrorReporter> reporter = nullptr);

    Honeypot(const Honeypot&) = delete;
    Honeypot& operator=(const Honeypot&) = delete;

    Result<void> signal_attempt(const std::string& source, const std::string& reason);

    Result<void> add_decoys(size_t count);

    // Matches a decoy by name or by value
    bool is_decoy(const std::string& token) const;

    std::optional<std::string> decoy_value(const std::string& decoy_id) const;

    std::vector<IntrusionAttempt> attempt_log() const;
    uint64_t attempt_count() const;
    size_t count() const;

private:
    Honeypot(const HoneypotConfig& config,
             std::shared_ptr<crypto::CryptoProvider> provider,
             std::shared_ptr<Clock> clock,
             std::shared_ptr<ErrorReporter> reporter);

    Result<void> add_decoys_locked(size_t count);
    static std::string decoy_name(uint64_t index);

    HoneypotConfig config_;
    std::shared_ptr<crypto::CryptoProvider> provider_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ErrorReporter> reporter_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> decoys_;
    std::unordered_set<std::string> decoy_values_;
    std::deque<IntrusionAttempt> attempts_;
    uint64_t attempt_count_ = 0;
    uint64_t next_index_ = 1;
};

} // namespace security
} // namespace v1
} // namespace sbus
