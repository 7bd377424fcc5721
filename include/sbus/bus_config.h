#ifndef SBUS_BUS_CONFIG_H
#define SBUS_BUS_CONFIG_H

#include <sbus/config.h>
#include <sbus/types.h>
#include <sbus/result.h>
#include <sbus/error_reporter.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {

/**
 * Record layer configuration (one per direction)
 */
struct RecordLayerConfig {
    size_t max_payload_size = 16384;

    // Per-destination budget
    uint32_t rate_limit_per_window = 100;
    std::chrono::seconds rate_window{60};

    // Traffic key rotation
    bool enable_key_rotation = true;
    std::chrono::seconds key_update_interval{30};
    uint32_t max_key_lookahead = 4;

    // Consecutive transport failures before the breaker opens
    uint32_t error_threshold = 10;
    uint32_t breaker_success_threshold = 3;
    std::chrono::seconds breaker_timeout{30};

    size_t nonce_registry_capacity = 1000;
};

/**
 * Per-identity fixed window rate limiting
 */
struct RateLimitConfig {
    std::chrono::seconds window{60};

    // Budget for identities without a component entry or override
    uint32_t default_budget = 100;

    // Automatic blacklisting after repeated denials; 0 disables it
    uint32_t auto_blacklist_threshold = 0;
    std::chrono::seconds violation_window{3600};
    std::chrono::seconds blacklist_duration{300};

    bool enable_whitelist = true;

    // Tracked identities; idle ones are swept once the table fills
    size_t max_identities = 100000;
};

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;
    uint32_t success_threshold = 3;
    std::chrono::seconds timeout{30};
};

struct SessionCacheConfig {
    std::chrono::seconds ttl{3600};
    size_t capacity = 1000;
};

struct TicketConfig {
    std::chrono::seconds lifetime{3600};
    size_t capacity = 1000;
    size_t ticket_id_length = 16;
};

struct PfsConfig {
    std::chrono::seconds key_lifetime{300};
    size_t max_keys = 1000;
};

enum class KeyRotationPolicy : uint8_t {
    TIME_BASED,
    OPERATION_BASED,
    HYBRID
};

struct KeyRotationConfig {
    KeyRotationPolicy policy = KeyRotationPolicy::HYBRID;
    std::chrono::seconds interval{3600};
    uint64_t max_operations = 1000000;
    size_t max_history = 10;
    size_t key_length = 32;
};

struct HandshakeConfig {
    std::chrono::milliseconds deadline{5000};
    std::vector<CipherSuite> offered_suites{SUPPORTED_CIPHER_SUITES.begin(),
                                            SUPPORTED_CIPHER_SUITES.end()};
    std::chrono::seconds pin_ttl{86400};
    // Reject peers without a pin instead of accepting them unpinned
    bool require_pin = false;
};

struct TimeoutConfig {
    std::chrono::milliseconds handshake{5000};
    std::chrono::milliseconds session{3600000};
    std::chrono::milliseconds pending_message{5000};
    std::chrono::milliseconds retry{1000};
    uint32_t max_retries = 3;
};

struct AnomalyThresholds {
    double error_rate = 0.25;
    double success_rate = 0.70;
    double latency_ms = 500.0;
    uint64_t connection_spike = 50;
    double cache_miss_rate = 0.30;

    uint32_t auth_failure_burst = 5;
    std::chrono::seconds auth_failure_window{60};

    std::chrono::seconds retention{3600};
    size_t max_history = 1000;
};

struct HoneypotConfig {
    size_t batch_size = 100;
    size_t max_pool_size = 100000;
    size_t max_logged_attempts = 1000;
};

/**
 * Resource limits attached to a sandbox handle
 */
struct SandboxLimits {
    uint32_t max_cpu_percent = 50;
    uint64_t max_memory_mb = 512;
    uint32_t max_file_descriptors = 32;
    uint32_t allowed_syscalls = 128;

    static SandboxLimits restricted() {
        return SandboxLimits{50, 512, 32, 128};
    }

    static SandboxLimits moderate() {
        return SandboxLimits{75, 1024, 64, 256};
    }
};

struct RoutingConfig {
    size_t node_queue_capacity = 256;
    std::chrono::milliseconds health_poll_interval{100};
    std::chrono::milliseconds critical_action_cooldown{5000};
    std::chrono::seconds component_token_lifetime{3600};
};

struct HardwareQueueConfig {
    size_t request_capacity = 64;
    size_t response_capacity = 64;
    std::chrono::milliseconds default_timeout{5000};
};

/**
 * Aggregate configuration handed to BusContext at startup.
 */
struct SBUS_API BusConfig {
    // Long-term secret all channel keys derive from
    Bytes master_key;

    RecordLayerConfig record;
    RateLimitConfig rate_limit;
    CircuitBreakerConfig circuit_breaker;
    SessionCacheConfig session_cache;
    TicketConfig tickets;
    PfsConfig pfs;
    KeyRotationConfig key_rotation;
    HandshakeConfig handshake;
    TimeoutConfig timeouts;
    AnomalyThresholds anomaly;
    HoneypotConfig honeypot;
    RoutingConfig routing;
    HardwareQueueConfig hardware_queue;
    ErrorReporter::ReportingConfig reporting;

    /**
     * Check every section for values that would make a component unusable.
     * @return INVALID_CONFIGURATION naming the first offending key
     */
    Result<void> validate() const;

    /**
     * Apply `section.key=value` overrides, one per line. Blank lines and
     * lines starting with '#' are ignored.
     */
    Result<void> apply_properties(const std::string& text);

    static Result<BusConfig> from_properties(const std::string& text);
};

/**
 * Preset configurations
 */
class SBUS_API BusConfigFactory {
public:
    // Generous budgets, verbose logging
    static BusConfig create_development();

    static BusConfig create_production();

    // Short lifetimes, tight budgets, automatic blacklisting, mandatory pins
    static BusConfig create_high_security();
};

} // namespace v1
} // namespace sbus

#endif // SBUS_BUS_CONFIG_H
