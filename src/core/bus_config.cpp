#include <sbus/bus_config.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <sstream>
#include <unordered_map>

namespace sbus {
namespace v1 {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

Result<uint64_t> parse_u64(const std::string& key, const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return make_error<uint64_t>(SBusError::INVALID_CONFIGURATION,
                                    key + ": expected unsigned integer");
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return make_error<uint64_t>(SBusError::INVALID_CONFIGURATION, key + ": out of range");
    }
    return static_cast<uint64_t>(value);
}

Result<double> parse_double(const std::string& key, const std::string& text) {
    if (text.empty()) {
        return make_error<double>(SBusError::INVALID_CONFIGURATION, key + ": expected number");
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == nullptr || *end != '\0') {
        return make_error<double>(SBusError::INVALID_CONFIGURATION, key + ": expected number");
    }
    return value;
}

Result<bool> parse_bool(const std::string& key, const std::string& text) {
    if (text == "true" || text == "1") return true;
    if (text == "false" || text == "0") return false;
    return make_error<bool>(SBusError::INVALID_CONFIGURATION, key + ": expected true or false");
}

Result<Bytes> parse_hex(const std::string& key, const std::string& text) {
    if (text.size() % 2 != 0) {
        return make_error<Bytes>(SBusError::INVALID_CONFIGURATION, key + ": odd-length hex");
    }
    Bytes out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return make_error<Bytes>(SBusError::INVALID_CONFIGURATION, key + ": invalid hex");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

using Setter = std::function<Result<void>(BusConfig&, const std::string& key, const std::string& value)>;

template<typename T>
Setter integer_setter(T BusConfig::*section, uint32_t T::*field) {
    return [section, field](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
        uint64_t v = SBUS_TRY(parse_u64(key, value));
        if (v > UINT32_MAX) {
            return make_error<void>(SBusError::INVALID_CONFIGURATION, key + ": out of range");
        }
        (c.*section).*field = static_cast<uint32_t>(v);
        return make_result();
    };
}

template<typename T>
Setter size_setter(T BusConfig::*section, size_t T::*field) {
    return [section, field](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
        uint64_t v = SBUS_TRY(parse_u64(key, value));
        (c.*section).*field = static_cast<size_t>(v);
        return make_result();
    };
}

template<typename T>
Setter u64_setter(T BusConfig::*section, uint64_t T::*field) {
    return [section, field](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
        (c.*section).*field = SBUS_TRY(parse_u64(key, value));
        return make_result();
    };
}

template<typename T, typename Duration>
Setter duration_setter(T BusConfig::*section, Duration T::*field) {
    return [section, field](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
        uint64_t v = SBUS_TRY(parse_u64(key, value));
        (c.*section).*field = Duration(static_cast<typename Duration::rep>(v));
        return make_result();
    };
}

template<typename T>
Setter double_setter(T BusConfig::*section, double T::*field) {
    return [section, field](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
        (c.*section).*field = SBUS_TRY(parse_double(key, value));
        return make_result();
    };
}

template<typename T>
Setter bool_setter(T BusConfig::*section, bool T::*field) {
    return [section, field](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
        (c.*section).*field = SBUS_TRY(parse_bool(key, value));
        return make_result();
    };
}

const std::unordered_map<std::string, Setter>& property_setters() {
    using RC = ErrorReporter::ReportingConfig;
    static const std::unordered_map<std::string, Setter> setters = {
        {"bus.master_key", [](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
            c.master_key = SBUS_TRY(parse_hex(key, value));
            return make_result();
        }},

        {"record.max_payload_size", size_setter(&BusConfig::record, &RecordLayerConfig::max_payload_size)},
        {"record.rate_limit_per_window", integer_setter(&BusConfig::record, &RecordLayerConfig::rate_limit_per_window)},
        {"record.rate_window_s", duration_setter(&BusConfig::record, &RecordLayerConfig::rate_window)},
        {"record.enable_key_rotation", bool_setter(&BusConfig::record, &RecordLayerConfig::enable_key_rotation)},
        {"record.key_update_interval_s", duration_setter(&BusConfig::record, &RecordLayerConfig::key_update_interval)},
        {"record.max_key_lookahead", integer_setter(&BusConfig::record, &RecordLayerConfig::max_key_lookahead)},
        {"record.error_threshold", integer_setter(&BusConfig::record, &RecordLayerConfig::error_threshold)},
        {"record.breaker_success_threshold", integer_setter(&BusConfig::record, &RecordLayerConfig::breaker_success_threshold)},
        {"record.breaker_timeout_s", duration_setter(&BusConfig::record, &RecordLayerConfig::breaker_timeout)},
        {"record.nonce_registry_capacity", size_setter(&BusConfig::record, &RecordLayerConfig::nonce_registry_capacity)},

        {"rate_limit.window_s", duration_setter(&BusConfig::rate_limit, &RateLimitConfig::window)},
        {"rate_limit.default_budget", integer_setter(&BusConfig::rate_limit, &RateLimitConfig::default_budget)},
        {"rate_limit.auto_blacklist_threshold", integer_setter(&BusConfig::rate_limit, &RateLimitConfig::auto_blacklist_threshold)},
        {"rate_limit.violation_window_s", duration_setter(&BusConfig::rate_limit, &RateLimitConfig::violation_window)},
        {"rate_limit.blacklist_duration_s", duration_setter(&BusConfig::rate_limit, &RateLimitConfig::blacklist_duration)},
        {"rate_limit.enable_whitelist", bool_setter(&BusConfig::rate_limit, &RateLimitConfig::enable_whitelist)},
        {"rate_limit.max_identities", size_setter(&BusConfig::rate_limit, &RateLimitConfig::max_identities)},

        {"circuit_breaker.failure_threshold", integer_setter(&BusConfig::circuit_breaker, &CircuitBreakerConfig::failure_threshold)},
        {"circuit_breaker.success_threshold", integer_setter(&BusConfig::circuit_breaker, &CircuitBreakerConfig::success_threshold)},
        {"circuit_breaker.timeout_s", duration_setter(&BusConfig::circuit_breaker, &CircuitBreakerConfig::timeout)},

        {"session_cache.ttl_s", duration_setter(&BusConfig::session_cache, &SessionCacheConfig::ttl)},
        {"session_cache.capacity", size_setter(&BusConfig::session_cache, &SessionCacheConfig::capacity)},

        {"tickets.lifetime_s", duration_setter(&BusConfig::tickets, &TicketConfig::lifetime)},
        {"tickets.capacity", size_setter(&BusConfig::tickets, &TicketConfig::capacity)},
        {"tickets.ticket_id_length", size_setter(&BusConfig::tickets, &TicketConfig::ticket_id_length)},

        {"pfs.key_lifetime_s", duration_setter(&BusConfig::pfs, &PfsConfig::key_lifetime)},
        {"pfs.max_keys", size_setter(&BusConfig::pfs, &PfsConfig::max_keys)},

        {"key_rotation.interval_s", duration_setter(&BusConfig::key_rotation, &KeyRotationConfig::interval)},
        {"key_rotation.max_operations", u64_setter(&BusConfig::key_rotation, &KeyRotationConfig::max_operations)},
        {"key_rotation.max_history", size_setter(&BusConfig::key_rotation, &KeyRotationConfig::max_history)},
        {"key_rotation.policy", [](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
            if (value == "time") {
                c.key_rotation.policy = KeyRotationPolicy::TIME_BASED;
            } else if (value == "operations") {
                c.key_rotation.policy = KeyRotationPolicy::OPERATION_BASED;
            } else if (value == "hybrid") {
                c.key_rotation.policy = KeyRotationPolicy::HYBRID;
            } else {
                return make_error<void>(SBusError::INVALID_CONFIGURATION,
                                        key + ": expected time, operations or hybrid");
            }
            return make_result();
        }},

        {"handshake.deadline_ms", duration_setter(&BusConfig::handshake, &HandshakeConfig::deadline)},
        {"handshake.pin_ttl_s", duration_setter(&BusConfig::handshake, &HandshakeConfig::pin_ttl)},
        {"handshake.require_pin", bool_setter(&BusConfig::handshake, &HandshakeConfig::require_pin)},

        {"timeouts.handshake_ms", duration_setter(&BusConfig::timeouts, &TimeoutConfig::handshake)},
        {"timeouts.session_ms", duration_setter(&BusConfig::timeouts, &TimeoutConfig::session)},
        {"timeouts.pending_message_ms", duration_setter(&BusConfig::timeouts, &TimeoutConfig::pending_message)},
        {"timeouts.retry_ms", duration_setter(&BusConfig::timeouts, &TimeoutConfig::retry)},
        {"timeouts.max_retries", integer_setter(&BusConfig::timeouts, &TimeoutConfig::max_retries)},

        {"anomaly.error_rate", double_setter(&BusConfig::anomaly, &AnomalyThresholds::error_rate)},
        {"anomaly.success_rate", double_setter(&BusConfig::anomaly, &AnomalyThresholds::success_rate)},
        {"anomaly.latency_ms", double_setter(&BusConfig::anomaly, &AnomalyThresholds::latency_ms)},
        {"anomaly.connection_spike", u64_setter(&BusConfig::anomaly, &AnomalyThresholds::connection_spike)},
        {"anomaly.cache_miss_rate", double_setter(&BusConfig::anomaly, &AnomalyThresholds::cache_miss_rate)},
        {"anomaly.auth_failure_burst", integer_setter(&BusConfig::anomaly, &AnomalyThresholds::auth_failure_burst)},
        {"anomaly.auth_failure_window_s", duration_setter(&BusConfig::anomaly, &AnomalyThresholds::auth_failure_window)},
        {"anomaly.retention_s", duration_setter(&BusConfig::anomaly, &AnomalyThresholds::retention)},

        {"honeypot.batch_size", size_setter(&BusConfig::honeypot, &HoneypotConfig::batch_size)},
        {"honeypot.max_pool_size", size_setter(&BusConfig::honeypot, &HoneypotConfig::max_pool_size)},

        {"routing.node_queue_capacity", size_setter(&BusConfig::routing, &RoutingConfig::node_queue_capacity)},
        {"routing.health_poll_interval_ms", duration_setter(&BusConfig::routing, &RoutingConfig::health_poll_interval)},
        {"routing.critical_action_cooldown_ms", duration_setter(&BusConfig::routing, &RoutingConfig::critical_action_cooldown)},
        {"routing.component_token_lifetime_s", duration_setter(&BusConfig::routing, &RoutingConfig::component_token_lifetime)},

        {"hardware_queue.request_capacity", size_setter(&BusConfig::hardware_queue, &HardwareQueueConfig::request_capacity)},
        {"hardware_queue.response_capacity", size_setter(&BusConfig::hardware_queue, &HardwareQueueConfig::response_capacity)},
        {"hardware_queue.default_timeout_ms", duration_setter(&BusConfig::hardware_queue, &HardwareQueueConfig::default_timeout)},

        {"reporting.anonymize_identities", bool_setter(&BusConfig::reporting, &RC::anonymize_identities)},
        {"reporting.max_reports_per_second", integer_setter(&BusConfig::reporting, &RC::max_reports_per_second)},
        {"reporting.max_reports_per_minute", integer_setter(&BusConfig::reporting, &RC::max_reports_per_minute)},
        {"reporting.write_to_stderr", bool_setter(&BusConfig::reporting, &RC::write_to_stderr)},
        {"reporting.format", [](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
            if (value == "json") {
                c.reporting.format = ErrorReporter::OutputFormat::JSON;
            } else if (value == "human") {
                c.reporting.format = ErrorReporter::OutputFormat::HUMAN_READABLE;
            } else {
                return make_error<void>(SBusError::INVALID_CONFIGURATION, key + ": expected json or human");
            }
            return make_result();
        }},
        {"reporting.minimum_level", [](BusConfig& c, const std::string& key, const std::string& value) -> Result<void> {
            using L = ErrorReporter::LogLevel;
            static const std::unordered_map<std::string, L> levels = {
                {"debug", L::DEBUG}, {"info", L::INFO}, {"warning", L::WARNING},
                {"error", L::ERROR}, {"critical", L::CRITICAL}, {"security", L::SECURITY}
            };
            auto it = levels.find(value);
            if (it == levels.end()) {
                return make_error<void>(SBusError::INVALID_CONFIGURATION, key + ": unknown level");
            }
            c.reporting.minimum_level = it->second;
            return make_result();
        }}
    };
    return setters;
}

Result<void> invalid(const std::string& detail) {
    return make_error<void>(SBusError::INVALID_CONFIGURATION, detail);
}

bool is_fraction(double v) {
    return v >= 0.0 && v <= 1.0;
}

} // namespace

Result<void> BusConfig::validate() const {
    if (master_key.empty()) return invalid("bus.master_key: empty");

    if (record.max_payload_size == 0) return invalid("record.max_payload_size: zero");
    if (record.rate_limit_per_window == 0) return invalid("record.rate_limit_per_window: zero");
    if (record.rate_window.count() <= 0) return invalid("record.rate_window_s: zero");
    if (record.enable_key_rotation && record.key_update_interval.count() <= 0) {
        return invalid("record.key_update_interval_s: zero");
    }
    if (record.error_threshold == 0) return invalid("record.error_threshold: zero");
    if (record.breaker_success_threshold == 0) return invalid("record.breaker_success_threshold: zero");
    if (record.nonce_registry_capacity == 0) return invalid("record.nonce_registry_capacity: zero");

    if (rate_limit.window.count() <= 0) return invalid("rate_limit.window_s: zero");
    if (rate_limit.default_budget == 0) return invalid("rate_limit.default_budget: zero");
    if (rate_limit.max_identities == 0) return invalid("rate_limit.max_identities: zero");

    if (circuit_breaker.failure_threshold == 0) return invalid("circuit_breaker.failure_threshold: zero");
    if (circuit_breaker.success_threshold == 0) return invalid("circuit_breaker.success_threshold: zero");

    if (session_cache.capacity == 0) return invalid("session_cache.capacity: zero");
    if (session_cache.ttl.count() <= 0) return invalid("session_cache.ttl_s: zero");
    if (tickets.capacity == 0) return invalid("tickets.capacity: zero");
    if (tickets.lifetime.count() <= 0) return invalid("tickets.lifetime_s: zero");
    if (tickets.ticket_id_length < 8) return invalid("tickets.ticket_id_length: below 8");
    if (pfs.key_lifetime.count() <= 0) return invalid("pfs.key_lifetime_s: zero");
    if (pfs.max_keys == 0) return invalid("pfs.max_keys: zero");
    if (key_rotation.max_history == 0) return invalid("key_rotation.max_history: zero");

    if (handshake.deadline.count() <= 0) return invalid("handshake.deadline_ms: zero");
    if (handshake.offered_suites.empty()) return invalid("handshake.offered_suites: empty");
    for (CipherSuite suite : handshake.offered_suites) {
        if (!is_supported_cipher_suite(static_cast<uint16_t>(suite))) {
            return invalid("handshake.offered_suites: unsupported suite");
        }
    }

    if (!is_fraction(anomaly.error_rate)) return invalid("anomaly.error_rate: outside [0,1]");
    if (!is_fraction(anomaly.success_rate)) return invalid("anomaly.success_rate: outside [0,1]");
    if (!is_fraction(anomaly.cache_miss_rate)) return invalid("anomaly.cache_miss_rate: outside [0,1]");
    if (anomaly.latency_ms <= 0.0) return invalid("anomaly.latency_ms: not positive");
    if (anomaly.auth_failure_burst == 0) return invalid("anomaly.auth_failure_burst: zero");

    if (honeypot.batch_size == 0) return invalid("honeypot.batch_size: zero");
    if (routing.node_queue_capacity == 0) return invalid("routing.node_queue_capacity: zero");
    if (hardware_queue.request_capacity == 0) return invalid("hardware_queue.request_capacity: zero");
    if (hardware_queue.response_capacity == 0) return invalid("hardware_queue.response_capacity: zero");

    if (reporting.max_reports_per_second == 0 || reporting.max_reports_per_minute == 0) {
        return invalid("reporting: zero report budget");
    }

    return make_result();
}

Result<void> BusConfig::apply_properties(const std::string& text) {
    std::istringstream input(text);
    std::string line;
    size_t line_number = 0;

    // Parse into a copy so a bad line leaves this config untouched
    BusConfig updated = *this;

    while (std::getline(input, line)) {
        ++line_number;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        size_t eq = stripped.find('=');
        if (eq == std::string::npos) {
            return invalid("line " + std::to_string(line_number) + ": missing '='");
        }

        std::string key = trim(stripped.substr(0, eq));
        std::string value = trim(stripped.substr(eq + 1));

        auto it = property_setters().find(key);
        if (it == property_setters().end()) {
            return invalid("line " + std::to_string(line_number) + ": unknown key " + key);
        }

        auto result = it->second(updated, key, value);
        if (result.is_error()) {
            return invalid("line " + std::to_string(line_number) + ": " + result.error_detail());
        }
    }

    *this = std::move(updated);
    return make_result();
}

Result<BusConfig> BusConfig::from_properties(const std::string& text) {
    BusConfig config;
    auto applied = config.apply_properties(text);
    if (applied.is_error()) {
        return applied.failure();
    }
    return config;
}

BusConfig BusConfigFactory::create_development() {
    BusConfig config;
    config.rate_limit.default_budget = 1000;
    config.record.rate_limit_per_window = 1000;
    config.reporting.minimum_level = ErrorReporter::LogLevel::DEBUG;
    config.reporting.anonymize_identities = false;
    config.reporting.max_reports_per_second = 1000;
    config.reporting.max_reports_per_minute = 10000;
    return config;
}

BusConfig BusConfigFactory::create_production() {
    BusConfig config;
    config.rate_limit.auto_blacklist_threshold = 50;
    config.reporting.minimum_level = ErrorReporter::LogLevel::WARNING;
    config.reporting.format = ErrorReporter::OutputFormat::JSON;
    return config;
}

BusConfig BusConfigFactory::create_high_security() {
    BusConfig config;
    config.record.rate_limit_per_window = 50;
    config.record.key_update_interval = std::chrono::seconds(10);
    config.record.error_threshold = 5;
    config.rate_limit.default_budget = 50;
    config.rate_limit.auto_blacklist_threshold = 10;
    config.rate_limit.blacklist_duration = std::chrono::seconds(1800);
    config.circuit_breaker.failure_threshold = 3;
    config.circuit_breaker.timeout = std::chrono::seconds(60);
    config.session_cache.ttl = std::chrono::seconds(900);
    config.tickets.lifetime = std::chrono::seconds(900);
    config.pfs.key_lifetime = std::chrono::seconds(120);
    config.key_rotation.interval = std::chrono::seconds(900);
    config.handshake.deadline = std::chrono::milliseconds(3000);
    config.handshake.require_pin = true;
    config.anomaly.auth_failure_burst = 3;
    config.reporting.minimum_level = ErrorReporter::LogLevel::INFO;
    config.reporting.format = ErrorReporter::OutputFormat::JSON;
    return config;
}

} // namespace v1
} // namespace sbus
