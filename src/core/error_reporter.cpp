#include <sbus/error_reporter.h>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sbus {
namespace v1 {

ErrorReporter::ErrorReporter(std::shared_ptr<Clock> clock)
    : ErrorReporter(ReportingConfig{}, std::move(clock)) {}

ErrorReporter::ErrorReporter(const ReportingConfig& config, std::shared_ptr<Clock> clock)
    : config_(config), clock_(clock ? std::move(clock) : make_steady_clock()) {
    budget_.second_start = clock_->now();
    budget_.minute_start = clock_->now();
}

ErrorReporter::~ErrorReporter() = default;

Result<void> ErrorReporter::report_error(LogLevel level,
                                         SBusError error,
                                         const std::string& category,
                                         const std::string& message) {
    ErrorReport report(level, error, message);
    report.category = category;
    return submit_report(std::move(report));
}

Result<void> ErrorReporter::report_security_incident(SBusError error,
                                                     const std::string& incident_type,
                                                     double confidence,
                                                     const std::string& identity) {
    ErrorReport report(LogLevel::SECURITY, error, "Security incident: " + incident_type);
    report.category = "security";
    report.identity = identity;
    report.is_security_incident = true;
    report.threat_confidence = confidence;
    report.attack_vector = incident_type;
    return submit_report(std::move(report));
}

ErrorReporter::ReportBuilder ErrorReporter::create_report(LogLevel level, SBusError error) {
    return ReportBuilder(*this, level, error);
}

Result<void> ErrorReporter::submit_report(ErrorReport report) {
    ReportingConfig config = get_configuration();

    if (!report.is_security_incident && report.level < config.minimum_level) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.filtered_reports++;
        return make_result();
    }

    // Security incidents are always recorded
    if (!report.is_security_incident && !consume_budget()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.rate_limited_reports++;
        return make_error<void>(SBusError::RATE_LIMITED, "report budget exhausted");
    }

    if (report.message.size() > config.max_message_size) {
        report.message.resize(config.max_message_size);
    }
    if (config.anonymize_identities && !report.identity.empty()) {
        report.identity = anonymize_identity(report.identity);
    }
    report.timestamp = clock_->now();

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.total_reports++;
        size_t level_index = static_cast<size_t>(report.level);
        if (level_index < 6) {
            stats_.reports_by_level[level_index]++;
        }
        if (report.is_security_incident) {
            stats_.security_incidents++;
        }
    }

    return write_report(report);
}

Result<void> ErrorReporter::update_configuration(const ReportingConfig& config) {
    if (config.max_reports_per_second == 0 || config.max_reports_per_minute == 0 ||
        config.max_message_size == 0) {
        return make_error<void>(SBusError::INVALID_CONFIGURATION,
                                "reporting budgets must be positive");
    }
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
    return make_result();
}

ErrorReporter::ReportingConfig ErrorReporter::get_configuration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ErrorReporter::add_reporter_callback(ReporterCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

void ErrorReporter::clear_reporter_callbacks() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.clear();
}

ErrorReporter::ReportingStatistics ErrorReporter::get_statistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void ErrorReporter::reset_statistics() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = ReportingStatistics{};
}

std::string ErrorReporter::anonymize_identity(const std::string& identity) {
    std::hash<std::string> hasher;
    std::ostringstream oss;
    oss << "anon-" << std::hex << std::setw(16) << std::setfill('0')
        << static_cast<uint64_t>(hasher(identity));
    return oss.str();
}

bool ErrorReporter::consume_budget() {
    uint32_t max_per_second;
    uint32_t max_per_minute;
    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        max_per_second = config_.max_reports_per_second;
        max_per_minute = config_.max_reports_per_minute;
    }

    std::lock_guard<std::mutex> lock(budget_mutex_);
    auto now = clock_->now();

    if (now - budget_.second_start >= std::chrono::seconds(1)) {
        budget_.reports_this_second = 0;
        budget_.second_start = now;
    }
    if (now - budget_.minute_start >= std::chrono::minutes(1)) {
        budget_.reports_this_minute = 0;
        budget_.minute_start = now;
    }

    if (budget_.reports_this_second >= max_per_second ||
        budget_.reports_this_minute >= max_per_minute) {
        return false;
    }

    budget_.reports_this_second++;
    budget_.reports_this_minute++;
    return true;
}

Result<void> ErrorReporter::write_report(const ErrorReport& report) {
    ReportingConfig config = get_configuration();
    std::string formatted = format_report(report, config);

    std::vector<ReporterCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = callbacks_;
    }

    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (callbacks.empty() && config.write_to_stderr) {
            std::cerr << formatted << std::endl;
        }
        for (const auto& callback : callbacks) {
            callback(report, formatted);
        }
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.bytes_logged += formatted.length();
    return make_result();
}

std::string ErrorReporter::format_report(const ErrorReport& report,
                                         const ReportingConfig& config) const {
    std::ostringstream oss;

    if (config.format == OutputFormat::JSON) {
        oss << "{\"ts_ms\":" << report.timestamp.count()
            << ",\"level\":\"" << log_level_to_string(report.level) << "\""
            << ",\"error\":" << static_cast<int>(report.error_code)
            << ",\"category\":\"" << escape_json(report.category) << "\""
            << ",\"message\":\"" << escape_json(report.message) << "\"";

        if (!report.component.empty()) {
            oss << ",\"component\":\"" << escape_json(report.component) << "\"";
        }
        if (!report.identity.empty()) {
            oss << ",\"identity\":\"" << escape_json(report.identity) << "\"";
        }
        if (!report.metadata.empty()) {
            oss << ",\"metadata\":{";
            bool first = true;
            for (const auto& entry : report.metadata) {
                if (!first) oss << ",";
                oss << "\"" << escape_json(entry.first) << "\":\""
                    << escape_json(entry.second) << "\"";
                first = false;
            }
            oss << "}";
        }
        if (report.is_security_incident) {
            oss << ",\"security_incident\":true"
                << ",\"threat_confidence\":" << report.threat_confidence
                << ",\"attack_vector\":\"" << escape_json(report.attack_vector) << "\"";
        }

        oss << "}";
    } else {
        oss << report.timestamp.count() << "ms "
            << log_level_to_string(report.level)
            << " [" << report.category << "] "
            << error_message(report.error_code)
            << " (" << static_cast<int>(report.error_code) << "): " << report.message;

        if (!report.component.empty()) {
            oss << " component=" << report.component;
        }
        if (!report.identity.empty()) {
            oss << " identity=" << report.identity;
        }
        for (const auto& entry : report.metadata) {
            oss << " " << entry.first << "=" << entry.second;
        }
        if (report.is_security_incident) {
            oss << " (SECURITY: " << report.attack_vector
                << ", confidence: " << report.threat_confidence << ")";
        }
    }

    return oss.str();
}

std::string ErrorReporter::escape_json(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    out += oss.str();
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string ErrorReporter::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::SECURITY: return "SECURITY";
    }
    return "UNKNOWN";
}

// ReportBuilder

ErrorReporter::ReportBuilder::ReportBuilder(ErrorReporter& reporter, LogLevel level, SBusError error)
    : reporter_(reporter), report_(level, error, "") {}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::category(const std::string& cat) {
    report_.category = cat;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::message(const std::string& msg) {
    report_.message = msg;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::component(const std::string& comp) {
    report_.component = comp;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::identity(const std::string& id) {
    report_.identity = id;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::metadata(const std::string& key,
                                                                     const std::string& value) {
    report_.metadata[key] = value;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::security_incident(bool is_incident) {
    report_.is_security_incident = is_incident;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::threat_confidence(double confidence) {
    report_.threat_confidence = confidence;
    return *this;
}

ErrorReporter::ReportBuilder& ErrorReporter::ReportBuilder::attack_vector(const std::string& vector) {
    report_.attack_vector = vector;
    return *this;
}

Result<void> ErrorReporter::ReportBuilder::submit() {
    return reporter_.submit_report(std::move(report_));
}

} // namespace v1
} // namespace sbus
