#ifndef SBUS_ERROR_REPORTER_H
#define SBUS_ERROR_REPORTER_H

#include <sbus/config.h>
#include <sbus/error.h>
#include <sbus/result.h>
#include <sbus/clock.h>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sbus {
namespace v1 {

/**
 * ErrorReporter is the diagnostic and audit log of the secure bus.
 *
 * 1. Never logs key material, plaintext or token values
 * 2. Optionally anonymizes peer identities (hashed)
 * 3. Structured output (human readable or JSON) for security analysis
 * 4. Per-second and per-minute budgets against log flooding; security
 *    incidents bypass the budget
 */
class SBUS_API ErrorReporter {
public:
    enum class LogLevel {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL,
        SECURITY
    };

    enum class OutputFormat {
        HUMAN_READABLE,
        JSON
    };

    struct ReportingConfig {
        LogLevel minimum_level = LogLevel::WARNING;
        OutputFormat format = OutputFormat::HUMAN_READABLE;

        bool anonymize_identities = true;

        uint32_t max_reports_per_second = 100;
        uint32_t max_reports_per_minute = 1000;
        size_t max_message_size = 1024;

        // Writes to std::cerr when no sink is installed
        bool write_to_stderr = true;
    };

    struct ErrorReport {
        LogLevel level;
        SBusError error_code;
        std::string category;
        std::string message;
        std::string component;
        std::string identity;
        Timestamp timestamp{0};

        std::map<std::string, std::string> metadata;

        bool is_security_incident = false;
        double threat_confidence = 0.0;
        std::string attack_vector;

        ErrorReport(LogLevel lvl, SBusError error, std::string msg)
            : level(lvl), error_code(error), message(std::move(msg)) {}
    };

    using ReporterCallback = std::function<void(const ErrorReport&, const std::string& formatted)>;

    explicit ErrorReporter(std::shared_ptr<Clock> clock = make_steady_clock());
    ErrorReporter(const ReportingConfig& config, std::shared_ptr<Clock> clock = make_steady_clock());
    ~ErrorReporter();

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    /**
     * Report an error.
     * @param level Log level
     * @param error Error code being reported
     * @param category Subsystem, e.g. "record", "handshake"
     * @param message Description without sensitive data
     * @return RATE_LIMITED when the report budget is spent
     */
    Result<void> report_error(LogLevel level,
                              SBusError error,
                              const std::string& category,
                              const std::string& message);

    /**
     * Report a security incident. Always recorded, never budgeted.
     */
    Result<void> report_security_incident(SBusError error,
                                          const std::string& incident_type,
                                          double confidence,
                                          const std::string& identity = "");

    class ReportBuilder;
    ReportBuilder create_report(LogLevel level, SBusError error);

    Result<void> submit_report(ErrorReport report);

    Result<void> update_configuration(const ReportingConfig& config);
    ReportingConfig get_configuration() const;

    void add_reporter_callback(ReporterCallback callback);
    void clear_reporter_callbacks();

    struct ReportingStatistics {
        uint64_t total_reports = 0;
        uint64_t reports_by_level[6] = {0, 0, 0, 0, 0, 0};
        uint64_t security_incidents = 0;
        uint64_t rate_limited_reports = 0;
        uint64_t filtered_reports = 0;
        uint64_t bytes_logged = 0;
    };

    ReportingStatistics get_statistics() const;
    void reset_statistics();

    static std::string log_level_to_string(LogLevel level);
    static std::string anonymize_identity(const std::string& identity);

private:
    bool consume_budget();
    Result<void> write_report(const ErrorReport& report);
    std::string format_report(const ErrorReport& report, const ReportingConfig& config) const;
    static std::string escape_json(const std::string& input);

    ReportingConfig config_;
    mutable std::mutex config_mutex_;

    std::shared_ptr<Clock> clock_;

    std::vector<ReporterCallback> callbacks_;
    mutable std::mutex callbacks_mutex_;

    ReportingStatistics stats_;
    mutable std::mutex stats_mutex_;

    struct BudgetState {
        uint32_t reports_this_second = 0;
        uint32_t reports_this_minute = 0;
        Timestamp second_start{0};
        Timestamp minute_start{0};
    };
    BudgetState budget_;
    std::mutex budget_mutex_;

    std::mutex output_mutex_;
};

/**
 * Fluent construction of structured reports.
 */
class SBUS_API ErrorReporter::ReportBuilder {
public:
    ReportBuilder(ErrorReporter& reporter, LogLevel level, SBusError error);

    ReportBuilder& category(const std::string& cat);
    ReportBuilder& message(const std::string& msg);
    ReportBuilder& component(const std::string& comp);
    ReportBuilder& identity(const std::string& id);
    ReportBuilder& metadata(const std::string& key, const std::string& value);
    ReportBuilder& security_incident(bool is_incident = true);
    ReportBuilder& threat_confidence(double confidence);
    ReportBuilder& attack_vector(const std::string& vector);

    Result<void> submit();

private:
    ErrorReporter& reporter_;
    ErrorReport report_;
};

#define SBUS_REPORT_ERROR(reporter, level, error, message) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_error((level), (error), __FUNCTION__, (message)); \
        } \
    } while (0)

#define SBUS_REPORT_SECURITY(reporter, error, incident_type, confidence) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_security_incident((error), (incident_type), (confidence)); \
        } \
    } while (0)

#define SBUS_REPORT_DEBUG(reporter, error, message) \
    SBUS_REPORT_ERROR(reporter, ::sbus::v1::ErrorReporter::LogLevel::DEBUG, error, message)

#define SBUS_REPORT_WARNING(reporter, error, message) \
    SBUS_REPORT_ERROR(reporter, ::sbus::v1::ErrorReporter::LogLevel::WARNING, error, message)

} // namespace v1
} // namespace sbus

#endif // SBUS_ERROR_REPORTER_H
