#include <gtest/gtest.h>
#include <sbus/error_reporter.h>
#include <memory>
#include <string>
#include <vector>

using namespace sbus::v1;

class ErrorReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(Timestamp{1000000});
        config_.write_to_stderr = false;
        config_.minimum_level = ErrorReporter::LogLevel::INFO;
        config_.max_reports_per_second = 3;
        reporter_ = std::make_shared<ErrorReporter>(config_, clock_);
        reporter_->add_reporter_callback([this](const ErrorReporter::ErrorReport& report, const std::string& line) {
            reports_.push_back(report.message);
            lines_.push_back(line);
        });
    }

    std::shared_ptr<ManualClock> clock_;
    ErrorReporter::ReportingConfig config_;
    std::shared_ptr<ErrorReporter> reporter_;
    std::vector<std::string> reports_;
    std::vector<std::string> lines_;
};

TEST_F(ErrorReporterTest, FiltersBelowMinimumLevel) {
    EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::DEBUG, SBusError::QUEUE_EMPTY,
                                        "routing", "queue drained").is_success());
    EXPECT_TRUE(reports_.empty());
    EXPECT_EQ(reporter_->get_statistics().filtered_reports, 1u);

    EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::WARNING, SBusError::QUEUE_FULL,
                                        "routing", "node queue full").is_success());
    ASSERT_EQ(reports_.size(), 1u);
    EXPECT_EQ(reports_[0], "node queue full");
    EXPECT_NE(lines_[0].find("[routing]"), std::string::npos);
}

TEST_F(ErrorReporterTest, BudgetLimitsOrdinaryReports) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::ERROR, SBusError::DECRYPT_ERROR,
                                            "record", "bad record").is_success());
    }
    auto limited = reporter_->report_error(ErrorReporter::LogLevel::ERROR, SBusError::DECRYPT_ERROR,
                                           "record", "bad record");
    EXPECT_EQ(limited.error(), SBusError::RATE_LIMITED);

    // Security incidents bypass the budget
    EXPECT_TRUE(reporter_->report_security_incident(SBusError::TAMPERED_PAYLOAD, "tampering", 0.9).is_success());
    EXPECT_EQ(reporter_->get_statistics().security_incidents, 1u);

    clock_->advance(std::chrono::seconds(1));
    EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::ERROR, SBusError::DECRYPT_ERROR,
                                        "record", "bad record").is_success());
}

TEST_F(ErrorReporterTest, AnonymizesIdentities) {
    EXPECT_TRUE(reporter_->report_security_incident(SBusError::INVALID_TOKEN, "token_probe", 0.7,
                                                    "attacker-node").is_success());
    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].find("attacker-node"), std::string::npos);
    EXPECT_EQ(ErrorReporter::anonymize_identity("attacker-node"),
              ErrorReporter::anonymize_identity("attacker-node"));
}

TEST_F(ErrorReporterTest, JsonFormatAndBuilder) {
    config_.format = ErrorReporter::OutputFormat::JSON;
    ASSERT_TRUE(reporter_->update_configuration(config_).is_success());

    auto submitted = reporter_->create_report(ErrorReporter::LogLevel::ERROR, SBusError::QUEUE_FULL)
                         .category("device")
                         .message("request queue \"full\"")
                         .metadata("capacity", "64")
                         .submit();
    ASSERT_TRUE(submitted.is_success());
    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].front(), '{');
    EXPECT_NE(lines_[0].find("\"category\":\"device\""), std::string::npos);
    EXPECT_NE(lines_[0].find("\\\"full\\\""), std::string::npos);
    EXPECT_NE(lines_[0].find("\"capacity\":\"64\""), std::string::npos);
}

TEST_F(ErrorReporterTest, RejectsZeroBudgets) {
    config_.max_reports_per_minute = 0;
    EXPECT_EQ(reporter_->update_configuration(config_).error(), SBusError::INVALID_CONFIGURATION);
}

TEST_F(ErrorReporterTest, MacrosTolerateNullReporter) {
    std::shared_ptr<ErrorReporter> none;
    SBUS_REPORT_WARNING(none, SBusError::INTERNAL_ERROR, "ignored");
    SBUS_REPORT_WARNING(reporter_, SBusError::INTERNAL_ERROR, "macro report");
    ASSERT_EQ(reports_.size(), 1u);
    EXPECT_EQ(reports_[0], "macro report");
}
