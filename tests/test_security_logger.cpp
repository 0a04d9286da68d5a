#include <gtest/gtest.h>
#include "security_logger.hpp"
#include <vector>

using namespace auvctl;

class SecurityLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SecurityLogger::set_sink([this](const SecurityLogger::AuditEvent& e) { events.push_back(e); });
    }
    void TearDown() override {
        SecurityLogger::set_sink(nullptr);
    }

    std::vector<SecurityLogger::AuditEvent> events;
};

TEST(SecurityLoggerSanitizeTest, StripsQuotesNewlinesAndControlBytes) {
    EXPECT_EQ(SecurityLogger::sanitize_log_message("Malicious \" quote and \n newline"),
              "Malicious   quote and   newline");
    EXPECT_EQ(SecurityLogger::sanitize_log_message(std::string("a\x01\x7f" "b")), "ab");
    EXPECT_EQ(SecurityLogger::sanitize_log_message("back\\slash"), "back slash");
}

TEST_F(SecurityLoggerTest, EventsReachSinkSanitized) {
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::XSS,
                        "1.2.3.4", "GET /x?q=\"<script>\"\r\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].level, SecurityLogger::Level::WARNING);
    EXPECT_EQ(events[0].category, SecurityLogger::EventType::XSS);
    EXPECT_EQ(events[0].request_summary.find('"'), std::string::npos);
    EXPECT_EQ(events[0].request_summary.find('\n'), std::string::npos);
}

TEST_F(SecurityLoggerTest, AddressesAreBlindedConsistently) {
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::INVALID_INPUT, "1.2.3.4");
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::INVALID_INPUT, "1.2.3.4");
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::INVALID_INPUT, "5.6.7.8");
    ASSERT_EQ(events.size(), 3u);

    EXPECT_EQ(events[0].client_address.rfind("anon_", 0), 0u);
    EXPECT_EQ(events[0].client_address.size(), 5u + 12u);
    EXPECT_EQ(events[0].client_address, events[1].client_address);
    EXPECT_NE(events[0].client_address, events[2].client_address);
}

TEST_F(SecurityLoggerTest, InternalAndUnknownAreNotBlinded) {
    SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::INTERNAL_ERROR, "internal", "x");
    SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::CONNECTION_REJECTED, "unknown");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].client_address, "internal");
    EXPECT_EQ(events[1].client_address, "unknown");
}

TEST(SecurityLoggerFormatTest, LineLayout) {
    SecurityLogger::AuditEvent e{std::chrono::system_clock::from_time_t(0), SecurityLogger::Level::WARNING,
                                 SecurityLogger::EventType::RATE_LIMIT, "anon_0123456789ab", "GET /status"};
    EXPECT_EQ(SecurityLogger::format(e),
              "[1970-01-01 00:00:00 UTC] [WARN] [RATE_LIMIT] ip=anon_0123456789ab msg=\"GET /status\"");
}

TEST(SecurityLoggerFormatTest, CategoryNames) {
    EXPECT_STREQ(SecurityLogger::category_name(SecurityLogger::EventType::SQL_INJECTION), "sql_injection");
    EXPECT_STREQ(SecurityLogger::category_name(SecurityLogger::EventType::FORBIDDEN_HEADER), "forbidden_header");
    EXPECT_STREQ(SecurityLogger::category_name(SecurityLogger::EventType::INTERNAL_ERROR), "internal_error");
}

TEST(SecurityLoggerConsoleTest, WritesWithoutSink) {
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "127.0.0.1", "Normal message");
    SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::INTERNAL_ERROR, "1.2.3.4", "Malicious \" quote and \n newline");
    SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::CONNECTION_REJECTED, "unknown", "No IP");
    SUCCEED();
}
