#include <gtest/gtest.h>
#include "input_validator.hpp"
#include <string>

using namespace auvctl;

TEST(InputValidatorTest, WithinSizeLimit) {
    EXPECT_TRUE(InputValidator::is_within_size_limit(100, 200));
    EXPECT_TRUE(InputValidator::is_within_size_limit(200, 200));
    EXPECT_FALSE(InputValidator::is_within_size_limit(201, 200));
}

TEST(InputValidatorTest, SafeParseJson) {
    std::string json_str = "{\"value\": 12, \"unit\": \"deg\"}";
    auto val = InputValidator::safe_parse_json(json_str);
    EXPECT_TRUE(val.is_object());
    EXPECT_EQ(val.as_object()["unit"].as_string(), "deg");
    EXPECT_EQ(val.as_object()["value"].as_int64(), 12);
}

TEST(InputValidatorTest, SafeParseJsonInvalid) {
    EXPECT_THROW(InputValidator::safe_parse_json("{invalid}"), boost::system::system_error);
}

TEST(InputValidatorTest, SafeParseJsonDepthLimit) {
    std::string deep = std::string(20, '[') + std::string(20, ']');
    EXPECT_THROW(InputValidator::safe_parse_json(deep, 8), boost::system::system_error);
    EXPECT_NO_THROW(InputValidator::safe_parse_json("[[[1]]]", 8));
}

TEST(InputValidatorTest, ControlValueAcceptsNumbers) {
    EXPECT_EQ(InputValidator::parse_control_value("{\"value\": 15}"), 15.0);
    EXPECT_EQ(InputValidator::parse_control_value("{\"value\": -30}"), -30.0);
    EXPECT_EQ(InputValidator::parse_control_value("{\"value\": 12.5}"), 12.5);
    EXPECT_EQ(InputValidator::parse_control_value("{\"value\": 18446744073709551615}"), 18446744073709551615.0);
    EXPECT_EQ(InputValidator::parse_control_value("{\"value\": 1, \"extra\": \"ignored\"}"), 1.0);
}

TEST(InputValidatorTest, ControlValueRejectsNonNumbers) {
    for (const char* body : {"{\"value\": \"15\"}", "{\"value\": true}", "{\"value\": null}",
                             "{\"value\": [1]}", "{\"value\": {}}", "{}", "[15]", "15"}) {
        try {
            InputValidator::parse_control_value(body);
            ADD_FAILURE() << "accepted " << body;
        } catch (const ValidationError& e) {
            EXPECT_STREQ(e.what(), "value must be a number") << body;
        }
    }
}

TEST(InputValidatorTest, ControlValueRejectsMalformedJson) {
    for (const char* body : {"", "{", "{\"value\": }", "value=10"}) {
        try {
            InputValidator::parse_control_value(body);
            ADD_FAILURE() << "accepted " << body;
        } catch (const ValidationError& e) {
            EXPECT_STREQ(e.what(), "invalid JSON body") << body;
        }
    }
}
