#include "infrastructure/json/JsonOptions.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace mc::infrastructure;

TEST(JsonOptions, DefaultKeepsDeclaredNamesCaseSensitive) {
    JsonOptions options;
    EXPECT_EQ(options.naming_policy, NamingPolicy::NONE);
    EXPECT_FALSE(options.property_name_case_insensitive);
    EXPECT_EQ(options.property_name("StatusCode"), "StatusCode");
}

TEST(JsonOptions, WebIsCamelCaseInsensitive) {
    auto options = JsonOptions::web();
    EXPECT_EQ(options.naming_policy, NamingPolicy::CAMEL_CASE);
    EXPECT_TRUE(options.property_name_case_insensitive);
}

TEST(JsonOptions, ConvertsToEachPolicy) {
    EXPECT_EQ(convert_name("StatusCode", NamingPolicy::NONE), "StatusCode");
    EXPECT_EQ(convert_name("StatusCode", NamingPolicy::CAMEL_CASE), "statusCode");
    EXPECT_EQ(convert_name("StatusCode", NamingPolicy::SNAKE_CASE_LOWER), "status_code");
    EXPECT_EQ(convert_name("StatusCode", NamingPolicy::SNAKE_CASE_UPPER), "STATUS_CODE");
    EXPECT_EQ(convert_name("StatusCode", NamingPolicy::KEBAB_CASE_LOWER), "status-code");
    EXPECT_EQ(convert_name("StatusCode", NamingPolicy::KEBAB_CASE_UPPER), "STATUS-CODE");
}

TEST(JsonOptions, CamelCaseLowersLeadingAcronym) {
    EXPECT_EQ(convert_name("URLValue", NamingPolicy::CAMEL_CASE), "urlValue");
    EXPECT_EQ(convert_name("Value", NamingPolicy::CAMEL_CASE), "value");
    EXPECT_EQ(convert_name("value", NamingPolicy::CAMEL_CASE), "value");
}

TEST(JsonOptions, SeparatedFormsSplitAcronymsAndDigits) {
    EXPECT_EQ(convert_name("URLValue", NamingPolicy::SNAKE_CASE_LOWER), "url_value");
    EXPECT_EQ(convert_name("AddressLine1", NamingPolicy::SNAKE_CASE_LOWER), "address_line1");
    EXPECT_EQ(convert_name("StateOrProvince", NamingPolicy::KEBAB_CASE_LOWER), "state-or-province");
}

TEST(JsonOptions, MatchesCaseSensitively) {
    JsonOptions options{NamingPolicy::CAMEL_CASE, false};
    EXPECT_TRUE(options.matches("statusCode", "StatusCode"));
    EXPECT_FALSE(options.matches("StatusCode", "StatusCode"));
}

TEST(JsonOptions, MatchesCaseInsensitively) {
    auto options = JsonOptions::web();
    EXPECT_TRUE(options.matches("STATUSCODE", "StatusCode"));
    EXPECT_FALSE(options.matches("status_code", "StatusCode"));
}

TEST(JsonOptions, ParsesPolicyNames) {
    EXPECT_EQ(naming_policy_from_string("camelCase"), NamingPolicy::CAMEL_CASE);
    EXPECT_EQ(naming_policy_from_string("snake_case"), NamingPolicy::SNAKE_CASE_LOWER);
    EXPECT_EQ(naming_policy_from_string("KEBAB-CASE"), NamingPolicy::KEBAB_CASE_UPPER);
    EXPECT_EQ(naming_policy_from_string("none"), NamingPolicy::NONE);
    EXPECT_THROW(naming_policy_from_string("PascalCase"), std::invalid_argument);
}

TEST(JsonOptions, PolicyNamesRoundTrip) {
    for (auto policy : {NamingPolicy::NONE, NamingPolicy::CAMEL_CASE, NamingPolicy::SNAKE_CASE_LOWER,
                        NamingPolicy::SNAKE_CASE_UPPER, NamingPolicy::KEBAB_CASE_LOWER,
                        NamingPolicy::KEBAB_CASE_UPPER}) {
        EXPECT_EQ(naming_policy_from_string(to_string(policy)), policy);
    }
}
