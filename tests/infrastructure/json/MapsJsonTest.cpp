#include "infrastructure/json/MapsJson.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace mc::domain;
using namespace mc::infrastructure;
using mc::errors::MalformedPayload;

TEST(GeoCoordinateJson, WritesLatitudeAndLongitude) {
    auto j = JsonCodec<GeoCoordinate>::write(GeoCoordinate(12.5, -3.25), JsonOptions::web());
    EXPECT_EQ(j, json::parse(R"({"latitude":12.5,"longitude":-3.25})"));
}

TEST(GeoCoordinateJson, UnknownComponentsAreWrittenAsNull) {
    auto j = JsonCodec<GeoCoordinate>::write(GeoCoordinate::unknown(), JsonOptions::web());
    EXPECT_TRUE(j["latitude"].is_null());
    EXPECT_TRUE(j["longitude"].is_null());
}

TEST(GeoCoordinateJson, NullReadsBackAsUnknown) {
    auto c = from_json_string<GeoCoordinate>(R"({"latitude":null,"longitude":null})",
                                             JsonOptions::web());
    EXPECT_TRUE(c.is_unknown());
}

TEST(GeoCoordinateJson, MissingComponentReadsAsZero) {
    auto c = from_json_string<GeoCoordinate>(R"({"latitude":10})", JsonOptions::web());
    EXPECT_DOUBLE_EQ(c.latitude(), 10.0);
    EXPECT_DOUBLE_EQ(c.longitude(), 0.0);
}

TEST(GeoCoordinateJson, OutOfRangeIsMalformed) {
    EXPECT_THROW(from_json_string<GeoCoordinate>(R"({"latitude":91,"longitude":0})",
                                                 JsonOptions::web()),
                 MalformedPayload);
}

TEST(GeoCoordinateJson, UnknownPropertyIsMalformed) {
    EXPECT_THROW(from_json_string<GeoCoordinate>(R"({"lat":1})", JsonOptions::web()),
                 MalformedPayload);
}

TEST(GeoCoordinateJson, RoundTrips) {
    GeoCoordinate c(47.6062, -122.3321);
    EXPECT_EQ(from_json_string<GeoCoordinate>(to_json_string(c)), c);
}

TEST(AddressJson, WritesAllSixFields) {
    Address a{"1 Main St", "", "Springfield", "12345", "IL", "US"};
    auto j = JsonCodec<Address>::write(a, JsonOptions::web());
    EXPECT_EQ(j, json::parse(R"({
        "addressLine1": "1 Main St",
        "addressLine2": "",
        "city": "Springfield",
        "postalCode": "12345",
        "stateOrProvince": "IL",
        "country": "US"
    })"));
}

TEST(AddressJson, MissingOrNullFieldsReadAsEmpty) {
    auto a = from_json_string<Address>(R"({"city":"Oslo","country":null})", JsonOptions::web());
    EXPECT_EQ(a.city, "Oslo");
    EXPECT_EQ(a.country, "");
    EXPECT_EQ(a.address_line1, "");
}

TEST(AddressJson, SnakeCasePolicyRenamesFields) {
    JsonOptions snake{NamingPolicy::SNAKE_CASE_LOWER, false};
    Address a;
    a.state_or_province = "ON";
    auto j = JsonCodec<Address>::write(a, snake);
    EXPECT_EQ(j["state_or_province"], "ON");
    EXPECT_EQ(from_json_string<Address>(j.dump(), snake), a);
}

TEST(AddressJson, UnknownPropertyIsMalformed) {
    EXPECT_THROW(from_json_string<Address>(R"({"street":"x"})", JsonOptions::web()),
                 MalformedPayload);
}
