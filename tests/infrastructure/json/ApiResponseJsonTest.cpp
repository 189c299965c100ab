#include "infrastructure/json/ApiResponseJson.hpp"
#include "infrastructure/json/QuantityJson.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace mc::infrastructure;
using mc::api::ApiResponse;
using mc::domain::Distance;
using mc::errors::InvalidStatusCode;
using mc::errors::MalformedPayload;

class ApiResponseJsonTest : public ::testing::Test {
protected:
    JsonOptions camel = JsonOptions::web();
};

// --- ApiResponse<> ---

TEST_F(ApiResponseJsonTest, BareSuccessHasOnlyStatusCode) {
    EXPECT_EQ(to_json_string(ApiResponse<>::success(201), camel), R"({"statusCode":201})");
}

TEST_F(ApiResponseJsonTest, ErrorWritesStatusCodeThenMessage) {
    EXPECT_EQ(to_json_string(ApiResponse<>::error(404, "not here"), camel),
              R"({"statusCode":404,"errorMessage":"not here"})");
}

TEST_F(ApiResponseJsonTest, ErrorWithoutMessageOmitsIt) {
    EXPECT_EQ(to_json_string(ApiResponse<>::error(500), camel), R"({"statusCode":500})");
}

TEST_F(ApiResponseJsonTest, DefaultOptionsUsePascalCase) {
    EXPECT_EQ(to_json_string(ApiResponse<>::error(400, "bad")),
              R"({"StatusCode":400,"ErrorMessage":"bad"})");
}

TEST_F(ApiResponseJsonTest, ReadsSuccess) {
    auto r = from_json_string<ApiResponse<>>(R"({"statusCode":204})", camel);
    EXPECT_EQ(r, ApiResponse<>::success(204));
}

TEST_F(ApiResponseJsonTest, ReadsError) {
    auto r = from_json_string<ApiResponse<>>(R"({"errorMessage":"x","statusCode":409})", camel);
    EXPECT_EQ(r, ApiResponse<>::error(409, "x"));
}

TEST_F(ApiResponseJsonTest, ErrorWithoutMessageReadsEmpty) {
    auto r = from_json_string<ApiResponse<>>(R"({"statusCode":500,"errorMessage":null})", camel);
    EXPECT_EQ(r.error_message(), "");
}

TEST_F(ApiResponseJsonTest, MissingStatusCodeIsMalformed) {
    EXPECT_THROW(from_json_string<ApiResponse<>>(R"({"errorMessage":"x"})", camel),
                 MalformedPayload);
}

TEST_F(ApiResponseJsonTest, StatusCodeOutsideHttpRangeIsRejected) {
    EXPECT_THROW(from_json_string<ApiResponse<>>(R"({"statusCode":700})", camel),
                 InvalidStatusCode);
}

TEST_F(ApiResponseJsonTest, NonIntegerStatusCodeIsMalformed) {
    EXPECT_THROW(from_json_string<ApiResponse<>>(R"({"statusCode":"200"})", camel),
                 MalformedPayload);
    EXPECT_THROW(from_json_string<ApiResponse<>>(R"({"statusCode":200.5})", camel),
                 MalformedPayload);
}

TEST_F(ApiResponseJsonTest, PlainResponseRejectsPayload) {
    EXPECT_THROW(from_json_string<ApiResponse<>>(R"({"statusCode":200,"payload":1})", camel),
                 MalformedPayload);
}

TEST_F(ApiResponseJsonTest, UnknownPropertyIsMalformed) {
    EXPECT_THROW(from_json_string<ApiResponse<>>(R"({"statusCode":200,"extra":1})", camel),
                 MalformedPayload);
}

// --- ApiResponse<T> ---

TEST_F(ApiResponseJsonTest, GenericSuccessWritesPayload) {
    EXPECT_EQ(to_json_string(ApiResponse<std::string>::success("hello"), camel),
              R"({"statusCode":200,"payload":"hello"})");
}

TEST_F(ApiResponseJsonTest, GenericErrorNeverWritesPayload) {
    auto text = to_json_string(ApiResponse<int>::error(503, "later"), camel);
    EXPECT_EQ(text, R"({"statusCode":503,"errorMessage":"later"})");
}

TEST_F(ApiResponseJsonTest, PayloadUsesItsOwnCodec) {
    auto r = ApiResponse<Distance>::success(Distance::from_kilometers(2), 201);
    auto j = JsonCodec<ApiResponse<Distance>>::write(r, camel);
    EXPECT_EQ(j, json::parse(R"({"statusCode":201,"payload":{"value":2000,"unit":"m"}})"));
}

TEST_F(ApiResponseJsonTest, ReadsGenericSuccess) {
    auto r = from_json_string<ApiResponse<Distance>>(
        R"({"statusCode":200,"payload":{"value":3,"unit":"km"}})", camel);
    ASSERT_TRUE(r.is_success());
    EXPECT_EQ(r.value().meters(), 3000.0);
}

TEST_F(ApiResponseJsonTest, ReadsContainerPayload) {
    auto r = from_json_string<ApiResponse<std::vector<int>>>(
        R"({"statusCode":200,"payload":[1,2,3]})", camel);
    EXPECT_EQ(r.value(), (std::vector<int>{1, 2, 3}));
}

TEST_F(ApiResponseJsonTest, SuccessWithoutPayloadIsMalformed) {
    EXPECT_THROW(from_json_string<ApiResponse<int>>(R"({"statusCode":200})", camel),
                 MalformedPayload);
    EXPECT_THROW(from_json_string<ApiResponse<int>>(R"({"statusCode":200,"payload":null})", camel),
                 MalformedPayload);
}

TEST_F(ApiResponseJsonTest, ErrorWithoutPayloadReads) {
    auto r = from_json_string<ApiResponse<int>>(R"({"statusCode":404})", camel);
    EXPECT_EQ(r, ApiResponse<int>::error(404));
}

TEST_F(ApiResponseJsonTest, PayloadAndMessageTogetherAreMalformed) {
    EXPECT_THROW(from_json_string<ApiResponse<int>>(
                     R"({"statusCode":400,"payload":1,"errorMessage":"x"})", camel),
                 MalformedPayload);
}

TEST_F(ApiResponseJsonTest, MismatchedPayloadTypeIsMalformed) {
    EXPECT_THROW(from_json_string<ApiResponse<int>>(R"({"statusCode":200,"payload":"one"})", camel),
                 MalformedPayload);
}

TEST_F(ApiResponseJsonTest, GenericRoundTrip) {
    auto r = ApiResponse<Distance>::success(Distance::from_miles(1), 202);
    EXPECT_EQ(from_json_string<ApiResponse<Distance>>(to_json_string(r, camel), camel), r);

    auto e = ApiResponse<Distance>::error(422, "invalid");
    EXPECT_EQ(from_json_string<ApiResponse<Distance>>(to_json_string(e, camel), camel), e);
}
