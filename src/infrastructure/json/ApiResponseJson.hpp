#pragma once

#include "api/ApiResponse.hpp"
#include "infrastructure/json/JsonCodec.hpp"

#include <optional>
#include <string>

namespace mc::infrastructure {

namespace detail {

constexpr const char* kStatusCode = "StatusCode";
constexpr const char* kErrorMessage = "ErrorMessage";
constexpr const char* kPayload = "Payload";

// Envelope fields as read off the wire, before the response is rebuilt.
// Null payloads and messages count as absent.
struct ResponseFields {
    std::optional<int> status_code;
    std::optional<std::string> error_message;
    const json* payload = nullptr;
};

// Throws MalformedPayload for a non-object, an unknown property, a missing
// status code, or an object carrying both a payload and an error message.
ResponseFields read_response_fields(const json& j, const JsonOptions& options);

void write_error_message(json& j, const std::string& message, const JsonOptions& options);

} // namespace detail

// {"StatusCode": 200} or {"StatusCode": 404, "ErrorMessage": "..."}.
// An empty error message is left out and reads back as "".
template <>
struct JsonCodec<api::ApiResponse<void>> {
    static json write(const api::ApiResponse<void>& value, const JsonOptions& options);
    static api::ApiResponse<void> read(const json& j, const JsonOptions& options);
};

// {"StatusCode": 200, "Payload": <T>} or the error form above. The payload
// goes through JsonCodec<T>. A success code without a payload is malformed.
template <typename T>
struct JsonCodec<api::ApiResponse<T>> {
    static json write(const api::ApiResponse<T>& value, const JsonOptions& options) {
        json j = json::object();
        value.match(
            [&](const T& payload, int status_code) {
                j[options.property_name(detail::kStatusCode)] = status_code;
                j[options.property_name(detail::kPayload)] = JsonCodec<T>::write(payload, options);
            },
            [&](int status_code, const std::string& message) {
                j[options.property_name(detail::kStatusCode)] = status_code;
                detail::write_error_message(j, message, options);
            });
        return j;
    }

    static api::ApiResponse<T> read(const json& j, const JsonOptions& options) {
        auto fields = detail::read_response_fields(j, options);
        int status_code = *fields.status_code;

        if (api::http::is_success(status_code)) {
            if (fields.payload == nullptr) {
                detail::throw_missing_property(options.property_name(detail::kPayload));
            }
            return api::ApiResponse<T>::success(JsonCodec<T>::read(*fields.payload, options),
                                                status_code);
        }
        return api::ApiResponse<T>::error(status_code, fields.error_message.value_or(""));
    }
};

} // namespace mc::infrastructure
