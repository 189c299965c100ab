#include "infrastructure/json/ApiResponseJson.hpp"

namespace mc::infrastructure {

namespace detail {

ResponseFields read_response_fields(const json& j, const JsonOptions& options) {
    require_object(j);

    ResponseFields fields;
    for (const auto& item : j.items()) {
        const auto& key = item.key();
        const auto& value = item.value();
        if (options.matches(key, kStatusCode)) {
            fields.status_code = read_int(value, key);
        } else if (options.matches(key, kErrorMessage)) {
            if (!value.is_null()) fields.error_message = read_string(value, key);
        } else if (options.matches(key, kPayload)) {
            if (!value.is_null()) fields.payload = &value;
        } else {
            throw_unknown_property(key);
        }
    }

    if (!fields.status_code) throw_missing_property(options.property_name(kStatusCode));
    if (fields.payload != nullptr && fields.error_message) {
        throw errors::MalformedPayload("Response carries both a payload and an error message");
    }
    return fields;
}

void write_error_message(json& j, const std::string& message, const JsonOptions& options) {
    if (!message.empty()) j[options.property_name(kErrorMessage)] = message;
}

} // namespace detail

json JsonCodec<api::ApiResponse<void>>::write(const api::ApiResponse<void>& value,
                                              const JsonOptions& options) {
    json j = json::object();
    j[options.property_name(detail::kStatusCode)] = value.status_code();
    if (auto message = value.error_message()) {
        detail::write_error_message(j, *message, options);
    }
    return j;
}

api::ApiResponse<void> JsonCodec<api::ApiResponse<void>>::read(const json& j,
                                                               const JsonOptions& options) {
    auto fields = detail::read_response_fields(j, options);
    int status_code = *fields.status_code;

    if (fields.payload != nullptr) {
        detail::throw_unknown_property(options.property_name(detail::kPayload));
    }
    if (api::http::is_success(status_code)) {
        return api::ApiResponse<void>::success(status_code);
    }
    return api::ApiResponse<void>::error(status_code, fields.error_message.value_or(""));
}

} // namespace mc::infrastructure
