#include "api/ApiResponse.hpp"

namespace mc::api {

namespace detail {

void require_success_code(int status_code) {
    http::require_valid_status_code(status_code);
    if (!http::is_success(status_code)) {
        throw errors::InvalidStatusCode(
            "Status code does not indicate success, got: " + std::to_string(status_code),
            status_code);
    }
}

void require_error_code(int status_code) {
    http::require_valid_status_code(status_code);
    if (http::is_success(status_code)) {
        throw errors::InvalidStatusCode(
            "Status code indicates success, got: " + std::to_string(status_code),
            status_code);
    }
}

} // namespace detail

ApiResponse<void> ApiResponse<void>::success(int status_code) {
    detail::require_success_code(status_code);
    return ApiResponse(Success{status_code});
}

ApiResponse<void> ApiResponse<void>::error(int status_code, std::string message) {
    detail::require_error_code(status_code);
    return ApiResponse(Error{status_code, std::move(message)});
}

int ApiResponse<void>::status_code() const noexcept {
    return std::visit([](const auto& s) { return s.status_code; }, state_);
}

std::optional<std::string> ApiResponse<void>::error_message() const {
    if (const auto* err = std::get_if<Error>(&state_)) return err->message;
    return std::nullopt;
}

} // namespace mc::api
