#pragma once

namespace mc::api {

enum class HttpStatus : int {
    CONTINUE = 100,
    OK = 200,
    CREATED = 201,
    ACCEPTED = 202,
    NO_CONTENT = 204,
    MOVED_PERMANENTLY = 301,
    FOUND = 302,
    NOT_MODIFIED = 304,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    CONFLICT = 409,
    UNPROCESSABLE_ENTITY = 422,
    TOO_MANY_REQUESTS = 429,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503,
    GATEWAY_TIMEOUT = 504
};

namespace http {

constexpr bool is_valid_status_code(int code) noexcept { return code >= 100 && code < 600; }
constexpr bool is_informational(int code) noexcept { return code >= 100 && code < 200; }
constexpr bool is_success(int code) noexcept { return code >= 200 && code < 300; }
constexpr bool is_redirect(int code) noexcept { return code >= 300 && code < 400; }
constexpr bool is_client_error(int code) noexcept { return code >= 400 && code < 500; }
constexpr bool is_server_error(int code) noexcept { return code >= 500 && code < 600; }

constexpr bool is_unauthorized(int code) noexcept { return code == 401; }
constexpr bool is_forbidden(int code) noexcept { return code == 403; }
constexpr bool is_not_found(int code) noexcept { return code == 404; }
constexpr bool is_internal_server_error(int code) noexcept { return code == 500; }

constexpr int to_int(HttpStatus status) noexcept { return static_cast<int>(status); }

// Any code in 100-599 is accepted, named in HttpStatus or not.
// Throws InvalidStatusCode otherwise.
HttpStatus http_status_from_int(int code);

// Throws InvalidStatusCode when the code is outside 100-599.
void require_valid_status_code(int code);

} // namespace http

} // namespace mc::api
