#include "api/HttpStatus.hpp"

#include "errors/Errors.hpp"

#include <string>

namespace mc::api::http {

void require_valid_status_code(int code) {
    if (!is_valid_status_code(code)) {
        throw errors::InvalidStatusCode(
            "Status code is not a valid HTTP status code, got: " + std::to_string(code), code);
    }
}

HttpStatus http_status_from_int(int code) {
    require_valid_status_code(code);
    return static_cast<HttpStatus>(code);
}

} // namespace mc::api::http
