#pragma once

#include "api/HttpStatus.hpp"
#include "errors/Errors.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mc::api {

namespace detail {

// Which payload and handler types can be "absent".
template <typename T>
struct Nullable {
    static bool is_null(const T&) noexcept { return false; }
};

template <typename T>
struct Nullable<T*> {
    static bool is_null(T* p) noexcept { return p == nullptr; }
};

template <typename T>
struct Nullable<std::shared_ptr<T>> {
    static bool is_null(const std::shared_ptr<T>& p) noexcept { return !p; }
};

template <typename T, typename D>
struct Nullable<std::unique_ptr<T, D>> {
    static bool is_null(const std::unique_ptr<T, D>& p) noexcept { return !p; }
};

template <typename T>
struct Nullable<std::optional<T>> {
    static bool is_null(const std::optional<T>& o) noexcept { return !o.has_value(); }
};

template <typename Signature>
struct Nullable<std::function<Signature>> {
    static bool is_null(const std::function<Signature>& f) noexcept { return !f; }
};

template <typename T>
bool is_null(const T& value) noexcept {
    return Nullable<std::remove_cvref_t<T>>::is_null(value);
}

template <typename F>
void require_present(const F& f, const char* argument) {
    if (is_null(f)) throw errors::MissingArgument(argument);
}

// Both check the 100-599 range first, then the success range.
void require_success_code(int status_code);
void require_error_code(int status_code);

} // namespace detail

// Success-or-error result of an API call. T is the success payload;
// ApiResponse<> (T = void) carries none. Instances only come from the
// success()/error() factories, so a success always has a 2xx code (and a
// payload) and an error never does.
template <typename T = void>
class ApiResponse;

template <>
class ApiResponse<void> {
public:
    static ApiResponse success(int status_code = 200);
    static ApiResponse success(HttpStatus status) { return success(http::to_int(status)); }
    static ApiResponse error(int status_code, std::string message = {});
    static ApiResponse error(HttpStatus status, std::string message = {}) {
        return error(http::to_int(status), std::move(message));
    }
    static ApiResponse from_exception(const std::exception& e, int status_code = 500) {
        return error(status_code, e.what());
    }

    int status_code() const noexcept;
    bool is_success() const noexcept { return std::holds_alternative<Success>(state_); }
    std::optional<std::string> error_message() const;

    // on_success(status_code) or on_error(status_code, message). Empty
    // handlers are rejected before either is called.
    template <typename OnSuccess, typename OnError>
    auto match(OnSuccess&& on_success, OnError&& on_error) const
        -> std::invoke_result_t<OnSuccess&, int> {
        detail::require_present(on_success, "on_success");
        detail::require_present(on_error, "on_error");
        if (const auto* ok = std::get_if<Success>(&state_)) {
            return std::invoke(on_success, ok->status_code);
        }
        const auto& err = std::get<Error>(state_);
        return std::invoke(on_error, err.status_code, err.message);
    }

    bool operator==(const ApiResponse&) const = default;

private:
    struct Success {
        int status_code;
        bool operator==(const Success&) const = default;
    };
    struct Error {
        int status_code;
        std::string message;
        bool operator==(const Error&) const = default;
    };

    explicit ApiResponse(std::variant<Success, Error> state) : state_(std::move(state)) {}

    std::variant<Success, Error> state_;
};

template <typename T>
class ApiResponse {
public:
    using payload_type = T;

    // Throws MissingArgument for an empty payload (null pointer, empty
    // optional) and InvalidStatusCode for a non-2xx code.
    static ApiResponse success(T payload, int status_code = 200) {
        detail::require_present(payload, "payload");
        detail::require_success_code(status_code);
        return ApiResponse(Success{status_code, std::move(payload)});
    }

    static ApiResponse success(T payload, HttpStatus status) {
        return success(std::move(payload), http::to_int(status));
    }

    static ApiResponse error(int status_code, std::string message = {}) {
        detail::require_error_code(status_code);
        return ApiResponse(Error{status_code, std::move(message)});
    }

    static ApiResponse error(HttpStatus status, std::string message = {}) {
        return error(http::to_int(status), std::move(message));
    }

    static ApiResponse from_exception(const std::exception& e, int status_code = 500) {
        return error(status_code, e.what());
    }

    int status_code() const noexcept {
        return std::visit([](const auto& s) { return s.status_code; }, state_);
    }

    bool is_success() const noexcept { return std::holds_alternative<Success>(state_); }

    std::optional<std::string> error_message() const {
        if (const auto* err = std::get_if<Error>(&state_)) return err->message;
        return std::nullopt;
    }

    const T& value() const {
        if (const auto* ok = std::get_if<Success>(&state_)) return ok->payload;
        throw std::runtime_error(
            "Response has no payload, status code: " + std::to_string(status_code()));
    }

    // on_success(payload, status_code) or on_error(status_code, message).
    template <typename OnSuccess, typename OnError>
    auto match(OnSuccess&& on_success, OnError&& on_error) const
        -> std::invoke_result_t<OnSuccess&, const T&, int> {
        detail::require_present(on_success, "on_success");
        detail::require_present(on_error, "on_error");
        if (const auto* ok = std::get_if<Success>(&state_)) {
            return std::invoke(on_success, ok->payload, ok->status_code);
        }
        const auto& err = std::get<Error>(state_);
        return std::invoke(on_error, err.status_code, err.message);
    }

    // Maps the payload, keeping the status code. Errors pass through and the
    // converter is not called for them.
    template <typename Converter>
    auto into(Converter&& converter) const
        -> ApiResponse<std::remove_cvref_t<std::invoke_result_t<Converter&, const T&>>> {
        using Result = std::remove_cvref_t<std::invoke_result_t<Converter&, const T&>>;
        detail::require_present(converter, "payload_converter");
        if (const auto* ok = std::get_if<Success>(&state_)) {
            return ApiResponse<Result>::success(std::invoke(converter, ok->payload),
                                                ok->status_code);
        }
        const auto& err = std::get<Error>(state_);
        return ApiResponse<Result>::error(err.status_code, err.message);
    }

    bool operator==(const ApiResponse&) const = default;

private:
    struct Success {
        int status_code;
        T payload;
        bool operator==(const Success&) const = default;
    };
    struct Error {
        int status_code;
        std::string message;
        bool operator==(const Error&) const = default;
    };

    explicit ApiResponse(std::variant<Success, Error> state) : state_(std::move(state)) {}

    std::variant<Success, Error> state_;
};

} // namespace mc::api
