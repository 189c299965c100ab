#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace mc::errors {

// Unrecognized unit string, or a unit enumerator outside its enum.
class InvalidUnit : public std::invalid_argument {
public:
    InvalidUnit(const std::string& what, std::string unit)
        : std::invalid_argument(what), unit_(std::move(unit)) {}

    const std::string& unit() const noexcept { return unit_; }

private:
    std::string unit_;
};

class InvalidStatusCode : public std::out_of_range {
public:
    InvalidStatusCode(const std::string& what, int status_code)
        : std::out_of_range(what), status_code_(status_code) {}

    int status_code() const noexcept { return status_code_; }

private:
    int status_code_;
};

// A required payload, handler or converter was empty.
class MissingArgument : public std::invalid_argument {
public:
    explicit MissingArgument(std::string argument)
        : std::invalid_argument("Missing required argument: " + argument),
          argument_(std::move(argument)) {}

    const std::string& argument() const noexcept { return argument_; }

private:
    std::string argument_;
};

class MalformedPayload : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FormatError : public std::runtime_error {
public:
    FormatError(const std::string& what, std::string format)
        : std::runtime_error(what), format_(std::move(format)) {}

    const std::string& format() const noexcept { return format_; }

private:
    std::string format_;
};

} // namespace mc::errors
