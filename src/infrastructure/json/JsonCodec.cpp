#include "infrastructure/json/JsonCodec.hpp"

#include <limits>

namespace mc::infrastructure {

namespace detail {

void require_object(const json& j) {
    if (!j.is_object()) {
        throw errors::MalformedPayload("Expected start of object, got: " + std::string(j.type_name()));
    }
}

void throw_unknown_property(const std::string& name) {
    throw errors::MalformedPayload("Unknown property: " + name);
}

void throw_missing_property(const std::string& name) {
    throw errors::MalformedPayload("Missing property: " + name);
}

double read_number(const json& j, const std::string& property) {
    if (!j.is_number()) {
        throw errors::MalformedPayload("Expected number for property: " + property);
    }
    return j.get<double>();
}

int read_int(const json& j, const std::string& property) {
    if (!j.is_number_integer()) {
        throw errors::MalformedPayload("Expected integer for property: " + property);
    }
    auto value = j.get<long long>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw errors::MalformedPayload("Integer out of range for property: " + property);
    }
    return static_cast<int>(value);
}

std::string read_string(const json& j, const std::string& property) {
    if (!j.is_string()) {
        throw errors::MalformedPayload("Expected string for property: " + property);
    }
    return j.get<std::string>();
}

} // namespace detail

json parse_json(std::string_view text) {
    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw errors::MalformedPayload("Malformed or unexpectedly ended JSON input");
    }
    return parsed;
}

} // namespace mc::infrastructure
