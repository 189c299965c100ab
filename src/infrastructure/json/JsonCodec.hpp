#pragma once

#include "errors/Errors.hpp"
#include "infrastructure/json/JsonOptions.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mc::infrastructure {

// Insertion-ordered so objects come out in the order they were written.
using json = nlohmann::ordered_json;

// Compile-time codec registry: one specialization per type with a custom
// wire shape. The primary template falls back to nlohmann's own
// to_json/from_json, which covers numbers, strings and standard containers.
template <typename T>
struct JsonCodec {
    static json write(const T& value, const JsonOptions&) { return json(value); }

    static T read(const json& j, const JsonOptions&) {
        try {
            return j.template get<T>();
        } catch (const json::exception& e) {
            throw errors::MalformedPayload(e.what());
        }
    }
};

namespace detail {

// Throws MalformedPayload unless j is an object.
void require_object(const json& j);
[[noreturn]] void throw_unknown_property(const std::string& name);
[[noreturn]] void throw_missing_property(const std::string& name);

double read_number(const json& j, const std::string& property);
int read_int(const json& j, const std::string& property);
std::string read_string(const json& j, const std::string& property);

} // namespace detail

// Parses text into a DOM. Truncated or otherwise invalid input throws
// MalformedPayload.
json parse_json(std::string_view text);

template <typename T>
std::string to_json_string(const T& value, const JsonOptions& options = {}) {
    return JsonCodec<T>::write(value, options).dump();
}

template <typename T>
T from_json_string(std::string_view text, const JsonOptions& options = {}) {
    return JsonCodec<T>::read(parse_json(text), options);
}

} // namespace mc::infrastructure
