#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mc::infrastructure {

// How declared (PascalCase) property names appear on the wire.
enum class NamingPolicy {
    NONE,               // StatusCode
    CAMEL_CASE,         // statusCode
    SNAKE_CASE_LOWER,   // status_code
    SNAKE_CASE_UPPER,   // STATUS_CODE
    KEBAB_CASE_LOWER,   // status-code
    KEBAB_CASE_UPPER    // STATUS-CODE
};

// Accepts "none", "camelCase", "snake_case", "SNAKE_CASE", "kebab-case",
// "KEBAB-CASE". Throws std::invalid_argument otherwise.
NamingPolicy naming_policy_from_string(std::string_view text);
std::optional<NamingPolicy> try_naming_policy_from_string(std::string_view text);
std::string to_string(NamingPolicy policy);

std::string convert_name(std::string_view name, NamingPolicy policy);

struct JsonOptions {
    NamingPolicy naming_policy = NamingPolicy::NONE;
    bool property_name_case_insensitive = false;

    // camelCase names, case-insensitive reads.
    static JsonOptions web();

    std::string property_name(std::string_view declared) const {
        return convert_name(declared, naming_policy);
    }

    // Whether a property name read from the wire refers to `declared`.
    bool matches(std::string_view actual, std::string_view declared) const;
};

} // namespace mc::infrastructure
