#include "infrastructure/json/JsonOptions.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mc::infrastructure {

namespace {

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
char lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
char upper(char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); }

// Lower-cases the leading run of capitals: "StatusCode" -> "statusCode",
// "URLValue" -> "urlValue".
std::string to_camel_case(std::string_view name) {
    std::string out(name);
    if (out.empty() || !is_upper(out[0])) return out;

    for (std::size_t i = 0; i < out.size(); ++i) {
        if (i == 1 && !is_upper(out[i])) break;
        bool has_next = i + 1 < out.size();
        if (i > 0 && has_next && !is_upper(out[i + 1])) {
            if (out[i + 1] == ' ') out[i] = lower(out[i]);
            break;
        }
        out[i] = lower(out[i]);
    }
    return out;
}

// Splits on case boundaries and on existing separators:
// "StatusCode" -> "status_code", "URLValue" -> "url_value".
std::string to_separated(std::string_view name, char separator, bool upper_case) {
    std::string out;
    out.reserve(name.size() + 4);
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == ' ' || c == '_' || c == '-') {
            if (!out.empty() && out.back() != separator) out.push_back(separator);
            continue;
        }
        if (is_upper(c) && i > 0 && !out.empty() && out.back() != separator) {
            char prev = name[i - 1];
            bool next_lower = i + 1 < name.size() && is_lower(name[i + 1]);
            if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_lower)) {
                out.push_back(separator);
            }
        }
        out.push_back(upper_case ? upper(c) : lower(c));
    }
    if (!out.empty() && out.back() == separator) out.pop_back();
    return out;
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return lower(x) == lower(y); });
}

} // namespace

std::optional<NamingPolicy> try_naming_policy_from_string(std::string_view text) {
    if (text == "none" || text.empty()) return NamingPolicy::NONE;
    if (text == "camelCase") return NamingPolicy::CAMEL_CASE;
    if (text == "snake_case") return NamingPolicy::SNAKE_CASE_LOWER;
    if (text == "SNAKE_CASE") return NamingPolicy::SNAKE_CASE_UPPER;
    if (text == "kebab-case") return NamingPolicy::KEBAB_CASE_LOWER;
    if (text == "KEBAB-CASE") return NamingPolicy::KEBAB_CASE_UPPER;
    return std::nullopt;
}

NamingPolicy naming_policy_from_string(std::string_view text) {
    if (auto policy = try_naming_policy_from_string(text)) return *policy;
    throw std::invalid_argument("Invalid naming policy: " + std::string(text));
}

std::string to_string(NamingPolicy policy) {
    switch (policy) {
        case NamingPolicy::NONE: return "none";
        case NamingPolicy::CAMEL_CASE: return "camelCase";
        case NamingPolicy::SNAKE_CASE_LOWER: return "snake_case";
        case NamingPolicy::SNAKE_CASE_UPPER: return "SNAKE_CASE";
        case NamingPolicy::KEBAB_CASE_LOWER: return "kebab-case";
        case NamingPolicy::KEBAB_CASE_UPPER: return "KEBAB-CASE";
    }
    throw std::invalid_argument("Invalid naming policy: " + std::to_string(static_cast<int>(policy)));
}

std::string convert_name(std::string_view name, NamingPolicy policy) {
    switch (policy) {
        case NamingPolicy::NONE: return std::string(name);
        case NamingPolicy::CAMEL_CASE: return to_camel_case(name);
        case NamingPolicy::SNAKE_CASE_LOWER: return to_separated(name, '_', false);
        case NamingPolicy::SNAKE_CASE_UPPER: return to_separated(name, '_', true);
        case NamingPolicy::KEBAB_CASE_LOWER: return to_separated(name, '-', false);
        case NamingPolicy::KEBAB_CASE_UPPER: return to_separated(name, '-', true);
    }
    throw std::invalid_argument("Invalid naming policy: " + std::to_string(static_cast<int>(policy)));
}

JsonOptions JsonOptions::web() {
    return JsonOptions{NamingPolicy::CAMEL_CASE, true};
}

bool JsonOptions::matches(std::string_view actual, std::string_view declared) const {
    auto expected = property_name(declared);
    return property_name_case_insensitive ? equals_ignore_case(actual, expected)
                                          : actual == expected;
}

} // namespace mc::infrastructure
