#include "domain/value_objects/UnitText.hpp"

#include <charconv>
#include <system_error>

namespace mc::domain {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
constexpr std::string_view kDegreeSign = "\xC2\xB0";

char to_lower_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

} // namespace

std::string normalize_unit_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == ' ') continue;
        out.push_back(to_lower_ascii(c));
    }
    return trim(out);
}

std::string normalize_temperature_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text.substr(i, kDegreeSign.size()) == kDegreeSign) {
            i += kDegreeSign.size() - 1;
            continue;
        }
        out.push_back(to_lower_ascii(text[i]));
    }
    return trim(out);
}

std::string format_number(double value) {
    std::array<char, 64> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buf.data(), end);
}

} // namespace mc::domain
