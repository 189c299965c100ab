#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace mc::domain {

// One accepted spelling of a unit.
template <typename Unit>
struct UnitAlias {
    std::string_view text;
    Unit unit;
};

// Lower-cases ASCII, drops every space and trims surrounding whitespace.
// Multi-word units ("nautical mile", "cubic feet") collapse to one token.
std::string normalize_unit_text(std::string_view text);

// Drops the degree sign, lower-cases ASCII and trims. Spaces inside are kept.
std::string normalize_temperature_text(std::string_view text);

// Shortest decimal text that reads back to the same double.
std::string format_number(double value);

template <typename Unit, std::size_t N>
std::optional<Unit> find_alias(const std::array<UnitAlias<Unit>, N>& aliases,
                               std::string_view normalized) {
    for (const auto& alias : aliases) {
        if (alias.text == normalized) return alias.unit;
    }
    return std::nullopt;
}

} // namespace mc::domain
