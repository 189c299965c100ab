#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mc::domain {

enum class WeightUnit {
    MICROGRAM,
    MILLIGRAM,
    GRAM,
    KILOGRAM,
    TON,
    POUND,
    OUNCE,
    STONE,
    CARAT,
    LONG_TON,
    SHORT_TON
};

// "st." is the stone, "st" the short ton.
WeightUnit weight_unit_from_string(std::string_view text);
std::optional<WeightUnit> try_weight_unit_from_string(std::string_view text);
bool is_valid_weight_unit(std::string_view text);

std::string to_string(WeightUnit unit);

} // namespace mc::domain
