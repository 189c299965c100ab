#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mc::domain {

enum class DistanceUnit {
    MILLIMETER,
    CENTIMETER,
    METER,
    KILOMETER,
    INCH,
    FOOT,
    YARD,
    MILE,
    NAUTICAL_MILE
};

// Accepts symbols and singular/plural names in any case, with any spacing:
// "nmi", "Nautical Mile", "NAUTICALMILES".
DistanceUnit distance_unit_from_string(std::string_view text);
std::optional<DistanceUnit> try_distance_unit_from_string(std::string_view text);
bool is_valid_distance_unit(std::string_view text);

std::string to_string(DistanceUnit unit);

} // namespace mc::domain
