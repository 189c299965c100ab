#include "domain/value_objects/DistanceUnit.hpp"

#include "domain/value_objects/UnitText.hpp"
#include "errors/Errors.hpp"

namespace mc::domain {

namespace {

constexpr std::array<UnitAlias<DistanceUnit>, 27> kAliases{{
    {"mm", DistanceUnit::MILLIMETER}, {"millimeter", DistanceUnit::MILLIMETER},
    {"millimeters", DistanceUnit::MILLIMETER},
    {"cm", DistanceUnit::CENTIMETER}, {"centimeter", DistanceUnit::CENTIMETER},
    {"centimeters", DistanceUnit::CENTIMETER},
    {"m", DistanceUnit::METER}, {"meter", DistanceUnit::METER},
    {"meters", DistanceUnit::METER},
    {"km", DistanceUnit::KILOMETER}, {"kilometer", DistanceUnit::KILOMETER},
    {"kilometers", DistanceUnit::KILOMETER},
    {"in", DistanceUnit::INCH}, {"inch", DistanceUnit::INCH},
    {"inches", DistanceUnit::INCH},
    {"ft", DistanceUnit::FOOT}, {"foot", DistanceUnit::FOOT},
    {"feet", DistanceUnit::FOOT},
    {"yd", DistanceUnit::YARD}, {"yard", DistanceUnit::YARD},
    {"yards", DistanceUnit::YARD},
    {"mi", DistanceUnit::MILE}, {"mile", DistanceUnit::MILE},
    {"miles", DistanceUnit::MILE},
    {"nmi", DistanceUnit::NAUTICAL_MILE}, {"nauticalmile", DistanceUnit::NAUTICAL_MILE},
    {"nauticalmiles", DistanceUnit::NAUTICAL_MILE},
}};

} // namespace

std::optional<DistanceUnit> try_distance_unit_from_string(std::string_view text) {
    return find_alias(kAliases, normalize_unit_text(text));
}

DistanceUnit distance_unit_from_string(std::string_view text) {
    if (auto unit = try_distance_unit_from_string(text)) return *unit;
    throw errors::InvalidUnit("Invalid distance unit: " + std::string(text), std::string(text));
}

bool is_valid_distance_unit(std::string_view text) {
    return try_distance_unit_from_string(text).has_value();
}

std::string to_string(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::MILLIMETER: return "mm";
        case DistanceUnit::CENTIMETER: return "cm";
        case DistanceUnit::METER: return "m";
        case DistanceUnit::KILOMETER: return "km";
        case DistanceUnit::INCH: return "in";
        case DistanceUnit::FOOT: return "ft";
        case DistanceUnit::YARD: return "yd";
        case DistanceUnit::MILE: return "mi";
        case DistanceUnit::NAUTICAL_MILE: return "nmi";
    }
    auto raw = std::to_string(static_cast<int>(unit));
    throw errors::InvalidUnit("Invalid distance unit: " + raw, raw);
}

} // namespace mc::domain
