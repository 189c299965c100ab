#include "domain/value_objects/VolumeUnit.hpp"

#include "domain/value_objects/UnitText.hpp"
#include "errors/Errors.hpp"

namespace mc::domain {

namespace {

constexpr std::array<UnitAlias<VolumeUnit>, 23> kAliases{{
    {"cm\xC2\xB3", VolumeUnit::CUBIC_CENTIMETER}, {"cm3", VolumeUnit::CUBIC_CENTIMETER},
    {"cubiccentimeter", VolumeUnit::CUBIC_CENTIMETER},
    {"cubiccentimeters", VolumeUnit::CUBIC_CENTIMETER},
    {"m\xC2\xB3", VolumeUnit::CUBIC_METER}, {"m3", VolumeUnit::CUBIC_METER},
    {"cubicmeter", VolumeUnit::CUBIC_METER}, {"cubicmeters", VolumeUnit::CUBIC_METER},
    {"ft\xC2\xB3", VolumeUnit::CUBIC_FEET}, {"ft3", VolumeUnit::CUBIC_FEET},
    {"cubicfoot", VolumeUnit::CUBIC_FEET}, {"cubicfoots", VolumeUnit::CUBIC_FEET},
    {"cubicfeet", VolumeUnit::CUBIC_FEET}, {"cubicfeets", VolumeUnit::CUBIC_FEET},
    {"l", VolumeUnit::LITER}, {"liter", VolumeUnit::LITER}, {"liters", VolumeUnit::LITER},
    {"ml", VolumeUnit::MILLILITER}, {"milliliter", VolumeUnit::MILLILITER},
    {"milliliters", VolumeUnit::MILLILITER},
    {"gal", VolumeUnit::GALLON}, {"gallon", VolumeUnit::GALLON},
    {"gallons", VolumeUnit::GALLON},
}};

} // namespace

std::optional<VolumeUnit> try_volume_unit_from_string(std::string_view text) {
    return find_alias(kAliases, normalize_unit_text(text));
}

VolumeUnit volume_unit_from_string(std::string_view text) {
    if (auto unit = try_volume_unit_from_string(text)) return *unit;
    throw errors::InvalidUnit("Invalid volume unit: " + std::string(text), std::string(text));
}

bool is_valid_volume_unit(std::string_view text) {
    return try_volume_unit_from_string(text).has_value();
}

std::string to_string(VolumeUnit unit) {
    switch (unit) {
        case VolumeUnit::CUBIC_CENTIMETER: return "cm\xC2\xB3";
        case VolumeUnit::CUBIC_METER: return "m\xC2\xB3";
        case VolumeUnit::CUBIC_FEET: return "ft\xC2\xB3";
        case VolumeUnit::LITER: return "l";
        case VolumeUnit::MILLILITER: return "ml";
        case VolumeUnit::GALLON: return "gal";
    }
    auto raw = std::to_string(static_cast<int>(unit));
    throw errors::InvalidUnit("Invalid volume unit: " + raw, raw);
}

} // namespace mc::domain
