#include "domain/value_objects/TemperatureUnit.hpp"

#include "domain/value_objects/UnitText.hpp"
#include "errors/Errors.hpp"

namespace mc::domain {

namespace {

constexpr std::array<UnitAlias<TemperatureUnit>, 6> kAliases{{
    {"c", TemperatureUnit::CELSIUS}, {"celsius", TemperatureUnit::CELSIUS},
    {"f", TemperatureUnit::FAHRENHEIT}, {"fahrenheit", TemperatureUnit::FAHRENHEIT},
    {"k", TemperatureUnit::KELVIN}, {"kelvin", TemperatureUnit::KELVIN},
}};

} // namespace

std::optional<TemperatureUnit> try_temperature_unit_from_string(std::string_view text) {
    return find_alias(kAliases, normalize_temperature_text(text));
}

TemperatureUnit temperature_unit_from_string(std::string_view text) {
    if (auto unit = try_temperature_unit_from_string(text)) return *unit;
    throw errors::InvalidUnit("Unknown temperature unit: " + std::string(text), std::string(text));
}

bool is_valid_temperature_unit(std::string_view text) {
    return try_temperature_unit_from_string(text).has_value();
}

std::string to_string(TemperatureUnit unit) {
    switch (unit) {
        case TemperatureUnit::CELSIUS: return "\xC2\xB0" "C";
        case TemperatureUnit::FAHRENHEIT: return "\xC2\xB0" "F";
        case TemperatureUnit::KELVIN: return "K";
    }
    auto raw = std::to_string(static_cast<int>(unit));
    throw errors::InvalidUnit("Unknown temperature unit: " + raw, raw);
}

} // namespace mc::domain
