#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mc::domain {

enum class TemperatureUnit { CELSIUS, FAHRENHEIT, KELVIN };

// Accepts "c", "celsius", "°C" and the same forms for Fahrenheit and Kelvin.
// A leading degree sign is ignored; inner spaces are not.
TemperatureUnit temperature_unit_from_string(std::string_view text);
std::optional<TemperatureUnit> try_temperature_unit_from_string(std::string_view text);
bool is_valid_temperature_unit(std::string_view text);

// "°C", "°F" or "K".
std::string to_string(TemperatureUnit unit);

} // namespace mc::domain
