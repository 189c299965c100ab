#include "domain/value_objects/Temperature.hpp"

#include <limits>

namespace mc::domain {

namespace {

constexpr double kCelsiusOffset = 273.15;
constexpr double kFahrenheitOffset = 459.67;

[[noreturn]] void throw_invalid_unit(TemperatureUnit unit) {
    auto raw = std::to_string(static_cast<int>(unit));
    throw errors::InvalidUnit("Unknown temperature unit: " + raw, raw);
}

} // namespace

double TemperatureTraits::to_canonical(double value, TemperatureUnit unit) {
    switch (unit) {
        case TemperatureUnit::CELSIUS: return value + kCelsiusOffset;
        case TemperatureUnit::FAHRENHEIT: return (value + kFahrenheitOffset) * 5 / 9;
        case TemperatureUnit::KELVIN: return value;
    }
    throw_invalid_unit(unit);
}

double TemperatureTraits::from_canonical(double kelvin, TemperatureUnit unit) {
    switch (unit) {
        case TemperatureUnit::CELSIUS: return kelvin - kCelsiusOffset;
        case TemperatureUnit::FAHRENHEIT: return kelvin * 9 / 5 - kFahrenheitOffset;
        case TemperatureUnit::KELVIN: return kelvin;
    }
    throw_invalid_unit(unit);
}

Temperature Temperature::max_value() {
    return Temperature(std::numeric_limits<double>::max(), TemperatureUnit::KELVIN);
}

} // namespace mc::domain
