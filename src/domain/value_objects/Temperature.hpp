#pragma once

#include "domain/value_objects/QuantityBase.hpp"
#include "domain/value_objects/TemperatureUnit.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mc::domain {

struct TemperatureTraits {
    using Unit = TemperatureUnit;
    static constexpr Unit canonical_unit = TemperatureUnit::KELVIN;
    static constexpr bool additive = false;
    static constexpr const char* default_format = "C";
    static constexpr const char* name = "temperature";

    static double to_canonical(double value, Unit unit);
    static double from_canonical(double kelvin, Unit unit);
    static std::optional<Unit> try_parse(std::string_view text) {
        return try_temperature_unit_from_string(text);
    }
    static std::string symbol(Unit unit) { return to_string(unit); }
};

// Absolute temperature stored in Kelvin. Anything below absolute zero
// clamps to 0 K. Default formatting is Celsius.
class Temperature : public QuantityBase<Temperature, TemperatureTraits> {
public:
    Temperature() = default;
    Temperature(double value, TemperatureUnit unit) : QuantityBase(value, unit) {}

    static Temperature min_value() { return Temperature(); }
    static Temperature max_value();

    static Temperature from_celsius(double value) { return {value, TemperatureUnit::CELSIUS}; }
    static Temperature from_fahrenheit(double value) { return {value, TemperatureUnit::FAHRENHEIT}; }
    static Temperature from_kelvin(double value) { return {value, TemperatureUnit::KELVIN}; }

    double kelvin() const noexcept { return canonical_value(); }
    double celsius() const { return in(TemperatureUnit::CELSIUS); }
    double fahrenheit() const { return in(TemperatureUnit::FAHRENHEIT); }

    Temperature with_kelvin(double value) const { return from_kelvin(value); }
    Temperature with_celsius(double value) const { return from_celsius(value); }
    Temperature with_fahrenheit(double value) const { return from_fahrenheit(value); }
};

} // namespace mc::domain

template <>
struct std::hash<mc::domain::Temperature> {
    std::size_t operator()(const mc::domain::Temperature& t) const noexcept {
        return std::hash<double>{}(t.kelvin());
    }
};
