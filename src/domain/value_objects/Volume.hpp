#pragma once

#include "domain/value_objects/Distance.hpp"
#include "domain/value_objects/QuantityBase.hpp"
#include "domain/value_objects/VolumeUnit.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mc::domain {

struct VolumeTraits {
    using Unit = VolumeUnit;
    static constexpr Unit canonical_unit = VolumeUnit::CUBIC_METER;
    static constexpr bool additive = true;
    static constexpr const char* default_format = "m3";
    static constexpr const char* name = "volume";

    static double to_canonical(double value, Unit unit);
    static double from_canonical(double cubic_meters, Unit unit);
    static std::optional<Unit> try_parse(std::string_view text) {
        return try_volume_unit_from_string(text);
    }
    static std::string symbol(Unit unit) { return to_string(unit); }
};

// Volume stored in cubic meters. Negative input clamps to zero.
class Volume : public QuantityBase<Volume, VolumeTraits> {
public:
    Volume() = default;
    Volume(double value, VolumeUnit unit) : QuantityBase(value, unit) {}

    // Box of width x height x depth.
    static Volume from_dimensions(const Distance& width, const Distance& height,
                                  const Distance& depth);

    static Volume zero() { return Volume(); }
    static Volume min_value() { return Volume(); }
    static Volume max_value();
    static Volume infinity();

    static Volume from_cubic_centimeters(double value) { return {value, VolumeUnit::CUBIC_CENTIMETER}; }
    static Volume from_cubic_meters(double value) { return {value, VolumeUnit::CUBIC_METER}; }
    static Volume from_cubic_feet(double value) { return {value, VolumeUnit::CUBIC_FEET}; }
    static Volume from_liters(double value) { return {value, VolumeUnit::LITER}; }
    static Volume from_milliliters(double value) { return {value, VolumeUnit::MILLILITER}; }
    static Volume from_gallons(double value) { return {value, VolumeUnit::GALLON}; }

    double cubic_meters() const noexcept { return canonical_value(); }
    double cubic_centimeters() const { return in(VolumeUnit::CUBIC_CENTIMETER); }
    double cubic_feet() const { return in(VolumeUnit::CUBIC_FEET); }
    double liters() const { return in(VolumeUnit::LITER); }
    double milliliters() const { return in(VolumeUnit::MILLILITER); }
    double gallons() const { return in(VolumeUnit::GALLON); }

    Volume with_cubic_meters(double value) const { return from_cubic_meters(value); }
    Volume with_cubic_centimeters(double value) const { return from_cubic_centimeters(value); }
    Volume with_cubic_feet(double value) const { return from_cubic_feet(value); }
    Volume with_liters(double value) const { return from_liters(value); }
    Volume with_milliliters(double value) const { return from_milliliters(value); }
    Volume with_gallons(double value) const { return from_gallons(value); }
};

inline Volume operator+(const Volume& lhs, const Volume& rhs) { return lhs.add(rhs); }
inline Volume operator-(const Volume& lhs, const Volume& rhs) { return lhs.subtract(rhs); }

} // namespace mc::domain

template <>
struct std::hash<mc::domain::Volume> {
    std::size_t operator()(const mc::domain::Volume& v) const noexcept {
        return std::hash<double>{}(v.cubic_meters());
    }
};
