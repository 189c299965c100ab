#pragma once

#include "domain/value_objects/DistanceUnit.hpp"
#include "domain/value_objects/QuantityBase.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mc::domain {

struct DistanceTraits {
    using Unit = DistanceUnit;
    static constexpr Unit canonical_unit = DistanceUnit::METER;
    static constexpr bool additive = true;
    static constexpr const char* default_format = "m";
    static constexpr const char* name = "distance";

    static double to_canonical(double value, Unit unit);
    static double from_canonical(double meters, Unit unit);
    static std::optional<Unit> try_parse(std::string_view text) {
        return try_distance_unit_from_string(text);
    }
    static std::string symbol(Unit unit) { return to_string(unit); }
};

// Length stored in meters. Negative input clamps to zero.
class Distance : public QuantityBase<Distance, DistanceTraits> {
public:
    Distance() = default;
    Distance(double value, DistanceUnit unit) : QuantityBase(value, unit) {}

    static Distance zero() { return Distance(); }
    static Distance min_value() { return Distance(); }
    static Distance max_value();

    static Distance from_millimeters(double value) { return {value, DistanceUnit::MILLIMETER}; }
    static Distance from_centimeters(double value) { return {value, DistanceUnit::CENTIMETER}; }
    static Distance from_meters(double value) { return {value, DistanceUnit::METER}; }
    static Distance from_kilometers(double value) { return {value, DistanceUnit::KILOMETER}; }
    static Distance from_inches(double value) { return {value, DistanceUnit::INCH}; }
    static Distance from_feet(double value) { return {value, DistanceUnit::FOOT}; }
    static Distance from_yards(double value) { return {value, DistanceUnit::YARD}; }
    static Distance from_miles(double value) { return {value, DistanceUnit::MILE}; }
    static Distance from_nautical_miles(double value) { return {value, DistanceUnit::NAUTICAL_MILE}; }

    double meters() const noexcept { return canonical_value(); }
    double millimeters() const { return in(DistanceUnit::MILLIMETER); }
    double centimeters() const { return in(DistanceUnit::CENTIMETER); }
    double kilometers() const { return in(DistanceUnit::KILOMETER); }
    double inches() const { return in(DistanceUnit::INCH); }
    double feet() const { return in(DistanceUnit::FOOT); }
    double yards() const { return in(DistanceUnit::YARD); }
    double miles() const { return in(DistanceUnit::MILE); }
    double nautical_miles() const { return in(DistanceUnit::NAUTICAL_MILE); }

    // Setters return a new value; the receiver is never modified.
    Distance with_meters(double value) const { return from_meters(value); }
    Distance with_millimeters(double value) const { return from_millimeters(value); }
    Distance with_centimeters(double value) const { return from_centimeters(value); }
    Distance with_kilometers(double value) const { return from_kilometers(value); }
    Distance with_inches(double value) const { return from_inches(value); }
    Distance with_feet(double value) const { return from_feet(value); }
    Distance with_yards(double value) const { return from_yards(value); }
    Distance with_miles(double value) const { return from_miles(value); }
    Distance with_nautical_miles(double value) const { return from_nautical_miles(value); }
};

inline Distance operator+(const Distance& lhs, const Distance& rhs) { return lhs.add(rhs); }
inline Distance operator-(const Distance& lhs, const Distance& rhs) { return lhs.subtract(rhs); }

} // namespace mc::domain

template <>
struct std::hash<mc::domain::Distance> {
    std::size_t operator()(const mc::domain::Distance& d) const noexcept {
        return std::hash<double>{}(d.meters());
    }
};
