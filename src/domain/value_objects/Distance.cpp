#include "domain/value_objects/Distance.hpp"

#include <limits>

namespace mc::domain {

namespace {

[[noreturn]] void throw_invalid_unit(DistanceUnit unit) {
    auto raw = std::to_string(static_cast<int>(unit));
    throw errors::InvalidUnit("Invalid distance unit: " + raw, raw);
}

} // namespace

double DistanceTraits::to_canonical(double value, DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::MILLIMETER: return value / 1000;
        case DistanceUnit::CENTIMETER: return value / 100;
        case DistanceUnit::METER: return value;
        case DistanceUnit::KILOMETER: return value * 1000;
        case DistanceUnit::INCH: return value * 0.0254;
        case DistanceUnit::FOOT: return value * 0.3048;
        case DistanceUnit::YARD: return value * 0.9144;
        case DistanceUnit::MILE: return value * 1609.34;
        case DistanceUnit::NAUTICAL_MILE: return value * 1852;
    }
    throw_invalid_unit(unit);
}

double DistanceTraits::from_canonical(double meters, DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::MILLIMETER: return meters * 1000;
        case DistanceUnit::CENTIMETER: return meters * 100;
        case DistanceUnit::METER: return meters;
        case DistanceUnit::KILOMETER: return meters / 1000;
        case DistanceUnit::INCH: return meters / 0.0254;
        case DistanceUnit::FOOT: return meters / 0.3048;
        case DistanceUnit::YARD: return meters / 0.9144;
        case DistanceUnit::MILE: return meters / 1609.34;
        case DistanceUnit::NAUTICAL_MILE: return meters / 1852;
    }
    throw_invalid_unit(unit);
}

Distance Distance::max_value() {
    return Distance(std::numeric_limits<double>::max(), DistanceUnit::METER);
}

} // namespace mc::domain
