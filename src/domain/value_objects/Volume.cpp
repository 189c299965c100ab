#include "domain/value_objects/Volume.hpp"

#include <limits>

namespace mc::domain {

namespace {

[[noreturn]] void throw_invalid_unit(VolumeUnit unit) {
    auto raw = std::to_string(static_cast<int>(unit));
    throw errors::InvalidUnit("Invalid volume unit: " + raw, raw);
}

} // namespace

double VolumeTraits::to_canonical(double value, VolumeUnit unit) {
    switch (unit) {
        case VolumeUnit::CUBIC_CENTIMETER: return value * 0.000001;
        case VolumeUnit::CUBIC_METER: return value;
        case VolumeUnit::CUBIC_FEET: return value * 0.0283168;
        case VolumeUnit::LITER: return value * 0.001;
        case VolumeUnit::MILLILITER: return value * 0.000001;
        case VolumeUnit::GALLON: return value * 0.00378541;
    }
    throw_invalid_unit(unit);
}

double VolumeTraits::from_canonical(double cubic_meters, VolumeUnit unit) {
    switch (unit) {
        case VolumeUnit::CUBIC_CENTIMETER: return cubic_meters / 0.000001;
        case VolumeUnit::CUBIC_METER: return cubic_meters;
        case VolumeUnit::CUBIC_FEET: return cubic_meters / 0.0283168;
        case VolumeUnit::LITER: return cubic_meters / 0.001;
        case VolumeUnit::MILLILITER: return cubic_meters / 0.000001;
        case VolumeUnit::GALLON: return cubic_meters / 0.00378541;
    }
    throw_invalid_unit(unit);
}

Volume Volume::from_dimensions(const Distance& width, const Distance& height,
                               const Distance& depth) {
    return from_cubic_meters(width.meters() * height.meters() * depth.meters());
}

Volume Volume::max_value() {
    return Volume(std::numeric_limits<double>::max(), VolumeUnit::CUBIC_METER);
}

Volume Volume::infinity() {
    return Volume(std::numeric_limits<double>::infinity(), VolumeUnit::CUBIC_METER);
}

} // namespace mc::domain
