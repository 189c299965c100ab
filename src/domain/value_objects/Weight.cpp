#include "domain/value_objects/Weight.hpp"

#include <limits>

namespace mc::domain {

namespace {

[[noreturn]] void throw_invalid_unit(WeightUnit unit) {
    auto raw = std::to_string(static_cast<int>(unit));
    throw errors::InvalidUnit("Invalid weight unit: " + raw, raw);
}

} // namespace

double WeightTraits::to_canonical(double value, WeightUnit unit) {
    switch (unit) {
        case WeightUnit::MICROGRAM: return value / 1'000'000;
        case WeightUnit::MILLIGRAM: return value / 1000;
        case WeightUnit::GRAM: return value;
        case WeightUnit::KILOGRAM: return value * 1000;
        case WeightUnit::TON: return value * 1'000'000;
        case WeightUnit::POUND: return value * 453.59237;
        case WeightUnit::OUNCE: return value * 28.349523125;
        case WeightUnit::STONE: return value * 6350.29318;
        case WeightUnit::CARAT: return value / 5;
        case WeightUnit::LONG_TON: return value * 1'016'046.9088;
        case WeightUnit::SHORT_TON: return value * 907'184.74;
    }
    throw_invalid_unit(unit);
}

double WeightTraits::from_canonical(double grams, WeightUnit unit) {
    switch (unit) {
        case WeightUnit::MICROGRAM: return grams * 1'000'000;
        case WeightUnit::MILLIGRAM: return grams * 1000;
        case WeightUnit::GRAM: return grams;
        case WeightUnit::KILOGRAM: return grams / 1000;
        case WeightUnit::TON: return grams / 1'000'000;
        case WeightUnit::POUND: return grams / 453.59237;
        case WeightUnit::OUNCE: return grams / 28.349523125;
        case WeightUnit::STONE: return grams / 6350.29318;
        case WeightUnit::CARAT: return grams * 5;
        case WeightUnit::LONG_TON: return grams / 1'016'046.9088;
        case WeightUnit::SHORT_TON: return grams / 907'184.74;
    }
    throw_invalid_unit(unit);
}

Weight Weight::max_value() {
    return Weight(std::numeric_limits<double>::max(), WeightUnit::GRAM);
}

Weight Weight::infinity() {
    return Weight(std::numeric_limits<double>::infinity(), WeightUnit::GRAM);
}

} // namespace mc::domain
