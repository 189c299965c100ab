#pragma once

#include "domain/value_objects/QuantityBase.hpp"
#include "domain/value_objects/WeightUnit.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mc::domain {

struct WeightTraits {
    using Unit = WeightUnit;
    static constexpr Unit canonical_unit = WeightUnit::GRAM;
    static constexpr bool additive = true;
    static constexpr const char* default_format = "g";
    static constexpr const char* name = "weight";

    static double to_canonical(double value, Unit unit);
    static double from_canonical(double grams, Unit unit);
    static std::optional<Unit> try_parse(std::string_view text) {
        return try_weight_unit_from_string(text);
    }
    static std::string symbol(Unit unit) { return to_string(unit); }
};

// Mass stored in grams. Negative input clamps to zero.
class Weight : public QuantityBase<Weight, WeightTraits> {
public:
    Weight() = default;
    Weight(double value, WeightUnit unit) : QuantityBase(value, unit) {}

    static Weight zero() { return Weight(); }
    static Weight min_value() { return Weight(); }
    static Weight max_value();
    // Clamps to max_value(); kept for callers that want an unbounded sentinel.
    static Weight infinity();

    static Weight from_micrograms(double value) { return {value, WeightUnit::MICROGRAM}; }
    static Weight from_milligrams(double value) { return {value, WeightUnit::MILLIGRAM}; }
    static Weight from_grams(double value) { return {value, WeightUnit::GRAM}; }
    static Weight from_kilograms(double value) { return {value, WeightUnit::KILOGRAM}; }
    static Weight from_tons(double value) { return {value, WeightUnit::TON}; }
    static Weight from_pounds(double value) { return {value, WeightUnit::POUND}; }
    static Weight from_ounces(double value) { return {value, WeightUnit::OUNCE}; }
    static Weight from_stones(double value) { return {value, WeightUnit::STONE}; }
    static Weight from_carats(double value) { return {value, WeightUnit::CARAT}; }
    static Weight from_long_tons(double value) { return {value, WeightUnit::LONG_TON}; }
    static Weight from_short_tons(double value) { return {value, WeightUnit::SHORT_TON}; }

    double grams() const noexcept { return canonical_value(); }
    double micrograms() const { return in(WeightUnit::MICROGRAM); }
    double milligrams() const { return in(WeightUnit::MILLIGRAM); }
    double kilograms() const { return in(WeightUnit::KILOGRAM); }
    double tons() const { return in(WeightUnit::TON); }
    double pounds() const { return in(WeightUnit::POUND); }
    double ounces() const { return in(WeightUnit::OUNCE); }
    double stones() const { return in(WeightUnit::STONE); }
    double carats() const { return in(WeightUnit::CARAT); }
    double long_tons() const { return in(WeightUnit::LONG_TON); }
    double short_tons() const { return in(WeightUnit::SHORT_TON); }

    Weight with_grams(double value) const { return from_grams(value); }
    Weight with_micrograms(double value) const { return from_micrograms(value); }
    Weight with_milligrams(double value) const { return from_milligrams(value); }
    Weight with_kilograms(double value) const { return from_kilograms(value); }
    Weight with_tons(double value) const { return from_tons(value); }
    Weight with_pounds(double value) const { return from_pounds(value); }
    Weight with_ounces(double value) const { return from_ounces(value); }
    Weight with_stones(double value) const { return from_stones(value); }
    Weight with_carats(double value) const { return from_carats(value); }
    Weight with_long_tons(double value) const { return from_long_tons(value); }
    Weight with_short_tons(double value) const { return from_short_tons(value); }
};

inline Weight operator+(const Weight& lhs, const Weight& rhs) { return lhs.add(rhs); }
inline Weight operator-(const Weight& lhs, const Weight& rhs) { return lhs.subtract(rhs); }

} // namespace mc::domain

template <>
struct std::hash<mc::domain::Weight> {
    std::size_t operator()(const mc::domain::Weight& w) const noexcept {
        return std::hash<double>{}(w.grams());
    }
};
