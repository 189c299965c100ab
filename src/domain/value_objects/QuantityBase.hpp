#pragma once

#include "domain/value_objects/UnitText.hpp"
#include "errors/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <compare>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

namespace mc::domain {

// Shared storage and behaviour of the measurement value types.
//
// A quantity holds one double in the canonical unit of its kind (meters,
// grams, cubic meters, Kelvin). Every constructor normalizes to that unit
// and clamps the result to [0, DBL_MAX]; NaN becomes 0. Unit views are
// computed on demand, so equality and ordering only ever see the canonical
// value.
//
// Traits supplies:
//   Unit                      the unit enum
//   canonical_unit            unit the value is stored in
//   additive                  whether add/subtract make sense
//   default_format            unit text used by to_string()
//   name                      kind name used in error messages
//   to_canonical / from_canonical
//   try_parse(text)           alias lookup, std::nullopt when unknown
//   symbol(unit)              display symbol
template <typename Derived, typename Traits>
class QuantityBase {
public:
    using traits_type = Traits;
    using unit_type = typename Traits::Unit;

    double canonical_value() const noexcept { return canonical_; }

    double in(unit_type unit) const { return Traits::from_canonical(canonical_, unit); }

    std::string to_string() const { return to_string(Traits::default_format); }

    // The format is itself a unit string, e.g. "km" or "°F".
    std::string to_string(std::string_view format) const {
        if (format.empty()) format = Traits::default_format;
        auto unit = Traits::try_parse(format);
        if (!unit) {
            throw errors::FormatError(
                std::string("Invalid ") + Traits::name + " format: " + std::string(format),
                std::string(format));
        }
        return format_number(in(*unit)) + " " + Traits::symbol(*unit);
    }

    bool equals(const Derived& other) const noexcept {
        return canonical_ == other.canonical_value();
    }

    int compare_to(const Derived& other) const noexcept {
        if (canonical_ < other.canonical_value()) return -1;
        if (canonical_ > other.canonical_value()) return 1;
        return 0;
    }

    Derived add(const Derived& other) const requires Traits::additive {
        return Derived(canonical_ + other.canonical_value(), Traits::canonical_unit);
    }

    // Never goes below zero.
    Derived subtract(const Derived& other) const requires Traits::additive {
        return Derived(canonical_ - other.canonical_value(), Traits::canonical_unit);
    }

    bool operator==(const QuantityBase&) const = default;
    auto operator<=>(const QuantityBase&) const = default;

    friend std::ostream& operator<<(std::ostream& os, const Derived& quantity) {
        return os << quantity.to_string();
    }

protected:
    QuantityBase() = default;

    QuantityBase(double value, unit_type unit)
        : canonical_(clamp_canonical(Traits::to_canonical(value, unit))) {}

    static double clamp_canonical(double value) noexcept {
        if (std::isnan(value) || value <= 0.0) return 0.0;
        return std::min(value, std::numeric_limits<double>::max());
    }

private:
    double canonical_ = 0.0;
};

} // namespace mc::domain
