#pragma once

#include "domain/value_objects/Temperature.hpp"

namespace mc::domain {

class TemperatureRange {
public:
    // Throws std::invalid_argument when min > max.
    TemperatureRange(Temperature min, Temperature max);

    // Absolute zero up to the largest representable temperature.
    static TemperatureRange full();

    const Temperature& min() const noexcept { return min_; }
    const Temperature& max() const noexcept { return max_; }

    bool is_single_temperature() const noexcept { return min_ == max_; }
    bool contains(const Temperature& t) const noexcept { return min_ <= t && t <= max_; }

    bool operator==(const TemperatureRange&) const = default;

private:
    Temperature min_;
    Temperature max_;
};

} // namespace mc::domain
