#include "domain/value_objects/TemperatureRange.hpp"

#include <stdexcept>

namespace mc::domain {

TemperatureRange::TemperatureRange(Temperature min, Temperature max) : min_(min), max_(max) {
    if (min > max) {
        throw std::invalid_argument(
            "Temperature range minimum must not exceed maximum, got: "
            + min.to_string("K") + " > " + max.to_string("K"));
    }
}

TemperatureRange TemperatureRange::full() {
    return TemperatureRange(Temperature::min_value(), Temperature::max_value());
}

} // namespace mc::domain
