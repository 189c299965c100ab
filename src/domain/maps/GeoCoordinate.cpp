#include "domain/maps/GeoCoordinate.hpp"

#include "domain/value_objects/UnitText.hpp"

#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace mc::domain {

namespace {

constexpr double kEarthRadiusMeters = 6'376'500.0;

double to_radians(double degrees) {
    return degrees * (std::numbers::pi / 180.0);
}

bool same_component(double a, double b) {
    return (std::isnan(a) && std::isnan(b)) || a == b;
}

} // namespace

GeoCoordinate::GeoCoordinate()
    : latitude_(std::numeric_limits<double>::quiet_NaN()),
      longitude_(std::numeric_limits<double>::quiet_NaN()) {}

GeoCoordinate::GeoCoordinate(double latitude, double longitude)
    : latitude_(latitude), longitude_(longitude) {
    if (latitude > 90.0 || latitude < -90.0) {
        throw std::out_of_range(
            "Latitude must be between -90 and 90 degrees, got: " + format_number(latitude));
    }
    if (longitude > 180.0 || longitude < -180.0) {
        throw std::out_of_range(
            "Longitude must be between -180 and 180 degrees, got: " + format_number(longitude));
    }
}

bool GeoCoordinate::is_unknown() const noexcept {
    return std::isnan(latitude_) && std::isnan(longitude_);
}

Distance GeoCoordinate::distance_to(const GeoCoordinate& other) const {
    if (std::isnan(latitude_) || std::isnan(longitude_) ||
        std::isnan(other.latitude_) || std::isnan(other.longitude_)) {
        throw std::invalid_argument("Latitude or longitude is not a number");
    }

    double lat1 = to_radians(latitude_);
    double lon1 = to_radians(longitude_);
    double lat2 = to_radians(other.latitude_);
    double lon2 = to_radians(other.longitude_);
    double dlat = lat2 - lat1;
    double dlon = lon2 - lon1;

    double a = std::pow(std::sin(dlat / 2.0), 2.0) +
               std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(dlon / 2.0), 2.0);
    // Central angle in radians.
    double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return Distance::from_meters(kEarthRadiusMeters * c);
}

std::string GeoCoordinate::to_string() const {
    return "Latitude: " + format_number(latitude_) + ", Longitude: " + format_number(longitude_);
}

bool GeoCoordinate::operator==(const GeoCoordinate& other) const noexcept {
    return same_component(latitude_, other.latitude_) &&
           same_component(longitude_, other.longitude_);
}

} // namespace mc::domain
