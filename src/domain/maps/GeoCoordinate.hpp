#pragma once

#include "domain/value_objects/Distance.hpp"

#include <string>

namespace mc::domain {

// Latitude/longitude pair in degrees. A default-constructed coordinate is
// unknown (both NaN).
class GeoCoordinate {
public:
    GeoCoordinate();
    // Throws std::out_of_range outside [-90, 90] / [-180, 180].
    GeoCoordinate(double latitude, double longitude);

    static GeoCoordinate zero() { return GeoCoordinate(0.0, 0.0); }
    static GeoCoordinate unknown() { return GeoCoordinate(); }

    double latitude() const noexcept { return latitude_; }
    double longitude() const noexcept { return longitude_; }

    GeoCoordinate with_latitude(double latitude) const { return {latitude, longitude_}; }
    GeoCoordinate with_longitude(double longitude) const { return {latitude_, longitude}; }

    bool is_unknown() const noexcept;

    // Great-circle distance (haversine). Throws std::invalid_argument when
    // either coordinate is unknown.
    Distance distance_to(const GeoCoordinate& other) const;

    std::string to_string() const;

    // NaN components compare equal so that unknown() == unknown().
    bool operator==(const GeoCoordinate& other) const noexcept;

private:
    double latitude_;
    double longitude_;
};

} // namespace mc::domain
