#pragma once

#include "domain/maps/Address.hpp"
#include "domain/maps/GeoCoordinate.hpp"
#include "infrastructure/json/JsonCodec.hpp"

namespace mc::infrastructure {

// {"Latitude": .., "Longitude": ..}. Unknown (NaN) components are written
// as null and read back as NaN; a missing component reads as 0.
template <>
struct JsonCodec<domain::GeoCoordinate> {
    static json write(const domain::GeoCoordinate& value, const JsonOptions& options);
    static domain::GeoCoordinate read(const json& j, const JsonOptions& options);
};

// Six string properties; missing or null ones read as "".
template <>
struct JsonCodec<domain::Address> {
    static json write(const domain::Address& value, const JsonOptions& options);
    static domain::Address read(const json& j, const JsonOptions& options);
};

} // namespace mc::infrastructure
