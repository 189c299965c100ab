#pragma once

#include "domain/value_objects/Distance.hpp"
#include "domain/value_objects/Temperature.hpp"
#include "domain/value_objects/TemperatureRange.hpp"
#include "domain/value_objects/Volume.hpp"
#include "domain/value_objects/Weight.hpp"
#include "infrastructure/json/JsonCodec.hpp"

namespace mc::infrastructure {

// Quantities are written as {"Value": <canonical>, "Unit": <canonical symbol>}
// (names through the naming policy), whatever unit they were built from:
// meters "m", grams "g", cubic meters "m3", Kelvin "k". Reads accept any
// known unit; a missing value reads as 0 and a missing unit as the
// canonical one.

template <>
struct JsonCodec<domain::Distance> {
    static json write(const domain::Distance& value, const JsonOptions& options);
    static domain::Distance read(const json& j, const JsonOptions& options);
};

template <>
struct JsonCodec<domain::Weight> {
    static json write(const domain::Weight& value, const JsonOptions& options);
    static domain::Weight read(const json& j, const JsonOptions& options);
};

template <>
struct JsonCodec<domain::Volume> {
    static json write(const domain::Volume& value, const JsonOptions& options);
    static domain::Volume read(const json& j, const JsonOptions& options);
};

template <>
struct JsonCodec<domain::Temperature> {
    static json write(const domain::Temperature& value, const JsonOptions& options);
    static domain::Temperature read(const json& j, const JsonOptions& options);
};

// {"Min": <Temperature>, "Max": <Temperature>}, both required.
template <>
struct JsonCodec<domain::TemperatureRange> {
    static json write(const domain::TemperatureRange& value, const JsonOptions& options);
    static domain::TemperatureRange read(const json& j, const JsonOptions& options);
};

} // namespace mc::infrastructure
