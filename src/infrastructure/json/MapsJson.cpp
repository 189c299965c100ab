#include "infrastructure/json/MapsJson.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace mc::domain;

namespace mc::infrastructure {

namespace {

json number_or_null(double value) {
    if (std::isnan(value)) return nullptr;
    return value;
}

double read_component(const json& j, const std::string& property) {
    if (j.is_null()) return std::numeric_limits<double>::quiet_NaN();
    return detail::read_number(j, property);
}

struct AddressField {
    const char* name;
    std::string Address::*member;
};

constexpr std::array<AddressField, 6> kAddressFields{{
    {"AddressLine1", &Address::address_line1},
    {"AddressLine2", &Address::address_line2},
    {"City", &Address::city},
    {"PostalCode", &Address::postal_code},
    {"StateOrProvince", &Address::state_or_province},
    {"Country", &Address::country},
}};

} // namespace

json JsonCodec<GeoCoordinate>::write(const GeoCoordinate& value, const JsonOptions& options) {
    json j = json::object();
    j[options.property_name("Latitude")] = number_or_null(value.latitude());
    j[options.property_name("Longitude")] = number_or_null(value.longitude());
    return j;
}

GeoCoordinate JsonCodec<GeoCoordinate>::read(const json& j, const JsonOptions& options) {
    detail::require_object(j);

    double latitude = 0.0;
    double longitude = 0.0;

    for (const auto& item : j.items()) {
        if (options.matches(item.key(), "Latitude")) {
            latitude = read_component(item.value(), item.key());
        } else if (options.matches(item.key(), "Longitude")) {
            longitude = read_component(item.value(), item.key());
        } else {
            detail::throw_unknown_property(item.key());
        }
    }

    try {
        return GeoCoordinate(latitude, longitude);
    } catch (const std::out_of_range& e) {
        throw errors::MalformedPayload(e.what());
    }
}

json JsonCodec<Address>::write(const Address& value, const JsonOptions& options) {
    json j = json::object();
    for (const auto& field : kAddressFields) {
        j[options.property_name(field.name)] = value.*field.member;
    }
    return j;
}

Address JsonCodec<Address>::read(const json& j, const JsonOptions& options) {
    detail::require_object(j);

    Address address;
    for (const auto& item : j.items()) {
        bool known = false;
        for (const auto& field : kAddressFields) {
            if (!options.matches(item.key(), field.name)) continue;
            if (!item.value().is_null()) {
                address.*field.member = detail::read_string(item.value(), item.key());
            }
            known = true;
            break;
        }
        if (!known) detail::throw_unknown_property(item.key());
    }
    return address;
}

} // namespace mc::infrastructure
