#include "infrastructure/json/QuantityJson.hpp"

#include <optional>

using namespace mc::domain;

namespace mc::infrastructure {

namespace {

constexpr const char* kValue = "Value";
constexpr const char* kUnit = "Unit";

template <typename Q>
json write_quantity(const Q& quantity, const char* wire_unit, const JsonOptions& options) {
    json j = json::object();
    j[options.property_name(kValue)] = quantity.canonical_value();
    j[options.property_name(kUnit)] = wire_unit;
    return j;
}

template <typename Q>
Q read_quantity(const json& j, const JsonOptions& options) {
    using Traits = typename Q::traits_type;

    detail::require_object(j);

    double value = 0.0;
    auto unit = Traits::canonical_unit;

    for (const auto& item : j.items()) {
        const auto& key = item.key();
        if (options.matches(key, kValue)) {
            value = detail::read_number(item.value(), key);
        } else if (options.matches(key, kUnit)) {
            auto text = detail::read_string(item.value(), key);
            auto parsed = Traits::try_parse(text);
            if (!parsed) {
                throw errors::InvalidUnit(
                    std::string("Invalid ") + Traits::name + " unit: " + text, text);
            }
            unit = *parsed;
        } else {
            detail::throw_unknown_property(key);
        }
    }

    return Q(value, unit);
}

} // namespace

json JsonCodec<Distance>::write(const Distance& value, const JsonOptions& options) {
    return write_quantity(value, "m", options);
}

Distance JsonCodec<Distance>::read(const json& j, const JsonOptions& options) {
    return read_quantity<Distance>(j, options);
}

json JsonCodec<Weight>::write(const Weight& value, const JsonOptions& options) {
    return write_quantity(value, "g", options);
}

Weight JsonCodec<Weight>::read(const json& j, const JsonOptions& options) {
    return read_quantity<Weight>(j, options);
}

// ASCII "m3" on the wire, not the display symbol "m³".
json JsonCodec<Volume>::write(const Volume& value, const JsonOptions& options) {
    return write_quantity(value, "m3", options);
}

Volume JsonCodec<Volume>::read(const json& j, const JsonOptions& options) {
    return read_quantity<Volume>(j, options);
}

// Lower-case "k" on the wire, not the display symbol "K".
json JsonCodec<Temperature>::write(const Temperature& value, const JsonOptions& options) {
    return write_quantity(value, "k", options);
}

Temperature JsonCodec<Temperature>::read(const json& j, const JsonOptions& options) {
    return read_quantity<Temperature>(j, options);
}

json JsonCodec<TemperatureRange>::write(const TemperatureRange& value, const JsonOptions& options) {
    json j = json::object();
    j[options.property_name("Min")] = JsonCodec<Temperature>::write(value.min(), options);
    j[options.property_name("Max")] = JsonCodec<Temperature>::write(value.max(), options);
    return j;
}

TemperatureRange JsonCodec<TemperatureRange>::read(const json& j, const JsonOptions& options) {
    detail::require_object(j);

    std::optional<Temperature> min;
    std::optional<Temperature> max;

    for (const auto& item : j.items()) {
        if (options.matches(item.key(), "Min")) {
            min = JsonCodec<Temperature>::read(item.value(), options);
        } else if (options.matches(item.key(), "Max")) {
            max = JsonCodec<Temperature>::read(item.value(), options);
        } else {
            detail::throw_unknown_property(item.key());
        }
    }

    if (!min) detail::throw_missing_property(options.property_name("Min"));
    if (!max) detail::throw_missing_property(options.property_name("Max"));
    return TemperatureRange(*min, *max);
}

} // namespace mc::infrastructure
