#include "domain/value_objects/WeightUnit.hpp"

#include "domain/value_objects/UnitText.hpp"
#include "errors/Errors.hpp"

namespace mc::domain {

namespace {

constexpr std::array<UnitAlias<WeightUnit>, 33> kAliases{{
    {"\xC2\xB5g", WeightUnit::MICROGRAM}, {"microgram", WeightUnit::MICROGRAM},
    {"micrograms", WeightUnit::MICROGRAM},
    {"mg", WeightUnit::MILLIGRAM}, {"milligram", WeightUnit::MILLIGRAM},
    {"milligrams", WeightUnit::MILLIGRAM},
    {"g", WeightUnit::GRAM}, {"gram", WeightUnit::GRAM}, {"grams", WeightUnit::GRAM},
    {"kg", WeightUnit::KILOGRAM}, {"kilogram", WeightUnit::KILOGRAM},
    {"kilograms", WeightUnit::KILOGRAM},
    {"t", WeightUnit::TON}, {"ton", WeightUnit::TON}, {"tons", WeightUnit::TON},
    {"lb", WeightUnit::POUND}, {"pound", WeightUnit::POUND}, {"pounds", WeightUnit::POUND},
    {"oz", WeightUnit::OUNCE}, {"ounce", WeightUnit::OUNCE}, {"ounces", WeightUnit::OUNCE},
    {"st.", WeightUnit::STONE}, {"stone", WeightUnit::STONE}, {"stones", WeightUnit::STONE},
    {"ct", WeightUnit::CARAT}, {"carat", WeightUnit::CARAT}, {"carats", WeightUnit::CARAT},
    {"lt", WeightUnit::LONG_TON}, {"longton", WeightUnit::LONG_TON},
    {"longtons", WeightUnit::LONG_TON},
    {"st", WeightUnit::SHORT_TON}, {"shortton", WeightUnit::SHORT_TON},
    {"shorttons", WeightUnit::SHORT_TON},
}};

} // namespace

std::optional<WeightUnit> try_weight_unit_from_string(std::string_view text) {
    return find_alias(kAliases, normalize_unit_text(text));
}

WeightUnit weight_unit_from_string(std::string_view text) {
    if (auto unit = try_weight_unit_from_string(text)) return *unit;
    throw errors::InvalidUnit("Invalid weight unit: " + std::string(text), std::string(text));
}

bool is_valid_weight_unit(std::string_view text) {
    return try_weight_unit_from_string(text).has_value();
}

std::string to_string(WeightUnit unit) {
    switch (unit) {
        case WeightUnit::MICROGRAM: return "\xC2\xB5g";
        case WeightUnit::MILLIGRAM: return "mg";
        case WeightUnit::GRAM: return "g";
        case WeightUnit::KILOGRAM: return "kg";
        case WeightUnit::TON: return "t";
        case WeightUnit::POUND: return "lb";
        case WeightUnit::OUNCE: return "oz";
        case WeightUnit::STONE: return "st.";
        case WeightUnit::CARAT: return "ct";
        case WeightUnit::LONG_TON: return "lt";
        case WeightUnit::SHORT_TON: return "st";
    }
    auto raw = std::to_string(static_cast<int>(unit));
    throw errors::InvalidUnit("Invalid weight unit: " + raw, raw);
}

} // namespace mc::domain
