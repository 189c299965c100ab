#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mc::domain {

enum class VolumeUnit {
    CUBIC_CENTIMETER,
    CUBIC_METER,
    CUBIC_FEET,
    LITER,
    MILLILITER,
    GALLON
};

// Both the superscript ("m³") and ASCII ("m3") spellings are accepted.
VolumeUnit volume_unit_from_string(std::string_view text);
std::optional<VolumeUnit> try_volume_unit_from_string(std::string_view text);
bool is_valid_volume_unit(std::string_view text);

// Display symbol, e.g. "m³".
std::string to_string(VolumeUnit unit);

} // namespace mc::domain
