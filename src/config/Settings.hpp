#pragma once

#include "infrastructure/json/JsonOptions.hpp"

#include <string>

namespace mc::config {

struct JsonSettings {
    std::string naming_policy = "camelCase";  // see naming_policy_from_string
    bool case_insensitive = false;
};

// Display units, as unit strings, used when printing values.
struct FormatSettings {
    std::string distance_unit = "m";
    std::string weight_unit = "g";
    std::string volume_unit = "m3";
    std::string temperature_unit = "C";
};

struct Settings {
    JsonSettings json;
    FormatSettings format;

    // Falls back to camelCase when naming_policy does not parse.
    infrastructure::JsonOptions json_options() const;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace mc::config
