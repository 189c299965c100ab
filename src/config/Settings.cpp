#include "config/Settings.hpp"

#include "domain/value_objects/DistanceUnit.hpp"
#include "domain/value_objects/TemperatureUnit.hpp"
#include "domain/value_objects/VolumeUnit.hpp"
#include "domain/value_objects/WeightUnit.hpp"

#include <cstdlib>

namespace mc::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    if (s == "1" || s == "true" || s == "TRUE" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "FALSE" || s == "no") return false;
    return fallback;
}

// Only taken from the environment when the value parses.
template <typename IsValid>
std::string env_parsed_or(const char* name, const std::string& fallback, IsValid is_valid) {
    std::string val = env_or(name, fallback);
    return is_valid(val) ? val : fallback;
}

} // namespace

infrastructure::JsonOptions Settings::json_options() const {
    infrastructure::JsonOptions options;
    options.naming_policy = infrastructure::try_naming_policy_from_string(json.naming_policy)
                                .value_or(infrastructure::NamingPolicy::CAMEL_CASE);
    options.property_name_case_insensitive = json.case_insensitive;
    return options;
}

Settings Settings::from_environment() {
    std::string env = env_or("MC_ENV", "development");
    Settings s = (env == "production") ? production() : development();

    s.json.naming_policy = env_parsed_or("MC_JSON_NAMING_POLICY", s.json.naming_policy,
                                         [](const std::string& p) {
                                             return infrastructure::try_naming_policy_from_string(p).has_value();
                                         });
    s.json.case_insensitive = env_bool_or("MC_JSON_CASE_INSENSITIVE", s.json.case_insensitive);

    s.format.distance_unit = env_parsed_or("MC_DISTANCE_UNIT", s.format.distance_unit,
                                           domain::is_valid_distance_unit);
    s.format.weight_unit = env_parsed_or("MC_WEIGHT_UNIT", s.format.weight_unit,
                                         domain::is_valid_weight_unit);
    s.format.volume_unit = env_parsed_or("MC_VOLUME_UNIT", s.format.volume_unit,
                                         domain::is_valid_volume_unit);
    s.format.temperature_unit = env_parsed_or("MC_TEMPERATURE_UNIT", s.format.temperature_unit,
                                              domain::is_valid_temperature_unit);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.json.naming_policy = "camelCase";
    s.json.case_insensitive = false;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.json.naming_policy = "camelCase";
    s.json.case_insensitive = true;
    return s;
}

} // namespace mc::config
