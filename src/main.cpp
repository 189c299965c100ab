#include "api/ApiResponse.hpp"
#include "config/Settings.hpp"
#include "domain/value_objects/Distance.hpp"
#include "domain/value_objects/Temperature.hpp"
#include "domain/value_objects/Volume.hpp"
#include "domain/value_objects/Weight.hpp"
#include "errors/Errors.hpp"
#include "infrastructure/json/ApiResponseJson.hpp"
#include "infrastructure/json/QuantityJson.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInput = 2;

void print_usage() {
    std::cerr << "Usage: measure_cli convert <kind> <value> <unit> [target-unit]" << std::endl;
    std::cerr << "       measure_cli encode <kind> <value> <unit>" << std::endl;
    std::cerr << "       measure_cli decode <kind> '<json>'" << std::endl;
    std::cerr << "       <kind> is one of distance, weight, volume, temperature." << std::endl;
}

template <typename Q>
std::string display_unit(const mc::config::FormatSettings& format) {
    if constexpr (std::is_same_v<Q, mc::domain::Distance>) return format.distance_unit;
    else if constexpr (std::is_same_v<Q, mc::domain::Weight>) return format.weight_unit;
    else if constexpr (std::is_same_v<Q, mc::domain::Volume>) return format.volume_unit;
    else return format.temperature_unit;
}

double parse_value(const std::string& text) {
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Not a number: " + text);
    }
    if (consumed != text.size()) throw std::invalid_argument("Not a number: " + text);
    return value;
}

template <typename Q>
typename Q::unit_type parse_unit(const std::string& text) {
    using Traits = typename Q::traits_type;
    auto unit = Traits::try_parse(text);
    if (!unit) {
        throw mc::errors::InvalidUnit(std::string("Invalid ") + Traits::name + " unit: " + text, text);
    }
    return *unit;
}

template <typename Q>
void print_envelope(const mc::api::ApiResponse<Q>& response,
                    const mc::infrastructure::JsonOptions& options) {
    std::cout << "[json] " << mc::infrastructure::to_json_string(response, options) << std::endl;
}

template <typename Q>
int run(const std::string& command, const std::vector<std::string>& args,
        const mc::config::Settings& settings) {
    auto options = settings.json_options();

    try {
        Q quantity;
        if (command == "convert") {
            if (args.size() < 2 || args.size() > 3) {
                print_usage();
                return kExitUsage;
            }
            quantity = Q(parse_value(args[0]), parse_unit<Q>(args[1]));
            std::string target = args.size() == 3 ? args[2] : display_unit<Q>(settings.format);
            std::cout << "[convert] " << args[0] << " " << args[1] << " = "
                      << quantity.to_string(target) << std::endl;
        } else if (command == "encode") {
            if (args.size() != 2) {
                print_usage();
                return kExitUsage;
            }
            quantity = Q(parse_value(args[0]), parse_unit<Q>(args[1]));
        } else if (command == "decode") {
            if (args.size() != 1) {
                print_usage();
                return kExitUsage;
            }
            quantity = mc::infrastructure::from_json_string<Q>(args[0], options);
            std::cout << "[convert] " << quantity.to_string(display_unit<Q>(settings.format))
                      << std::endl;
        } else {
            print_usage();
            return kExitUsage;
        }

        print_envelope(mc::api::ApiResponse<Q>::success(quantity), options);
        return kExitOk;
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << std::endl;
        print_envelope(mc::api::ApiResponse<Q>::error(400, e.what()), options);
        return kExitInput;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return kExitUsage;
    }

    auto settings = mc::config::Settings::from_environment();

    std::string command = argv[1];
    std::string kind = argv[2];
    std::vector<std::string> args(argv + 3, argv + argc);

    if (kind == "distance") return run<mc::domain::Distance>(command, args, settings);
    if (kind == "weight") return run<mc::domain::Weight>(command, args, settings);
    if (kind == "volume") return run<mc::domain::Volume>(command, args, settings);
    if (kind == "temperature") return run<mc::domain::Temperature>(command, args, settings);

    std::cerr << "Unknown kind: " << kind << std::endl;
    print_usage();
    return kExitUsage;
}
