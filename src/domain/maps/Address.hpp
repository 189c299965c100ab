#pragma once

#include <string>

namespace mc::domain {

struct Address {
    std::string address_line1;
    std::string address_line2;
    std::string city;
    std::string postal_code;
    std::string state_or_province;
    std::string country;

    static Address empty() { return Address{}; }
    bool is_empty() const { return *this == Address{}; }

    bool operator==(const Address&) const = default;
};

} // namespace mc::domain
