#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace util {
    std::string to_lower(const std::string& str);
    std::string to_upper(const std::string& str);

    // Number or numeric string; empty, unparsable and non-finite give nullopt
    std::optional<double> parse_number(const nlohmann::json& value);

    bool is_valid_price(const std::optional<double>& price);

    // Hex (0x...) or base58 contract address: ASCII letters and digits only
    bool is_plain_address(const std::string& address);
}
