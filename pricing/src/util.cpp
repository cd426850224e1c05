#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace util {

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::optional<double> parse_number(const nlohmann::json& value) {
    double parsed = 0.0;
    if (value.is_number()) {
        parsed = value.get<double>();
    } else if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) return std::nullopt;
        try {
            parsed = std::stod(text);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }

    if (!std::isfinite(parsed)) return std::nullopt;
    return parsed;
}

bool is_valid_price(const std::optional<double>& price) {
    return price.has_value() && std::isfinite(*price) && *price > 0.0;
}

bool is_plain_address(const std::string& address) {
    if (address.empty()) return false;
    return std::all_of(address.begin(), address.end(), [](unsigned char c) {
        return c < 0x80 && std::isalnum(c);
    });
}

} // namespace util
