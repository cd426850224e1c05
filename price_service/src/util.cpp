#include "util.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::istringstream stream(str);
    std::string part;
    while (std::getline(stream, part, delim)) {
        auto first = part.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        auto last = part.find_last_not_of(" \t");
        parts.push_back(part.substr(first, last - first + 1));
    }
    return parts;
}

std::optional<double> parse_double(const std::string& str) {
    if (str.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        double value = std::stod(str, &consumed);
        if (consumed != str.size() || !std::isfinite(value)) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace util
