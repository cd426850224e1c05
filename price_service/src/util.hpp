#pragma once

#include <optional>
#include <string>
#include <vector>

namespace util {
    std::string current_iso8601();

    // Trimmed, non-empty fields
    std::vector<std::string> split(const std::string& str, char delim);

    // Whole-string decimal parse; nullopt when absent or malformed
    std::optional<double> parse_double(const std::string& str);
}
