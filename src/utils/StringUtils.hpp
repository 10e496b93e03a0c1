// ftpget - String Utilities
// String parsing and formatting for the command line front-end

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ftpget::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Parsing
    static std::optional<int64_t> parseLong(const std::string& str);

    // Formatting
    static std::string formatBytes(uint64_t bytes);
    static std::string formatPercentage(double value, int precision = 1);
    static std::string padRight(const std::string& str, size_t length, char padChar = ' ');
};

} // namespace ftpget::utils
