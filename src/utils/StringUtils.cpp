/**
 * StringUtils.cpp
 *
 * String parsing and formatting utilities.
 */

#include "StringUtils.hpp"

#include <iomanip>
#include <sstream>

namespace ftpget::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Parsing --

std::optional<int64_t> StringUtils::parseLong(const std::string& str) {
    const std::string trimmed = trim(str);
    if (trimmed.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        long long value = std::stoll(trimmed, &consumed);
        if (consumed != trimmed.size()) return std::nullopt;
        return static_cast<int64_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

// -- Formatting --

std::string StringUtils::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatPercentage(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << (value * 100.0) << "%";
    return oss.str();
}

std::string StringUtils::padRight(const std::string& str, size_t length, char padChar) {
    if (str.size() >= length) return str;
    return str + std::string(length - str.size(), padChar);
}

} // namespace ftpget::utils
