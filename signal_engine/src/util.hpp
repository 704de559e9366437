#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace util {
    std::string to_iso8601(std::chrono::system_clock::time_point tp);
    std::string trim(const std::string& str);
    std::string to_upper(const std::string& str);
    std::vector<std::string> split_whitespace(const std::string& str);
    std::string join(const std::vector<std::string>& parts, const std::string& sep);
}
