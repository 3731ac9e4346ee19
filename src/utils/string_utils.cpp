/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "coderun/utils/string_utils.hpp"

#include <sstream>

namespace coderun {
namespace utils {

std::string StringUtils::Trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream stream(str);
    std::string part;
    while (std::getline(stream, part, delimiter)) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

bool StringUtils::Truncate(std::string& str, std::size_t max_bytes) {
    if (str.size() <= max_bytes) {
        return false;
    }
    str.resize(max_bytes);
    return true;
}

std::string StringUtils::FormatCommand(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        if (argv[i].empty() || argv[i].find_first_of(" \t\"'") != std::string::npos) {
            oss << '"' << argv[i] << '"';
        } else {
            oss << argv[i];
        }
    }
    return oss.str();
}

bool StringUtils::IsPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

} // namespace utils
} // namespace coderun
