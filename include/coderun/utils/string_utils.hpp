/**
 * @file string_utils.hpp
 * @brief Small string helpers shared by drivers and reporters
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace coderun {
namespace utils {

class StringUtils {
public:
    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    /// Split on a delimiter, dropping empty pieces
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Cut a string down to at most max_bytes
     * @return true if bytes were removed
     */
    static bool Truncate(std::string& str, std::size_t max_bytes);

    /**
     * @brief Render argv for log lines, quoting arguments with spaces
     */
    static std::string FormatCommand(const std::vector<std::string>& argv);

    /**
     * @brief Check that a name is a plain file name (no separators, not "." or "..")
     */
    static bool IsPlainFileName(const std::string& name);
};

} // namespace utils
} // namespace coderun
