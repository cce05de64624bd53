/**
 * @file string_utils.hpp
 * @brief String helpers shared by the docker driver, the broker and the game
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace renju {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Split by any whitespace
     */
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /**
     * @brief Join strings with a delimiter
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Truncate to max_length bytes, appending suffix when cut
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace renju
