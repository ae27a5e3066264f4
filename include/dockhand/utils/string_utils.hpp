/**
 * @file string_utils.hpp
 * @brief String helpers shared by the runtime client and the translators
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace dockhand {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, keeping empty fields
     *
     * `Split("a::b", ':')` yields {"a", "", "b"}; an empty input yields one
     * empty field. Field positions matter for bind strings and port specs.
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /// Split into non-empty lines (trailing '\r' removed)
    static std::vector<std::string> SplitLines(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Quote argument for /bin/sh
     *
     * Wraps the argument in single quotes; embedded single quotes become
     * `'\''`. The result is safe to splice into a `sh -c` command line.
     */
    static std::string ShellQuote(const std::string& arg);

    /// Human-readable byte count ("1.50 GB")
    static std::string FormatSize(std::uint64_t bytes);
};

} // namespace utils
} // namespace dockhand
