/**
 * @file string_utils.hpp
 * @brief String helpers shared by the backends and the facade
 *
 * Trimming, splitting, shell quoting for commands sent into a sandbox,
 * Base64 for the remote provider's streaming protocol, and random
 * identifiers for sessions and temporary files.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace sandcell {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * **Usage Example**:
 * @code
 * auto quoted = StringUtils::ShellQuote("it's here");   // 'it'\''s here'
 * auto id = "sc-" + StringUtils::RandomHex(12);
 * auto raw = StringUtils::FromBase64("aGVsbG8K");       // "hello\n"
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Manipulation
     ***************************************************************************/

    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Separator character
     * @return Non-empty tokens in order
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Parse a boolean flag the way environment variables spell it
     *
     * Accepts `true/1/yes/on` and `false/0/no/off` (case-insensitive).
     *
     * @param value Raw value
     * @param fallback Returned for empty or unrecognised input
     */
    static bool ParseBool(const std::string& value, bool fallback);

    /***************************************************************************
     * Quoting and Encoding
     ***************************************************************************/

    /**
     * @brief Quote an argument for POSIX `sh`
     *
     * Wraps in single quotes and rewrites embedded quotes as `'\''`, so the
     * result is always one literal word.
     */
    static std::string ShellQuote(const std::string& str);

    static std::string ToBase64(const std::string& str);

    /**
     * @brief Decode Base64, stopping at the first padding or invalid byte
     */
    static std::string FromBase64(const std::string& base64);

    static std::string ToHex(const std::string& bytes);

    /**
     * @brief Random lowercase hex string from OpenSSL's CSPRNG
     * @param length Number of hex characters
     * @throws std::runtime_error if the generator fails
     */
    static std::string RandomHex(std::size_t length);

    /**
     * @brief Truncate for log output, appending a suffix when cut
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace sandcell
