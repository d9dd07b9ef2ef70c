// fastget - String Utilities
// String helpers shared by the HTTP layer and the mirror

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace fastget::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    // Splitting
    static std::vector<std::string> split(const std::string& str, char delimiter);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Parsing
    static std::optional<int64_t> parseInt64(const std::string& str);
    static std::optional<uint64_t> parseUInt64(const std::string& str);
};

} // namespace fastget::utils
