// Courier - String Utilities
// String manipulation and formatting

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace courier::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Splitting on runs of whitespace; at most maxParts pieces (0 = no limit),
    // the last piece keeps the rest of the line
    static std::vector<std::string> splitWords(const std::string& str, size_t maxParts = 0);
    static bool startsWith(const std::string& str, const std::string& prefix);

    // Formatting
    static std::string formatBytes(double bytes);
    static std::string formatDuration(double seconds);
    static std::string formatDate(std::chrono::system_clock::time_point time,
                                  const std::string& format = "%Y%m%d");

    // Identifiers
    static std::string generateShortId(size_t length = 8);

    // Validation
    static std::string sanitizeFileName(const std::string& name);

    // Parsing
    static std::optional<int> parseInt(const std::string& str);
};

} // namespace courier::utils
