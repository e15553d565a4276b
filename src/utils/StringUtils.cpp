/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace courier::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- Split --

std::vector<std::string> StringUtils::splitWords(const std::string& str, size_t maxParts) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < str.size()) {
        pos = str.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) break;

        if (maxParts != 0 && parts.size() + 1 == maxParts) {
            parts.push_back(trim(str.substr(pos)));
            break;
        }

        auto end = str.find_first_of(" \t", pos);
        if (end == std::string::npos) end = str.size();
        parts.push_back(str.substr(pos, end - pos));
        pos = end;
    }
    return parts;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(double bytes) {
    if (bytes < 0) return "0 B";

    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = bytes;
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }

    std::ostringstream oss;
    if (unit == 0) {
        oss << static_cast<std::int64_t>(size) << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    }
    return oss.str();
}

std::string StringUtils::formatDuration(double seconds) {
    if (seconds < 0) return "0 sec";

    auto total = static_cast<std::int64_t>(seconds);
    std::ostringstream oss;
    if (total < 60) {
        oss << total << " sec";
    } else if (total < 3600) {
        oss << total / 60 << " min " << total % 60 << " sec";
    } else {
        oss << total / 3600 << " hr " << (total % 3600) / 60 << " min";
    }
    return oss.str();
}

std::string StringUtils::formatDate(std::chrono::system_clock::time_point time, const std::string& format) {
    auto tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

// -- Identifiers --

std::string StringUtils::generateShortId(size_t length) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    static const char hex[] = "0123456789abcdef";

    std::string id(length, '0');
    for (auto& c : id) {
        c = hex[dis(gen)];
    }
    return id;
}

// -- Validation --

std::string StringUtils::sanitizeFileName(const std::string& name) {
    // Keep only the last path component
    std::string base = name;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    std::string result;
    result.reserve(base.size());
    for (char c : base) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || std::string_view("<>:\"/\\|?*").find(c) != std::string_view::npos) {
            result += '_';
        } else {
            result += c;
        }
    }

    auto start = result.find_first_not_of(". ");
    if (start == std::string::npos) return "unnamed_file";
    auto end = result.find_last_not_of(". ");
    return result.substr(start, end - start + 1);
}

// -- Parsing --

std::optional<int> StringUtils::parseInt(const std::string& str) {
    try {
        size_t consumed = 0;
        int value = std::stoi(str, &consumed);
        if (consumed == str.size()) return value;
    } catch (const std::exception&) {
        // Not a number
    }
    return std::nullopt;
}

} // namespace courier::utils
