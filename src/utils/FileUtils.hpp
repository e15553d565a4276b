// Courier - File Utilities
// File system operations used for download destinations

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace fs = std::filesystem;

namespace courier::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    // Directory operations (throws fs::filesystem_error on failure)
    static void ensureDirectory(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool deleteFile(const fs::path& path);
    static std::int64_t getFileSize(const fs::path& path);

    /**
     * First path in directory not taken yet: "name.ext", then "name (1).ext",
     * "name (2).ext", ...; after 1000 attempts "name_<random>.ext".
     * isReserved marks paths that are promised to someone but not on disk yet.
     */
    static fs::path uniqueFilePath(const fs::path& directory,
                                   const std::string& filename,
                                   const std::function<bool(const fs::path&)>& isReserved = {});

    // Path utilities
    static std::string relativePath(const fs::path& path, const fs::path& base);
};

} // namespace courier::utils
