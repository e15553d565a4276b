/**
 * FileUtils.cpp
 *
 * File system helpers.
 */

#include "FileUtils.hpp"
#include "StringUtils.hpp"

#include <system_error>

namespace courier::utils {

void FileUtils::ensureDirectory(const fs::path& path) {
    if (!fs::is_directory(path)) {
        fs::create_directories(path);
    }
}

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<std::int64_t>(size);
}

fs::path FileUtils::uniqueFilePath(const fs::path& directory,
                                   const std::string& filename,
                                   const std::function<bool(const fs::path&)>& isReserved) {
    auto taken = [&isReserved](const fs::path& candidate) {
        std::error_code ec;
        return fs::exists(candidate, ec) || (isReserved && isReserved(candidate));
    };

    auto candidate = directory / filename;
    if (!taken(candidate)) {
        return candidate;
    }

    const fs::path name(filename);
    const std::string stem = name.stem().string();
    const std::string extension = name.extension().string();

    for (int counter = 1; counter <= 1000; ++counter) {
        candidate = directory / (stem + " (" + std::to_string(counter) + ")" + extension);
        if (!taken(candidate)) {
            return candidate;
        }
    }

    return directory / (stem + "_" + StringUtils::generateShortId() + extension);
}

std::string FileUtils::relativePath(const fs::path& path, const fs::path& base) {
    std::error_code ec;
    auto rel = fs::relative(path, base, ec);
    return ec || rel.empty() ? path.string() : rel.generic_string();
}

} // namespace courier::utils
