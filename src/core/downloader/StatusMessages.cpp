/**
 * StatusMessages.cpp
 */

#include "StatusMessages.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <spdlog/fmt/fmt.h>

namespace courier::core::downloader {

using utils::StringUtils;

std::string StatusMessages::queued(const std::string& filename, size_t position,
                                   const std::string& taskId, bool firstNotice) {
    std::string text = fmt::format(
        "📋 Queued for Download\n"
        "File: {}\n"
        "Position: #{}\n"
        "Download ID: {}\n",
        filename, position, taskId);
    if (firstNotice) {
        text += "Download will start automatically when a slot is available.\n";
    }
    text += fmt::format("To cancel: cancel {}", taskId);
    return text;
}

std::string StatusMessages::starting(const std::string& filename, const std::string& taskId) {
    return fmt::format(
        "⏬ Downloading: {}\n"
        "🔄 Initializing download...\n"
        "🔢 Download ID: {}",
        filename, taskId);
}

std::string StatusMessages::progress(const DownloadTask& task) {
    const std::uint64_t downloaded = task.downloaded.load();
    const std::uint64_t size = task.size.load();
    const double speed = task.speed.load();

    if (task.initialPhase.load() && downloaded == 0) {
        return fmt::format(
            "⏬ Downloading: {}\n"
            "🔄 Establishing connection...\n"
            "⏱️ This might take a moment for large files\n"
            "🔢 Download ID: {}",
            task.filename, task.id);
    }

    int percentage = 0;
    if (size > 0) {
        percentage = static_cast<int>(std::min<std::uint64_t>(downloaded * 100 / size, 100));
    }
    const int filled = kBarWidth * percentage / 100;

    std::string bar;
    for (int i = 0; i < kBarWidth; ++i) {
        bar += i < filled ? "█" : "░";
    }

    std::string text = fmt::format(
        "⏬ Downloading: {}\n"
        "🔄 Progress: |{}| {}%\n"
        "📊 {}",
        task.filename, bar, percentage, StringUtils::formatBytes(static_cast<double>(downloaded)));

    if (size > 0) {
        text += fmt::format(" of {}\n", StringUtils::formatBytes(static_cast<double>(size)));
    } else {
        text += " downloaded\n";
    }

    text += fmt::format("🚀 Speed: {}/s", StringUtils::formatBytes(speed));
    if (size > 0 && speed > 0) {
        std::string eta = "unknown";
        if (size > downloaded) {
            eta = StringUtils::formatDuration(static_cast<double>(size - downloaded) / speed);
        }
        text += fmt::format(", ETA: {}", eta);
    }

    text += fmt::format("\n🔢 Download ID: {}", task.id);
    return text;
}

std::string StatusMessages::rateLimited(int waitSeconds, int attempt, int maxAttempts) {
    return fmt::format(
        "⏳ Rate limited. Waiting {} seconds...\n"
        "Attempt {}/{}",
        waitSeconds, attempt, maxAttempts);
}

std::string StatusMessages::formatFolderDate(const std::string& folder) {
    if (folder.size() == 8 &&
        std::all_of(folder.begin(), folder.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return folder.substr(0, 4) + "-" + folder.substr(4, 2) + "-" + folder.substr(6, 2);
    }
    return folder;
}

std::string StatusMessages::completed(const std::string& relativePath, std::uint64_t size) {
    const std::filesystem::path rel(relativePath);
    return fmt::format(
        "✅ Download Complete\n"
        "File: {}\n"
        "Folder: {}\n"
        "Size: {}\n"
        "Path: {}",
        rel.filename().string(),
        formatFolderDate(rel.parent_path().generic_string()),
        StringUtils::formatBytes(static_cast<double>(size)),
        relativePath);
}

std::string StatusMessages::cancelled(const std::string& filename) {
    return fmt::format("🛑 Download cancelled: {}", filename);
}

std::string StatusMessages::failed(const std::string& reason) {
    return fmt::format("❌ Download failed: {}", reason);
}

} // namespace courier::core::downloader
