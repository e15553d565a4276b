/**
 * Config.cpp
 */

#include "Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace courier::core {

Config::Config() {
    setDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    json loaded;
    try {
        loaded = json::parse(file);
    } catch (const json::parse_error& e) {
        LOG_ERROR("Invalid configuration file {}: {}", path, e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_config.merge_patch(loaded);
    m_configPath = path;
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const std::string target = path.empty() ? m_configPath : path;
    if (target.empty()) {
        return false;
    }

    std::error_code ec;
    const auto parent = std::filesystem::path(target).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(target, std::ios::trunc);
    if (!file.is_open()) {
        LOG_ERROR("Failed to save configuration to {}", target);
        return false;
    }
    file << m_config.dump(4) << '\n';
    return static_cast<bool>(file);
}

void Config::setDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_config = {
        {"version", "1.0.0"},
        {"downloads", {
            {"directory", "downloads"},
            {"maxConcurrent", 5},
            {"maxRetries", 3},
            {"progressThrottleMs", 1000},
            {"cleanupDelaySeconds", 5},
            {"staleAfterSeconds", 30},
            {"sweepIntervalSeconds", 10},
            {"timeoutSeconds", 0}
        }},
        {"logging", {
            {"level", "info"},
            {"directory", "logs"}
        }}
    };
}

void Config::loadEnvironment() {
    if (const char* path = std::getenv("DOWNLOAD_PATH"); path && *path) {
        set("downloads.directory", std::string(path));
    }
    if (auto value = envInt("MAX_CONCURRENT_DOWNLOADS")) {
        set("downloads.maxConcurrent", *value);
    }
    if (auto value = envInt("MAX_RETRIES")) {
        set("downloads.maxRetries", *value);
    }
    if (auto seconds = envInt("UPDATE_INTERVAL")) {
        set("downloads.progressThrottleMs", *seconds * 1000);
    }
    if (const char* level = std::getenv("LOG_LEVEL"); level && *level) {
        set("logging.level", std::string(level));
    }
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        return m_config.contains(pointerFor(key));
    } catch (const json::exception&) {
        return false;
    }
}

std::optional<int> Config::envInt(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) {
        return std::nullopt;
    }

    const std::string text(raw);
    try {
        std::size_t consumed = 0;
        const int value = std::stoi(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range, reported below
    }

    LOG_WARN("Ignoring {}='{}': not an integer", name, text);
    return std::nullopt;
}

json::json_pointer Config::pointerFor(const std::string& key) {
    std::string pointer = "/" + key;
    for (auto& c : pointer) {
        if (c == '.') {
            c = '/';
        }
    }
    return json::json_pointer(pointer);
}

} // namespace courier::core
