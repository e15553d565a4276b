#pragma once

/**
 * Config.hpp
 *
 * JSON configuration with defaults, file loading and environment overrides.
 * Keys are dot paths ("downloads.maxConcurrent").
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <mutex>
#include <optional>
#include <string>

namespace courier::core {

using json = nlohmann::json;

/**
 * Configuration manager - thread-safe singleton
 */
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Merge a JSON file over the current values
     * @return false if the file is missing or not valid JSON
     */
    bool load(const std::string& path);

    /**
     * Write the current values (pretty-printed)
     * @param path Target file; empty means the file last loaded
     */
    bool save(const std::string& path = "");

    /**
     * Replace everything with the built-in defaults
     */
    void setDefaults();

    /**
     * Apply DOWNLOAD_PATH, MAX_CONCURRENT_DOWNLOADS, MAX_RETRIES,
     * UPDATE_INTERVAL (seconds) and LOG_LEVEL when set
     */
    void loadEnvironment();

    /**
     * Value at key, or defaultValue when missing or of another type
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            const auto ptr = pointerFor(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Mistyped value
        }
        return defaultValue;
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            m_config[pointerFor(key)] = value;
        } catch (const json::exception& e) {
            LOG_WARN("Cannot set configuration key {}: {}", key, e.what());
        }
    }

    bool has(const std::string& key) const;

    /**
     * Integer environment variable; unset or malformed values give nullopt
     * (malformed ones are logged)
     */
    static std::optional<int> envInt(const char* name);

private:
    Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json::json_pointer pointerFor(const std::string& key);

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace courier::core
