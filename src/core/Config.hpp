#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace ftpget::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Holds the defaults used by the command line tool when building a
 * transfer request: chunk size, transfer flags, FTP credentials and
 * timeouts, logging and progress polling.
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file and merge it over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Set default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"transfer", {
                {"chunkSize", 8192},
                {"binary", true},
                {"overwrite", false},
                {"createDir", true}
            }},
            {"ftp", {
                {"port", 21},
                {"username", "anonymous"},
                {"password", "abc@def.org"},
                {"connectTimeoutSeconds", 30}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""}
            }},
            {"ui", {
                {"pollIntervalMs", 200}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "ftp.username")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Wrong type or malformed key: fall through to default
        }

        return defaultValue;
    }

    /**
     * Get an integer value that must lie in [min, max]
     * @param key Key path (e.g., "ftp.port")
     * @param defaultValue Returned when the key is absent
     * @return The configured value
     * @throws std::out_of_range if the value is not an integer in range
     */
    int64_t getInRange(const std::string& key, int64_t defaultValue,
                       int64_t min, int64_t max) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        json::json_pointer ptr;
        try {
            ptr = toJsonPointer(key);
        } catch (const json::exception&) {
            return defaultValue;
        }
        if (!m_config.contains(ptr)) {
            return defaultValue;
        }

        const json& value = m_config.at(ptr);
        bool inRange = false;
        if (value.is_number_unsigned()) {
            // May exceed int64_t, compare unsigned
            const uint64_t number = value.get<uint64_t>();
            inRange = max >= 0 && number <= static_cast<uint64_t>(max) &&
                      (min <= 0 || number >= static_cast<uint64_t>(min));
        } else if (value.is_number_integer()) {
            const int64_t number = value.get<int64_t>();
            inRange = number >= min && number <= max;
        }

        if (!inRange) {
            throw std::out_of_range(key + " = " + value.dump() + " is not an integer in [" +
                                    std::to_string(min) + ", " + std::to_string(max) + "]");
        }
        return value.get<int64_t>();
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "transfer.chunkSize")
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            return m_config.contains(toJsonPointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Convert dot notation to JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
};

} // namespace ftpget::core
