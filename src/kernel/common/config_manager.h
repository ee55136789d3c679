/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Values set explicitly take precedence over environment variables.
 * Thread-safe singleton.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace kernel::common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values log a warning and yield the default.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Get a value that must be present
     * @throws kernel::exception::InfrastructureException CONFIG_MISSING
     */
    std::string getRequired(const std::string& key) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicitly set value
     */
    void remove(const std::string& key);

    /**
     * @brief Load the KERNEL_* keys from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Get environment variable
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys
    static constexpr const char* LOG_LEVEL = "KERNEL_LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "KERNEL_LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "KERNEL_LOG_FILE";
};

} // namespace kernel::common
