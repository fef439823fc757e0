#ifndef DESKPILOT_CONFIG_MANAGER_H
#define DESKPILOT_CONFIG_MANAGER_H

#include <string>
#include <mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace deskpilot {

/**
 * @brief Process configuration backed by a JSON document
 *
 * Keys missing from the loaded file fall back to the built in defaults, so a
 * partial configuration file is valid.
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& configPath = "config/deskpilot.json");
    bool saveConfig(const std::string& configPath = "config/deskpilot.json") const;
    void resetToDefaults();

    // Logging Configuration
    std::string getLogFile() const;
    std::string getLogLevel() const;
    int getLogMaxSizeMb() const;
    int getLogMaxFiles() const;
    std::string getLogFormat() const;
    bool getLogAsync() const;

    // Storage Configuration
    std::string getScriptsDirectory() const;
    std::string getTemplatesDirectory() const;
    std::string getScreenshotsDirectory() const;

    // Execution engine Configuration
    int getMaxTransitionsPerIteration() const;
    int getMaxLogEntries() const;
    int getPausePollIntervalMs() const;
    double getDefaultMatchThreshold() const;

    // Input Configuration
    int getClickDelayMs() const;
    int getDoubleClickIntervalMs() const;
    int getKeystrokeDelayMs() const;

    std::string getConfigPath() const;

    /**
     * @brief Read a value by dotted path, e.g. "engine.max_log_entries"
     * @throws std::runtime_error when the path does not exist
     */
    template<typename T>
    T get(const std::string& path) const;

    template<typename T>
    void set(const std::string& path, const T& value);

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    mutable std::mutex m_mutex;
    nlohmann::json m_config;
    std::string m_configPath;

    static nlohmann::json defaults();
    static nlohmann::json::json_pointer toPointer(const std::string& path);

    template<typename T>
    T getOr(const char* section, const char* key, const T& fallback) const;
};

template<typename T>
T ConfigManager::get(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto pointer = toPointer(path);
    if (m_config.contains(pointer)) {
        return m_config.at(pointer).get<T>();
    }
    throw std::runtime_error("Configuration key not found: " + path);
}

template<typename T>
void ConfigManager::set(const std::string& path, const T& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config[toPointer(path)] = value;
}

template<typename T>
T ConfigManager::getOr(const char* section, const char* key, const T& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_config.contains(section) && m_config[section].is_object() && m_config[section].contains(key)) {
        try {
            return m_config[section][key].get<T>();
        } catch (const nlohmann::json::exception&) {
            return fallback;
        }
    }
    return fallback;
}

} // namespace deskpilot

#endif // DESKPILOT_CONFIG_MANAGER_H
