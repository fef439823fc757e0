#include "config_manager.h"
#include "structured_logger.h"
#include "file_utils.h"
#include "json_utils.h"

namespace deskpilot {

ConfigManager::ConfigManager()
    : m_config(defaults()) {
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

nlohmann::json ConfigManager::defaults() {
    return nlohmann::json{
        {"logging", {
            {"level", "INFO"},
            {"file", "logs/deskpilot.log"},
            {"max_size_mb", 10},
            {"max_files", 5},
            {"format", "text"},
            {"async", false}
        }},
        {"storage", {
            {"scripts_dir", "Data/Scripts"},
            {"templates_dir", "Data/Templates"},
            {"screenshots_dir", "Screenshots"}
        }},
        {"engine", {
            {"max_transitions_per_iteration", 1000},
            {"max_log_entries", 1000},
            {"pause_poll_interval_ms", 100},
            {"default_match_threshold", 0.8}
        }},
        {"input", {
            {"click_delay_ms", 10},
            {"double_click_interval_ms", 50},
            {"keystroke_delay_ms", 10}
        }}
    };
}

nlohmann::json::json_pointer ConfigManager::toPointer(const std::string& path) {
    std::string pointer = "/";
    for (char c : path) {
        pointer += (c == '.') ? '/' : c;
    }
    return nlohmann::json::json_pointer(pointer);
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    nlohmann::json loaded;
    bool exists = utils::FileUtils::fileExists(configPath);

    if (exists && utils::FileUtils::loadJsonFromFile(configPath, loaded) && loaded.is_object()) {
        nlohmann::json merged;
        utils::JsonUtils::mergeJsonObjects(defaults(), loaded, merged);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_config = merged;
            m_configPath = configPath;
        }
        SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
        m_configPath = configPath;
    }

    if (exists) {
        SLOG_ERROR().message("Config file is not a valid JSON object, using defaults")
            .context("config_path", configPath);
        return false;
    }

    SLOG_WARNING().message("Config file not found, writing defaults").context("config_path", configPath);
    return saveConfig(configPath);
}

bool ConfigManager::saveConfig(const std::string& configPath) const {
    nlohmann::json snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshot = m_config;
    }

    if (utils::FileUtils::saveJsonToFile(configPath, snapshot)) {
        SLOG_INFO().message("Configuration saved").context("config_path", configPath);
        return true;
    }

    SLOG_ERROR().message("Failed to save configuration").context("config_path", configPath);
    return false;
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = defaults();
}

// Logging Configuration
std::string ConfigManager::getLogFile() const {
    return getOr<std::string>("logging", "file", "logs/deskpilot.log");
}

std::string ConfigManager::getLogLevel() const {
    return getOr<std::string>("logging", "level", "INFO");
}

int ConfigManager::getLogMaxSizeMb() const {
    return getOr<int>("logging", "max_size_mb", 10);
}

int ConfigManager::getLogMaxFiles() const {
    return getOr<int>("logging", "max_files", 5);
}

std::string ConfigManager::getLogFormat() const {
    return getOr<std::string>("logging", "format", "text");
}

bool ConfigManager::getLogAsync() const {
    return getOr<bool>("logging", "async", false);
}

// Storage Configuration
std::string ConfigManager::getScriptsDirectory() const {
    return getOr<std::string>("storage", "scripts_dir", "Data/Scripts");
}

std::string ConfigManager::getTemplatesDirectory() const {
    return getOr<std::string>("storage", "templates_dir", "Data/Templates");
}

std::string ConfigManager::getScreenshotsDirectory() const {
    return getOr<std::string>("storage", "screenshots_dir", "Screenshots");
}

// Execution engine Configuration
int ConfigManager::getMaxTransitionsPerIteration() const {
    return getOr<int>("engine", "max_transitions_per_iteration", 1000);
}

int ConfigManager::getMaxLogEntries() const {
    return getOr<int>("engine", "max_log_entries", 1000);
}

int ConfigManager::getPausePollIntervalMs() const {
    return getOr<int>("engine", "pause_poll_interval_ms", 100);
}

double ConfigManager::getDefaultMatchThreshold() const {
    return getOr<double>("engine", "default_match_threshold", 0.8);
}

// Input Configuration
int ConfigManager::getClickDelayMs() const {
    return getOr<int>("input", "click_delay_ms", 10);
}

int ConfigManager::getDoubleClickIntervalMs() const {
    return getOr<int>("input", "double_click_interval_ms", 50);
}

int ConfigManager::getKeystrokeDelayMs() const {
    return getOr<int>("input", "keystroke_delay_ms", 10);
}

std::string ConfigManager::getConfigPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configPath;
}

} // namespace deskpilot
