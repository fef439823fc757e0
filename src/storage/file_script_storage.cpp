#include "file_script_storage.h"
#include "../common/error_handler.h"
#include "../common/file_utils.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <filesystem>

namespace deskpilot {

namespace {
    // Ids become file names, so anything that could leave the directory is refused
    bool isSafeId(const std::string& id) {
        return !id.empty() && id != "." && id != ".." &&
               id.find_first_of("/\\:") == std::string::npos;
    }

    std::string joinPath(const std::string& directory, const std::string& fileName) {
        return (std::filesystem::path(directory) / fileName).string();
    }

    template<typename T>
    void sortByName(std::vector<T>& items) {
        std::stable_sort(items.begin(), items.end(), [](const T& a, const T& b) {
            return a.name < b.name;
        });
    }
}

FileScriptStorage::FileScriptStorage(const std::string& scriptsDirectory, const std::string& templatesDirectory)
    : m_scriptsDirectory(scriptsDirectory)
    , m_templatesDirectory(templatesDirectory) {
    if (!utils::FileUtils::createDirectoryIfNotExists(m_scriptsDirectory) ||
        !utils::FileUtils::createDirectoryIfNotExists(m_templatesDirectory)) {
        DESKPILOT_THROW(ErrorType::STORAGE_ERROR, ErrorSeverity::HIGH,
                        "Failed to create storage directories",
                        m_scriptsDirectory + ", " + m_templatesDirectory, "FileScriptStorage");
    }
    SLOG_INFO().message("File script storage ready")
        .component("storage")
        .context("scripts_dir", m_scriptsDirectory)
        .context("templates_dir", m_templatesDirectory);
}

std::string FileScriptStorage::scriptPath(const std::string& id) const {
    return joinPath(m_scriptsDirectory, id + ".json");
}

std::string FileScriptStorage::templatePath(const std::string& id) const {
    return joinPath(m_templatesDirectory, id + ".json");
}

std::string FileScriptStorage::templateImagePath(const std::string& id) const {
    return joinPath(m_templatesDirectory, id + ".png");
}

std::optional<AutomationScript> FileScriptStorage::loadScriptFile(const std::string& path) const {
    nlohmann::json document;
    if (!utils::FileUtils::loadJsonFromFile(path, document)) {
        return std::nullopt;
    }

    try {
        return document.get<AutomationScript>();
    } catch (const std::exception& e) {
        SLOG_WARNING().message("Unreadable script document")
            .component("storage")
            .context("path", path)
            .context("error", e.what());
        return std::nullopt;
    }
}

std::optional<TemplateImage> FileScriptStorage::loadTemplateFile(const std::string& path) const {
    nlohmann::json document;
    if (!utils::FileUtils::loadJsonFromFile(path, document)) {
        return std::nullopt;
    }

    TemplateImage image;
    try {
        image = document.get<TemplateImage>();
    } catch (const std::exception& e) {
        SLOG_WARNING().message("Unreadable template document")
            .component("storage")
            .context("path", path)
            .context("error", e.what());
        return std::nullopt;
    }

    if (!image.filePath.empty() && utils::FileUtils::fileExists(image.filePath)) {
        if (!utils::FileUtils::readBinaryFile(image.filePath, image.imageData)) {
            SLOG_WARNING().message("Template image bytes could not be read")
                .component("storage")
                .context("template_id", image.id)
                .context("path", image.filePath);
        }
    }
    return image;
}

std::optional<AutomationScript> FileScriptStorage::getScript(const std::string& id) {
    if (!isSafeId(id)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::string path = scriptPath(id);
    if (!utils::FileUtils::fileExists(path)) {
        SLOG_DEBUG().message("Script file not found").component("storage").context("script_id", id);
        return std::nullopt;
    }
    return loadScriptFile(path);
}

std::vector<AutomationScript> FileScriptStorage::getAllScripts() {
    std::vector<AutomationScript> scripts;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& path : utils::FileUtils::listFiles(m_scriptsDirectory, ".json")) {
            if (auto script = loadScriptFile(path)) {
                scripts.push_back(std::move(*script));
            }
        }
    }
    sortByName(scripts);
    return scripts;
}

std::string FileScriptStorage::saveScript(const AutomationScript& script) {
    AutomationScript stored = script;
    if (stored.id.empty()) {
        stored.id = generateId();
    }
    if (!isSafeId(stored.id)) {
        DESKPILOT_THROW(ErrorType::VALIDATION_ERROR, ErrorSeverity::MEDIUM,
                        "Invalid script id: " + stored.id, "", "FileScriptStorage::saveScript");
    }
    stored.modifiedAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!utils::FileUtils::saveJsonToFile(scriptPath(stored.id), nlohmann::json(stored))) {
        DESKPILOT_THROW(ErrorType::STORAGE_ERROR, ErrorSeverity::HIGH,
                        "Failed to save script " + stored.id, scriptPath(stored.id),
                        "FileScriptStorage::saveScript");
    }
    SLOG_DEBUG().message("Script saved").component("storage").context("script_id", stored.id);
    return stored.id;
}

bool FileScriptStorage::deleteScript(const std::string& id) {
    if (!isSafeId(id)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::string path = scriptPath(id);
    if (!utils::FileUtils::fileExists(path)) {
        return false;
    }
    if (!utils::FileUtils::removeFile(path)) {
        DESKPILOT_THROW(ErrorType::STORAGE_ERROR, ErrorSeverity::MEDIUM,
                        "Failed to delete script " + id, path, "FileScriptStorage::deleteScript");
    }
    return true;
}

std::optional<TemplateImage> FileScriptStorage::getTemplateImage(const std::string& id) {
    if (!isSafeId(id)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::string path = templatePath(id);
    if (!utils::FileUtils::fileExists(path)) {
        SLOG_DEBUG().message("Template file not found").component("storage").context("template_id", id);
        return std::nullopt;
    }
    return loadTemplateFile(path);
}

std::vector<TemplateImage> FileScriptStorage::getAllTemplateImages() {
    std::vector<TemplateImage> images;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& path : utils::FileUtils::listFiles(m_templatesDirectory, ".json")) {
            if (auto image = loadTemplateFile(path)) {
                images.push_back(std::move(*image));
            }
        }
    }
    sortByName(images);
    return images;
}

std::string FileScriptStorage::saveTemplateImage(const TemplateImage& image) {
    TemplateImage stored = image;
    if (stored.id.empty()) {
        stored.id = generateId();
    }
    if (!isSafeId(stored.id)) {
        DESKPILOT_THROW(ErrorType::VALIDATION_ERROR, ErrorSeverity::MEDIUM,
                        "Invalid template id: " + stored.id, "", "FileScriptStorage::saveTemplateImage");
    }
    stored.createdAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!stored.imageData.empty()) {
        std::string imagePath = templateImagePath(stored.id);
        if (!utils::FileUtils::writeBinaryFile(imagePath, stored.imageData)) {
            DESKPILOT_THROW(ErrorType::STORAGE_ERROR, ErrorSeverity::HIGH,
                            "Failed to write template image " + stored.id, imagePath,
                            "FileScriptStorage::saveTemplateImage");
        }
        stored.filePath = imagePath;
    }

    if (!utils::FileUtils::saveJsonToFile(templatePath(stored.id), nlohmann::json(stored))) {
        DESKPILOT_THROW(ErrorType::STORAGE_ERROR, ErrorSeverity::HIGH,
                        "Failed to save template " + stored.id, templatePath(stored.id),
                        "FileScriptStorage::saveTemplateImage");
    }
    SLOG_DEBUG().message("Template saved")
        .component("storage")
        .context("template_id", stored.id)
        .context("bytes", stored.imageData.size());
    return stored.id;
}

bool FileScriptStorage::deleteTemplateImage(const std::string& id) {
    if (!isSafeId(id)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::string path = templatePath(id);
    if (!utils::FileUtils::fileExists(path)) {
        return false;
    }
    if (!utils::FileUtils::removeFile(path)) {
        DESKPILOT_THROW(ErrorType::STORAGE_ERROR, ErrorSeverity::MEDIUM,
                        "Failed to delete template " + id, path, "FileScriptStorage::deleteTemplateImage");
    }

    std::string imagePath = templateImagePath(id);
    if (utils::FileUtils::fileExists(imagePath) && !utils::FileUtils::removeFile(imagePath)) {
        SLOG_WARNING().message("Template image file left behind")
            .component("storage")
            .context("path", imagePath);
    }
    return true;
}

} // namespace deskpilot
