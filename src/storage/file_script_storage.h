#ifndef DESKPILOT_FILE_SCRIPT_STORAGE_H
#define DESKPILOT_FILE_SCRIPT_STORAGE_H

#include <mutex>
#include "script_storage.h"

namespace deskpilot {

/**
 * @class FileScriptStorage
 * @brief Stores each script and template as a JSON document named after its id
 *
 * Template image bytes live beside the template document as <id>.png.
 */
class FileScriptStorage : public IScriptStorage {
public:
    FileScriptStorage(const std::string& scriptsDirectory, const std::string& templatesDirectory);

    std::optional<AutomationScript> getScript(const std::string& id) override;
    std::vector<AutomationScript> getAllScripts() override;
    std::string saveScript(const AutomationScript& script) override;
    bool deleteScript(const std::string& id) override;

    std::optional<TemplateImage> getTemplateImage(const std::string& id) override;
    std::vector<TemplateImage> getAllTemplateImages() override;
    std::string saveTemplateImage(const TemplateImage& image) override;
    bool deleteTemplateImage(const std::string& id) override;

    const std::string& getScriptsDirectory() const { return m_scriptsDirectory; }
    const std::string& getTemplatesDirectory() const { return m_templatesDirectory; }

private:
    std::string scriptPath(const std::string& id) const;
    std::string templatePath(const std::string& id) const;
    std::string templateImagePath(const std::string& id) const;

    std::optional<AutomationScript> loadScriptFile(const std::string& path) const;
    std::optional<TemplateImage> loadTemplateFile(const std::string& path) const;

    std::string m_scriptsDirectory;
    std::string m_templatesDirectory;
    mutable std::mutex m_mutex;
};

} // namespace deskpilot

#endif // DESKPILOT_FILE_SCRIPT_STORAGE_H
