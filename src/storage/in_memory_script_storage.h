#ifndef DESKPILOT_IN_MEMORY_SCRIPT_STORAGE_H
#define DESKPILOT_IN_MEMORY_SCRIPT_STORAGE_H

#include <map>
#include <mutex>
#include "script_storage.h"

namespace deskpilot {

class InMemoryScriptStorage : public IScriptStorage {
public:
    static constexpr const char* kSampleScriptId = "sample-script-1";

    InMemoryScriptStorage() = default;

    std::optional<AutomationScript> getScript(const std::string& id) override;
    std::vector<AutomationScript> getAllScripts() override;
    std::string saveScript(const AutomationScript& script) override;
    bool deleteScript(const std::string& id) override;

    std::optional<TemplateImage> getTemplateImage(const std::string& id) override;
    std::vector<TemplateImage> getAllTemplateImages() override;
    std::string saveTemplateImage(const TemplateImage& image) override;
    bool deleteTemplateImage(const std::string& id) override;

    /**
     * @brief Store "Sample Click Script": a click at (960, 540) then a 2000 ms wait step
     */
    void seedSampleData();

private:
    mutable std::mutex m_mutex;
    std::map<std::string, AutomationScript> m_scripts;
    std::map<std::string, TemplateImage> m_templates;
};

} // namespace deskpilot

#endif // DESKPILOT_IN_MEMORY_SCRIPT_STORAGE_H
