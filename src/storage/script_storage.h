#ifndef DESKPILOT_SCRIPT_STORAGE_H
#define DESKPILOT_SCRIPT_STORAGE_H

#include <optional>
#include <string>
#include <vector>
#include "../models/script_models.h"

namespace deskpilot {

/**
 * @brief Persistence for scripts and template images
 *
 * Lookups report absence with std::nullopt. Write failures throw
 * DeskpilotException (STORAGE_ERROR). Implementations are thread-safe.
 */
class IScriptStorage {
public:
    virtual ~IScriptStorage() = default;

    virtual std::optional<AutomationScript> getScript(const std::string& id) = 0;
    virtual std::vector<AutomationScript> getAllScripts() = 0;  // Sorted by name

    /**
     * @brief Insert or replace a script
     *
     * Assigns an id when empty and stamps modifiedAt.
     * @return The stored id
     */
    virtual std::string saveScript(const AutomationScript& script) = 0;
    virtual bool deleteScript(const std::string& id) = 0;

    virtual std::optional<TemplateImage> getTemplateImage(const std::string& id) = 0;
    virtual std::vector<TemplateImage> getAllTemplateImages() = 0;  // Sorted by name
    virtual std::string saveTemplateImage(const TemplateImage& image) = 0;
    virtual bool deleteTemplateImage(const std::string& id) = 0;
};

} // namespace deskpilot

#endif // DESKPILOT_SCRIPT_STORAGE_H
