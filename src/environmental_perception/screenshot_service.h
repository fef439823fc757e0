#ifndef DESKPILOT_SCREENSHOT_SERVICE_H
#define DESKPILOT_SCREENSHOT_SERVICE_H

#include <string>
#include "../models/script_models.h"

namespace deskpilot {

/**
 * @brief Captures the desktop as PNG encoded bytes
 *
 * Implementations must be safe to share between concurrently running scripts.
 */
class IScreenshotService {
public:
    virtual ~IScreenshotService() = default;

    virtual ImageBytes captureFullScreen() = 0;
    virtual ImageBytes captureRegion(const ScreenRegion& region) = 0;

    /**
     * @brief Write bytes into the screenshots directory
     * @param fileName Defaults to a timestamped name; ".png" is appended when there is no extension
     * @return Path of the written file
     */
    virtual std::string saveScreenshot(const ImageBytes& image, const std::string& fileName) = 0;

    virtual ScreenRegion getScreenBounds() = 0;

    // Captures region and wraps it as an unsaved template
    virtual TemplateImage createTemplateImage(const ScreenRegion& region, const std::string& name) = 0;
};

} // namespace deskpilot

#endif // DESKPILOT_SCREENSHOT_SERVICE_H
