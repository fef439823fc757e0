#ifndef DESKPILOT_DESKTOP_SCREENSHOT_SERVICE_H
#define DESKPILOT_DESKTOP_SCREENSHOT_SERVICE_H

#include <memory>
#include <mutex>
#include <string>
#include "screenshot_service.h"

namespace deskpilot {

/**
 * @brief Screen capture through GDI on Windows and Xlib elsewhere, PNG encoded with OpenCV
 *
 * The display connection is opened on first capture so that constructing the
 * service never requires a desktop session.
 */
class DesktopScreenshotService : public IScreenshotService {
public:
    explicit DesktopScreenshotService(const std::string& screenshotsDirectory);
    ~DesktopScreenshotService() override;

    DesktopScreenshotService(const DesktopScreenshotService&) = delete;
    DesktopScreenshotService& operator=(const DesktopScreenshotService&) = delete;

    ImageBytes captureFullScreen() override;
    ImageBytes captureRegion(const ScreenRegion& region) override;
    std::string saveScreenshot(const ImageBytes& image, const std::string& fileName) override;
    ScreenRegion getScreenBounds() override;
    TemplateImage createTemplateImage(const ScreenRegion& region, const std::string& name) override;

    const std::string& getScreenshotsDirectory() const { return m_screenshotsDirectory; }

private:
    struct DisplayConnection;

    // Caller holds m_mutex
    DisplayConnection& connection();
    ImageBytes captureArea(const ScreenRegion& area);

    std::string m_screenshotsDirectory;
    std::mutex m_mutex;
    std::unique_ptr<DisplayConnection> m_display;
};

} // namespace deskpilot

#endif // DESKPILOT_DESKTOP_SCREENSHOT_SERVICE_H
