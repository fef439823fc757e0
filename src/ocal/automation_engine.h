#ifndef DESKPILOT_AUTOMATION_ENGINE_H
#define DESKPILOT_AUTOMATION_ENGINE_H

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include "../models/script_models.h"
#include "../common/cancellation_token.h"

namespace deskpilot {

/**
 * @brief Synthesizes mouse and keyboard input for scripts
 *
 * Coordinates are screen coordinates, or client coordinates of the target
 * window while one is set. Failures throw DeskpilotException.
 */
class IAutomationEngine {
public:
    virtual ~IAutomationEngine() = default;

    virtual void click(int x, int y) = 0;
    virtual void doubleClick(int x, int y) = 0;
    virtual void rightClick(int x, int y) = 0;
    virtual void moveMouse(int x, int y) = 0;
    virtual void drag(const ScreenPoint& from, const ScreenPoint& to) = 0;

    virtual void typeText(const std::string& text) = 0;

    // Combination text such as "CTRL+S"; an unparseable combination throws INPUT_ERROR
    virtual void sendKeys(const std::string& keys) = 0;

    /**
     * @brief Sleep unless the token is cancelled first
     * @return false if cancelled
     */
    virtual bool wait(std::chrono::milliseconds duration, CancellationToken& token) = 0;

    virtual ScreenPoint getMousePosition() = 0;

    virtual void setTargetWindow(WindowHandle handle) = 0;
    virtual void clearTargetWindow() = 0;
    virtual bool hasTargetWindow() const = 0;
    virtual std::optional<WindowHandle> getTargetWindow() const = 0;
};

/**
 * @brief IAutomationEngine over the ocal mouse and keyboard layer
 */
class DesktopAutomationEngine : public IAutomationEngine {
public:
    DesktopAutomationEngine() = default;

    void click(int x, int y) override;
    void doubleClick(int x, int y) override;
    void rightClick(int x, int y) override;
    void moveMouse(int x, int y) override;
    void drag(const ScreenPoint& from, const ScreenPoint& to) override;

    void typeText(const std::string& text) override;
    void sendKeys(const std::string& keys) override;
    bool wait(std::chrono::milliseconds duration, CancellationToken& token) override;

    ScreenPoint getMousePosition() override;

    void setTargetWindow(WindowHandle handle) override;
    void clearTargetWindow() override;
    bool hasTargetWindow() const override;
    std::optional<WindowHandle> getTargetWindow() const override;

private:
    // Activates the target window, if any, and maps client to screen coordinates
    ScreenPoint prepareTarget(int x, int y);
    void activateTargetWindow();

    mutable std::mutex m_mutex;
    std::optional<WindowHandle> m_targetWindow;
};

} // namespace deskpilot

#endif // DESKPILOT_AUTOMATION_ENGINE_H
