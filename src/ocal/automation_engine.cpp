#include "automation_engine.h"
#include "mouse_control.h"
#include "keyboard_control.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace deskpilot {

namespace {
#ifdef _WIN32
    HWND toHwnd(WindowHandle handle) {
        return reinterpret_cast<HWND>(handle);
    }

    // SetForegroundWindow is refused unless the caller owns the foreground;
    // attaching to the foreground thread's input queue lifts that restriction.
    bool bringToFront(HWND hwnd) {
        if (SetForegroundWindow(hwnd)) {
            return true;
        }

        if (IsIconic(hwnd)) {
            ShowWindow(hwnd, SW_RESTORE);
        }
        SetWindowPos(hwnd, HWND_TOP, 0, 0, 0, 0, SWP_NOMOVE | SWP_NOSIZE | SWP_SHOWWINDOW);

        HWND foregroundWindow = GetForegroundWindow();
        DWORD foregroundThreadId = GetWindowThreadProcessId(foregroundWindow, nullptr);
        DWORD currentThreadId = GetCurrentThreadId();
        if (foregroundThreadId != currentThreadId) {
            AttachThreadInput(currentThreadId, foregroundThreadId, TRUE);
            BOOL result = SetForegroundWindow(hwnd);
            AttachThreadInput(currentThreadId, foregroundThreadId, FALSE);
            if (result) {
                return true;
            }
        }
        return BringWindowToTop(hwnd) != FALSE;
    }
#endif
}

void DesktopAutomationEngine::click(int x, int y) {
    ScreenPoint point = prepareTarget(x, y);
    ocal::mouse::clickAt(point, ocal::mouse::MouseButton::LEFT);
}

void DesktopAutomationEngine::doubleClick(int x, int y) {
    ScreenPoint point = prepareTarget(x, y);
    ocal::mouse::clickAt(point, ocal::mouse::MouseButton::LEFT, ocal::mouse::ClickType::DOUBLE);
}

void DesktopAutomationEngine::rightClick(int x, int y) {
    ScreenPoint point = prepareTarget(x, y);
    ocal::mouse::clickAt(point, ocal::mouse::MouseButton::RIGHT);
}

void DesktopAutomationEngine::moveMouse(int x, int y) {
    ScreenPoint point = prepareTarget(x, y);
    ocal::mouse::move(point);
}

void DesktopAutomationEngine::drag(const ScreenPoint& from, const ScreenPoint& to) {
    ScreenPoint start = prepareTarget(from.x, from.y);
    ScreenPoint end = prepareTarget(to.x, to.y);
    ocal::mouse::drag(start, end);
}

void DesktopAutomationEngine::typeText(const std::string& text) {
    activateTargetWindow();
    ocal::keyboard::type(text);
}

void DesktopAutomationEngine::sendKeys(const std::string& keys) {
    auto combination = ocal::keyboard::parseKeyCombination(keys);
    if (!combination) {
        DESKPILOT_THROW(ErrorType::INPUT_ERROR, ErrorSeverity::MEDIUM,
                        "Invalid key combination: " + keys, "", "DesktopAutomationEngine::sendKeys");
    }

    activateTargetWindow();
    ocal::keyboard::sendCombination(*combination);
}

bool DesktopAutomationEngine::wait(std::chrono::milliseconds duration, CancellationToken& token) {
    return token.sleepFor(duration);
}

ScreenPoint DesktopAutomationEngine::getMousePosition() {
    return ocal::mouse::getPosition();
}

void DesktopAutomationEngine::setTargetWindow(WindowHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_targetWindow = handle;
    SLOG_DEBUG().message("Target window set").context("handle", static_cast<std::uint64_t>(handle));
}

void DesktopAutomationEngine::clearTargetWindow() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_targetWindow.reset();
}

bool DesktopAutomationEngine::hasTargetWindow() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_targetWindow.has_value();
}

std::optional<WindowHandle> DesktopAutomationEngine::getTargetWindow() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_targetWindow;
}

void DesktopAutomationEngine::activateTargetWindow() {
    std::optional<WindowHandle> target = getTargetWindow();
    if (!target) {
        return;
    }

#ifdef _WIN32
    HWND hwnd = toHwnd(*target);
    if (!IsWindow(hwnd)) {
        DESKPILOT_THROW(ErrorType::INPUT_ERROR, ErrorSeverity::MEDIUM,
                        "Target window no longer exists", std::to_string(*target),
                        "DesktopAutomationEngine");
    }
    if (!bringToFront(hwnd)) {
        SLOG_WARNING().message("Could not bring target window to the foreground")
            .context("handle", static_cast<std::uint64_t>(*target));
    }
#else
    SLOG_DEBUG().message("Window activation simulated (non-Windows platform)");
#endif
}

ScreenPoint DesktopAutomationEngine::prepareTarget(int x, int y) {
    ScreenPoint point{x, y};
    std::optional<WindowHandle> target = getTargetWindow();
    if (!target) {
        return point;
    }

    activateTargetWindow();
#ifdef _WIN32
    POINT clientPoint{x, y};
    if (!ClientToScreen(toHwnd(*target), &clientPoint)) {
        DESKPILOT_THROW(ErrorType::INPUT_ERROR, ErrorSeverity::MEDIUM,
                        "Failed to map window coordinates", std::to_string(*target),
                        "DesktopAutomationEngine");
    }
    point.x = clientPoint.x;
    point.y = clientPoint.y;
#endif
    return point;
}

} // namespace deskpilot
