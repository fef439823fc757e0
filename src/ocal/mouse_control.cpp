#include "mouse_control.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include "../common/config_manager.h"
#include <thread>
#include <chrono>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace deskpilot {
namespace ocal {
namespace mouse {

namespace {
    int getClickDelay() {
        return ConfigManager::getInstance().getClickDelayMs();
    }

    void pause(int ms) {
        if (ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
    }

#ifdef _WIN32
    int getDoubleClickInterval() {
        return ConfigManager::getInstance().getDoubleClickIntervalMs();
    }

    DWORD getMouseButtonFlag(MouseButton button, bool isDown) {
        switch (button) {
            case MouseButton::LEFT:
                return isDown ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP;
            case MouseButton::RIGHT:
                return isDown ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP;
            case MouseButton::MIDDLE:
                return isDown ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP;
            default:
                return MOUSEEVENTF_LEFTDOWN;
        }
    }

    void sendButtonEvent(MouseButton button, bool isDown, const char* context) {
        INPUT input = {};
        input.type = INPUT_MOUSE;
        input.mi.dwFlags = getMouseButtonFlag(button, isDown);
        if (SendInput(1, &input, sizeof(INPUT)) != 1) {
            DESKPILOT_THROW(ErrorType::INPUT_ERROR, ErrorSeverity::MEDIUM,
                            "SendInput rejected mouse event",
                            "error " + std::to_string(GetLastError()), context);
        }
    }
#endif

    void moveMousePlatformSpecific(const ScreenPoint& point) {
    #ifdef _WIN32
        if (!SetCursorPos(point.x, point.y)) {
            DESKPILOT_THROW(ErrorType::INPUT_ERROR, ErrorSeverity::MEDIUM,
                            "Failed to move mouse cursor",
                            "error " + std::to_string(GetLastError()), "mouse::move");
        }
    #else
        (void)point;
        SLOG_DEBUG().message("Mouse move simulated (non-Windows platform)");
    #endif
    }

    void clickMousePlatformSpecific(MouseButton button, ClickType type) {
    #ifdef _WIN32
        int clickDelay = getClickDelay();

        sendButtonEvent(button, true, "mouse::click");
        pause(clickDelay);
        sendButtonEvent(button, false, "mouse::click");

        if (type == ClickType::DOUBLE) {
            pause(getDoubleClickInterval());
            sendButtonEvent(button, true, "mouse::click");
            pause(clickDelay);
            sendButtonEvent(button, false, "mouse::click");
        }
    #else
        (void)button; (void)type;
        SLOG_DEBUG().message("Mouse click simulated (non-Windows platform)");
    #endif
    }

    void buttonPlatformSpecific(MouseButton button, bool isDown) {
    #ifdef _WIN32
        sendButtonEvent(button, isDown, isDown ? "mouse::press" : "mouse::release");
    #else
        (void)button;
        SLOG_DEBUG().message(isDown ? "Mouse press simulated (non-Windows platform)"
                                    : "Mouse release simulated (non-Windows platform)");
    #endif
    }

    ScreenPoint getPositionPlatformSpecific() {
        ScreenPoint position;
    #ifdef _WIN32
        POINT pt;
        if (GetCursorPos(&pt)) {
            position.x = pt.x;
            position.y = pt.y;
        } else {
            DESKPILOT_HANDLE_ERROR(ErrorType::INPUT_ERROR, ErrorSeverity::LOW,
                                   "Failed to get mouse position", "", "mouse::getPosition");
        }
    #endif
        return position;
    }
}

std::string buttonToString(MouseButton button) {
    switch (button) {
        case MouseButton::LEFT: return "LEFT";
        case MouseButton::RIGHT: return "RIGHT";
        case MouseButton::MIDDLE: return "MIDDLE";
    }
    return "LEFT";
}

void move(const ScreenPoint& point) {
    SLOG_DEBUG().message("Moving mouse to position").context("x", point.x).context("y", point.y);
    moveMousePlatformSpecific(point);
}

void clickAt(const ScreenPoint& point, MouseButton button, ClickType type) {
    move(point);
    pause(getClickDelay());

    SLOG_DEBUG().message("Mouse click")
        .context("type", type == ClickType::SINGLE ? "SINGLE" : "DOUBLE")
        .context("button", buttonToString(button));
    clickMousePlatformSpecific(button, type);
}

void drag(const ScreenPoint& start, const ScreenPoint& end, MouseButton button) {
    SLOG_DEBUG().message("Mouse drag")
        .context("startX", start.x).context("startY", start.y)
        .context("endX", end.x).context("endY", end.y);

    int delay = getClickDelay();
    move(start);
    pause(delay);
    press(button);
    pause(delay);
    move(end);
    pause(delay);
    release(button);
}

void press(MouseButton button) {
    SLOG_DEBUG().message("Mouse press").context("button", buttonToString(button));
    buttonPlatformSpecific(button, true);
}

void release(MouseButton button) {
    SLOG_DEBUG().message("Mouse release").context("button", buttonToString(button));
    buttonPlatformSpecific(button, false);
}

ScreenPoint getPosition() {
    ScreenPoint position;
    DESKPILOT_TRY_CATCH({
        position = getPositionPlatformSpecific();
    }, "mouse::getPosition");
    return position;
}

} // namespace mouse
} // namespace ocal
} // namespace deskpilot
