#include "keyboard_control.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include "../common/config_manager.h"
#include "../common/string_utils.h"
#include <thread>
#include <chrono>
#include <map>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace deskpilot {
namespace ocal {
namespace keyboard {

using utils::StringUtils;

namespace {
    int getKeystrokeDelay() {
        return ConfigManager::getInstance().getKeystrokeDelayMs();
    }

    void pause(int ms) {
        if (ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
    }

    const std::map<std::string, Key>& namedKeys() {
        static const std::map<std::string, Key> names = {
            {"ENTER", Key::ENTER}, {"RETURN", Key::ENTER},
            {"TAB", Key::TAB},
            {"ESC", Key::ESCAPE}, {"ESCAPE", Key::ESCAPE},
            {"SPACE", Key::SPACE},
            {"BACKSPACE", Key::BACKSPACE},
            {"DELETE", Key::DELETE_KEY}, {"DEL", Key::DELETE_KEY},
            {"SHIFT", Key::SHIFT},
            {"CTRL", Key::CTRL}, {"CONTROL", Key::CTRL},
            {"ALT", Key::ALT},
            {"WIN", Key::WINDOWS},
            {"F1", Key::F1}, {"F2", Key::F2}, {"F3", Key::F3}, {"F4", Key::F4},
            {"F5", Key::F5}, {"F6", Key::F6}, {"F7", Key::F7}, {"F8", Key::F8},
            {"F9", Key::F9}, {"F10", Key::F10}, {"F11", Key::F11}, {"F12", Key::F12},
            {"UP", Key::ARROW_UP}, {"DOWN", Key::ARROW_DOWN},
            {"LEFT", Key::ARROW_LEFT}, {"RIGHT", Key::ARROW_RIGHT},
            {"HOME", Key::HOME}, {"END", Key::END},
            {"PAGEUP", Key::PAGE_UP}, {"PAGEDOWN", Key::PAGE_DOWN},
            {"INSERT", Key::INSERT}
        };
        return names;
    }

#ifdef _WIN32
    WORD toVirtualKey(Key key) {
        if (key >= Key::A && key <= Key::Z) {
            return static_cast<WORD>('A' + (static_cast<int>(key) - static_cast<int>(Key::A)));
        }
        if (key >= Key::NUM_0 && key <= Key::NUM_9) {
            return static_cast<WORD>('0' + (static_cast<int>(key) - static_cast<int>(Key::NUM_0)));
        }
        if (key >= Key::F1 && key <= Key::F12) {
            return static_cast<WORD>(VK_F1 + (static_cast<int>(key) - static_cast<int>(Key::F1)));
        }

        switch (key) {
            case Key::SPACE: return VK_SPACE;
            case Key::ENTER: return VK_RETURN;
            case Key::TAB: return VK_TAB;
            case Key::BACKSPACE: return VK_BACK;
            case Key::DELETE_KEY: return VK_DELETE;
            case Key::ESCAPE: return VK_ESCAPE;
            case Key::SHIFT: return VK_SHIFT;
            case Key::CTRL: return VK_CONTROL;
            case Key::ALT: return VK_MENU;
            case Key::WINDOWS: return VK_LWIN;
            case Key::ARROW_UP: return VK_UP;
            case Key::ARROW_DOWN: return VK_DOWN;
            case Key::ARROW_LEFT: return VK_LEFT;
            case Key::ARROW_RIGHT: return VK_RIGHT;
            case Key::HOME: return VK_HOME;
            case Key::END: return VK_END;
            case Key::PAGE_UP: return VK_PRIOR;
            case Key::PAGE_DOWN: return VK_NEXT;
            case Key::INSERT: return VK_INSERT;
            default: return 0;
        }
    }

    void sendInputs(INPUT* inputs, UINT count, const char* context) {
        if (SendInput(count, inputs, sizeof(INPUT)) != count) {
            DESKPILOT_THROW(ErrorType::INPUT_ERROR, ErrorSeverity::MEDIUM,
                            "SendInput rejected keyboard event",
                            "error " + std::to_string(GetLastError()), context);
        }
    }

    void sendKeyEvent(Key key, bool isDown) {
        INPUT input = {};
        input.type = INPUT_KEYBOARD;
        input.ki.wVk = toVirtualKey(key);
        input.ki.dwFlags = isDown ? 0 : KEYEVENTF_KEYUP;
        sendInputs(&input, 1, isDown ? "keyboard::press" : "keyboard::release");
    }

    // Text goes through KEYEVENTF_UNICODE so layout and shift state do not matter
    void sendUnicodeChar(wchar_t ch) {
        INPUT inputs[2] = {};
        inputs[0].type = INPUT_KEYBOARD;
        inputs[0].ki.wScan = ch;
        inputs[0].ki.dwFlags = KEYEVENTF_UNICODE;
        inputs[1] = inputs[0];
        inputs[1].ki.dwFlags |= KEYEVENTF_KEYUP;
        sendInputs(inputs, 2, "keyboard::type");
    }

    std::wstring toWide(const std::string& text) {
        if (text.empty()) {
            return std::wstring();
        }
        int length = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
        if (length <= 0) {
            DESKPILOT_THROW(ErrorType::INPUT_ERROR, ErrorSeverity::MEDIUM,
                            "Text is not valid UTF-8", "", "keyboard::type");
        }
        std::wstring wide(static_cast<size_t>(length), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), &wide[0], length);
        return wide;
    }
#endif
}

void press(Key key) {
    SLOG_DEBUG().message("Key press").context("key", keyToString(key));
#ifdef _WIN32
    sendKeyEvent(key, true);
#else
    SLOG_DEBUG().message("Key press simulated (non-Windows platform)");
#endif
}

void release(Key key) {
    SLOG_DEBUG().message("Key release").context("key", keyToString(key));
#ifdef _WIN32
    sendKeyEvent(key, false);
#else
    SLOG_DEBUG().message("Key release simulated (non-Windows platform)");
#endif
}

void tap(Key key) {
    press(key);
    pause(getKeystrokeDelay());
    release(key);
}

void type(const std::string& text) {
    SLOG_DEBUG().message("Typing text").context("length", text.size());
#ifdef _WIN32
    int delay = getKeystrokeDelay();
    for (wchar_t ch : toWide(text)) {
        sendUnicodeChar(ch);
        pause(delay);
    }
#else
    SLOG_DEBUG().message("Text typing simulated (non-Windows platform)");
#endif
}

void sendCombination(const KeyCombination& combination) {
    SLOG_DEBUG().message("Key combination").context("keys", combinationToString(combination));

    int delay = getKeystrokeDelay();
    KeyCombination held;
    for (Key key : combination) {
        if (isModifier(key)) {
            press(key);
            held.push_back(key);
            pause(delay);
        }
    }

    for (Key key : combination) {
        if (!isModifier(key)) {
            tap(key);
            pause(delay);
        }
    }

    for (auto it = held.rbegin(); it != held.rend(); ++it) {
        release(*it);
        pause(delay);
    }
}

std::optional<KeyCombination> parseKeyCombination(const std::string& text) {
    KeyCombination combination;
    for (const auto& rawToken : StringUtils::split(text, "+")) {
        std::string token = StringUtils::toUpperCase(StringUtils::trim(rawToken));
        if (token.empty()) {
            return std::nullopt;
        }

        if (token.size() == 1) {
            char c = token[0];
            if (c >= 'A' && c <= 'Z') {
                combination.push_back(static_cast<Key>(static_cast<int>(Key::A) + (c - 'A')));
                continue;
            }
            if (c >= '0' && c <= '9') {
                combination.push_back(static_cast<Key>(static_cast<int>(Key::NUM_0) + (c - '0')));
                continue;
            }
            return std::nullopt;
        }

        auto it = namedKeys().find(token);
        if (it == namedKeys().end()) {
            return std::nullopt;
        }
        combination.push_back(it->second);
    }

    if (combination.empty()) {
        return std::nullopt;
    }
    return combination;
}

bool isModifier(Key key) {
    return key == Key::SHIFT || key == Key::CTRL || key == Key::ALT || key == Key::WINDOWS;
}

std::string keyToString(Key key) {
    if (key >= Key::A && key <= Key::Z) {
        return std::string(1, static_cast<char>('A' + (static_cast<int>(key) - static_cast<int>(Key::A))));
    }
    if (key >= Key::NUM_0 && key <= Key::NUM_9) {
        return std::string(1, static_cast<char>('0' + (static_cast<int>(key) - static_cast<int>(Key::NUM_0))));
    }
    if (key >= Key::F1 && key <= Key::F12) {
        return "F" + std::to_string(static_cast<int>(key) - static_cast<int>(Key::F1) + 1);
    }

    switch (key) {
        case Key::SPACE: return "SPACE";
        case Key::ENTER: return "ENTER";
        case Key::TAB: return "TAB";
        case Key::BACKSPACE: return "BACKSPACE";
        case Key::DELETE_KEY: return "DELETE";
        case Key::ESCAPE: return "ESCAPE";
        case Key::SHIFT: return "SHIFT";
        case Key::CTRL: return "CTRL";
        case Key::ALT: return "ALT";
        case Key::WINDOWS: return "WIN";
        case Key::ARROW_UP: return "UP";
        case Key::ARROW_DOWN: return "DOWN";
        case Key::ARROW_LEFT: return "LEFT";
        case Key::ARROW_RIGHT: return "RIGHT";
        case Key::HOME: return "HOME";
        case Key::END: return "END";
        case Key::PAGE_UP: return "PAGEUP";
        case Key::PAGE_DOWN: return "PAGEDOWN";
        case Key::INSERT: return "INSERT";
        default: return "UNKNOWN";
    }
}

std::string combinationToString(const KeyCombination& combination) {
    std::vector<std::string> names;
    for (Key key : combination) {
        names.push_back(keyToString(key));
    }
    return StringUtils::join(names, "+");
}

} // namespace keyboard
} // namespace ocal
} // namespace deskpilot
