#ifndef DESKPILOT_KEYBOARD_CONTROL_H
#define DESKPILOT_KEYBOARD_CONTROL_H

#include <optional>
#include <string>
#include <vector>

namespace deskpilot {
namespace ocal {
namespace keyboard {

enum class Key {
    // Letters
    A, B, C, D, E, F, G, H, I, J, K, L, M, N, O, P, Q, R, S, T, U, V, W, X, Y, Z,

    // Numbers
    NUM_0, NUM_1, NUM_2, NUM_3, NUM_4, NUM_5, NUM_6, NUM_7, NUM_8, NUM_9,

    // Function keys
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,

    // Special keys
    SPACE, ENTER, TAB, BACKSPACE, DELETE_KEY, ESCAPE,

    // Modifiers
    SHIFT, CTRL, ALT, WINDOWS,

    // Navigation
    ARROW_UP, ARROW_DOWN, ARROW_LEFT, ARROW_RIGHT,
    HOME, END, PAGE_UP, PAGE_DOWN, INSERT
};

using KeyCombination = std::vector<Key>;

// Input failures throw DeskpilotException (INPUT_ERROR)
void press(Key key);
void release(Key key);
void tap(Key key);
void type(const std::string& text);

/**
 * @brief Sends a combination such as CTRL+SHIFT+S
 *
 * Modifiers are held while the remaining keys are tapped in order, then
 * released in reverse order. A combination without modifiers taps each key.
 */
void sendCombination(const KeyCombination& combination);

/**
 * @brief Parses "CTRL+C" style text, case-insensitively
 * @return std::nullopt if any token is not a known key name
 */
std::optional<KeyCombination> parseKeyCombination(const std::string& text);

bool isModifier(Key key);
std::string keyToString(Key key);
std::string combinationToString(const KeyCombination& combination);

} // namespace keyboard
} // namespace ocal
} // namespace deskpilot

#endif // DESKPILOT_KEYBOARD_CONTROL_H
