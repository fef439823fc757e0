#ifndef DESKPILOT_MOUSE_CONTROL_H
#define DESKPILOT_MOUSE_CONTROL_H

#include <string>
#include "../models/script_models.h"

namespace deskpilot {
namespace ocal {
namespace mouse {

enum class MouseButton {
    LEFT,
    RIGHT,
    MIDDLE
};

enum class ClickType {
    SINGLE,
    DOUBLE
};

// Screen coordinates. Input failures throw DeskpilotException (INPUT_ERROR);
// on platforms without an input backend the calls only log.
void move(const ScreenPoint& point);
void clickAt(const ScreenPoint& point, MouseButton button = MouseButton::LEFT, ClickType type = ClickType::SINGLE);
void drag(const ScreenPoint& start, const ScreenPoint& end, MouseButton button = MouseButton::LEFT);

void press(MouseButton button);
void release(MouseButton button);

ScreenPoint getPosition();

std::string buttonToString(MouseButton button);

} // namespace mouse
} // namespace ocal
} // namespace deskpilot

#endif // DESKPILOT_MOUSE_CONTROL_H
