#ifndef PAYGRAPH_INTERACTION_INPUT_SOURCE_H
#define PAYGRAPH_INTERACTION_INPUT_SOURCE_H

#include <variant>
#include <vector>
#include <imgui.h>

namespace paygraph {
namespace interaction {

// All positions are canvas-relative screen coordinates.
struct PointerDownEvent {
    ImVec2 position;
};

struct PointerMoveEvent {
    ImVec2 position;
};

struct PointerUpEvent {
    ImVec2 position;
};

// Cursor left the canvas
struct PointerLeaveEvent {};

// wheel_delta > 0 scrolls up (zoom in), < 0 scrolls down (zoom out)
struct WheelEvent {
    ImVec2 position;
    float wheel_delta;
};

using InputEvent = std::variant<PointerDownEvent, PointerMoveEvent, PointerUpEvent, PointerLeaveEvent, WheelEvent>;

// Abstract base class for anything that produces canvas input (a window backend, a replay, a test).
class InputSource {
public:
    // Returns the events gathered since the previous call, oldest first.
    virtual std::vector<InputEvent> PollEvents() = 0;
    virtual ~InputSource() = default;
};

} // namespace interaction
} // namespace paygraph

#endif // PAYGRAPH_INTERACTION_INPUT_SOURCE_H
