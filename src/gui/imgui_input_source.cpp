#include <paygraph/gui/imgui_input_source.h>
#include <paygraph/gui/gui_interface.h>

namespace paygraph {
namespace gui {

ImGuiInputSource::ImGuiInputSource(GuiInterface& gui)
    : gui_(gui), origin_(0.0f, 0.0f), size_(0.0f, 0.0f) {}

void ImGuiInputSource::BeginCanvas(const ImVec2& origin, const ImVec2& size, bool hovered) {
    origin_ = origin;
    size_ = size;
    hovered_ = hovered;
}

std::vector<interaction::InputEvent> ImGuiInputSource::PollEvents() {
    std::vector<interaction::InputEvent> events;
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 local(io.MousePos.x - origin_.x, io.MousePos.y - origin_.y);

    // Drain every frame so scrolling over other widgets never leaks into the canvas later
    ImVec2 scroll = gui_.getAndClearScrollOffsets();

    if (hovered_ && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
        events.push_back(interaction::PointerDownEvent{local});
        captured_ = true;
    }

    bool moved = io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f;
    if (moved && (hovered_ || captured_) && ImGui::IsMousePosValid()) {
        events.push_back(interaction::PointerMoveEvent{local});
    }

    if (captured_ && !ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
        events.push_back(interaction::PointerUpEvent{local});
        captured_ = false;
    }

    if (hovered_ && scroll.y != 0.0f) {
        events.push_back(interaction::WheelEvent{local, scroll.y});
    }

    if (was_hovered_ && !hovered_ && !captured_) {
        events.push_back(interaction::PointerLeaveEvent{});
    }
    was_hovered_ = hovered_;

    return events;
}

} // namespace gui
} // namespace paygraph
