#pragma once

#include <imgui.h>

#include <paygraph/interaction/input_source.h>

namespace paygraph {
namespace gui {

class GuiInterface;

// Translates this frame's ImGui mouse state into canvas-relative input events.
// BeginCanvas() must be called each frame, after the canvas item is submitted and before PollEvents().
class ImGuiInputSource : public interaction::InputSource {
public:
    explicit ImGuiInputSource(GuiInterface& gui);

    void BeginCanvas(const ImVec2& origin, const ImVec2& size, bool hovered);
    std::vector<interaction::InputEvent> PollEvents() override;

private:
    GuiInterface& gui_;
    ImVec2 origin_;
    ImVec2 size_;
    bool hovered_ = false;
    bool was_hovered_ = false;
    bool captured_ = false; // Left button went down on the canvas and is still held
};

} // namespace gui
} // namespace paygraph
