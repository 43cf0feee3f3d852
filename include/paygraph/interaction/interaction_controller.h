#ifndef PAYGRAPH_INTERACTION_INTERACTION_CONTROLLER_H
#define PAYGRAPH_INTERACTION_INTERACTION_CONTROLLER_H

#include <cstdint>
#include <optional>
#include <imgui.h>

#include <paygraph/core/id_types.h>
#include <paygraph/graph/graph_data_model.h>
#include <paygraph/interaction/input_source.h>
#include <paygraph/layout/force_simulation.h>
#include <paygraph/render/render_snapshot.h>
#include <paygraph/render/viewport_transform.h>

namespace paygraph {
namespace interaction {

struct InteractionParams {
    float drag_alpha = 0.3f;        // Alpha while a node is being dragged
    float release_alpha = 0.1f;     // Alpha after the drag ends, lets the layout relax
    float wheel_zoom_in = 1.1f;
    float wheel_zoom_out = 0.9f;
    float tooltip_offset_y = 12.0f; // Tooltip anchor sits this far above the cursor
};

// Bit flags describing what an input event changed
enum InteractionResult : std::uint32_t {
    kNoChange = 0,
    kTransformChanged = 1u << 0,
    kSimulationReheated = 1u << 1,
    kTooltipChanged = 1u << 2,
    kPinChanged = 1u << 3
};

/*
 * Turns canvas input into operations on the simulation and the viewport.
 * Runs on the frame thread between ticks; a pin set here is authoritative for the next tick.
 */
class InteractionController {
public:
    InteractionController(layout::ForceSimulation& simulation,
                          render::ViewportTransform& transform,
                          const InteractionParams& params = InteractionParams());

    // Points the controller at a new graph (or nullptr) and cancels drag/pan/hover.
    void SetGraph(const graph::GraphSnapshot* graph);

    std::uint32_t Handle(const InputEvent& event);

    std::uint32_t OnPointerDown(const ImVec2& position);
    std::uint32_t OnPointerMove(const ImVec2& position);
    std::uint32_t OnPointerUp(const ImVec2& position);
    std::uint32_t OnPointerLeave();
    std::uint32_t OnWheel(const ImVec2& position, float wheel_delta);

    // Topmost node whose circle contains the screen point, or kInvalidNodeIndex.
    NodeIndex HitTest(const ImVec2& screen_pos) const;

    bool IsDragging() const { return dragged_node_ != kInvalidNodeIndex; }
    bool IsPanning() const { return is_panning_; }
    NodeIndex DraggedNode() const { return dragged_node_; }
    NodeIndex HoveredNode() const { return hovered_node_; }
    const std::optional<render::TooltipDescriptor>& ActiveTooltip() const { return tooltip_; }

private:
    std::uint32_t UpdateHover(const ImVec2& position);
    std::uint32_t ClearHover();

    layout::ForceSimulation& simulation_;
    render::ViewportTransform& transform_;
    InteractionParams params_;
    const graph::GraphSnapshot* graph_ = nullptr;

    NodeIndex dragged_node_ = kInvalidNodeIndex;
    NodeIndex hovered_node_ = kInvalidNodeIndex;
    bool is_panning_ = false;
    ImVec2 last_pan_position_;
    std::optional<render::TooltipDescriptor> tooltip_;
};

} // namespace interaction
} // namespace paygraph

#endif // PAYGRAPH_INTERACTION_INTERACTION_CONTROLLER_H
