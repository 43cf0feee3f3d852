#include <paygraph/interaction/interaction_controller.h>

#include <paygraph/graph/format_utils.h>

#include <type_traits>

namespace paygraph {
namespace interaction {

InteractionController::InteractionController(layout::ForceSimulation& simulation,
                                             render::ViewportTransform& transform,
                                             const InteractionParams& params)
    : simulation_(simulation), transform_(transform), params_(params), last_pan_position_(0.0f, 0.0f) {}

void InteractionController::SetGraph(const graph::GraphSnapshot* graph) {
    graph_ = graph;
    dragged_node_ = kInvalidNodeIndex;
    hovered_node_ = kInvalidNodeIndex;
    is_panning_ = false;
    tooltip_.reset();
}

std::uint32_t InteractionController::Handle(const InputEvent& event) {
    return std::visit([this](const auto& e) -> std::uint32_t {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PointerDownEvent>) {
            return OnPointerDown(e.position);
        } else if constexpr (std::is_same_v<T, PointerMoveEvent>) {
            return OnPointerMove(e.position);
        } else if constexpr (std::is_same_v<T, PointerUpEvent>) {
            return OnPointerUp(e.position);
        } else if constexpr (std::is_same_v<T, PointerLeaveEvent>) {
            return OnPointerLeave();
        } else {
            return OnWheel(e.position, e.wheel_delta);
        }
    }, event);
}

NodeIndex InteractionController::HitTest(const ImVec2& screen_pos) const {
    if (!graph_ || graph_->nodes.size() != simulation_.NodeCount()) {
        return kInvalidNodeIndex;
    }
    ImVec2 world = transform_.ScreenToWorld(screen_pos);
    // Later nodes are drawn on top, so search back to front
    for (NodeIndex i = graph_->nodes.size(); i-- > 0;) {
        ImVec2 p = simulation_.NodePosition(i);
        float dx = world.x - p.x;
        float dy = world.y - p.y;
        float radius = graph_->scales.NodeRadius(graph_->nodes[i]);
        if (dx * dx + dy * dy <= radius * radius) {
            return i;
        }
    }
    return kInvalidNodeIndex;
}

std::uint32_t InteractionController::OnPointerDown(const ImVec2& position) {
    NodeIndex hit = HitTest(position);
    if (hit != kInvalidNodeIndex) {
        dragged_node_ = hit;
        is_panning_ = false;
        ImVec2 current = simulation_.NodePosition(hit);
        simulation_.Pin(hit, current.x, current.y);
        return kPinChanged;
    }
    is_panning_ = true;
    last_pan_position_ = position;
    return kNoChange;
}

std::uint32_t InteractionController::OnPointerMove(const ImVec2& position) {
    if (dragged_node_ != kInvalidNodeIndex) {
        ImVec2 world = transform_.ScreenToWorld(position);
        simulation_.Pin(dragged_node_, world.x, world.y);
        simulation_.Reheat(params_.drag_alpha);
        return kPinChanged | kSimulationReheated;
    }
    if (is_panning_) {
        ImVec2 delta(position.x - last_pan_position_.x, position.y - last_pan_position_.y);
        last_pan_position_ = position;
        if (delta.x == 0.0f && delta.y == 0.0f) {
            return kNoChange;
        }
        transform_.PanBy(delta);
        return kTransformChanged;
    }
    return UpdateHover(position);
}

std::uint32_t InteractionController::OnPointerUp(const ImVec2& position) {
    std::uint32_t result = kNoChange;
    if (dragged_node_ != kInvalidNodeIndex) {
        simulation_.Unpin(dragged_node_);
        simulation_.Reheat(params_.release_alpha);
        dragged_node_ = kInvalidNodeIndex;
        result |= kPinChanged | kSimulationReheated;
    }
    is_panning_ = false;
    return result | UpdateHover(position);
}

std::uint32_t InteractionController::OnPointerLeave() {
    is_panning_ = false;
    return ClearHover();
}

std::uint32_t InteractionController::OnWheel(const ImVec2& position, float wheel_delta) {
    if (wheel_delta == 0.0f) {
        return kNoChange;
    }
    float factor = wheel_delta > 0.0f ? params_.wheel_zoom_in : params_.wheel_zoom_out;
    return transform_.ZoomAt(position, factor) ? kTransformChanged : kNoChange;
}

std::uint32_t InteractionController::UpdateHover(const ImVec2& position) {
    NodeIndex hit = HitTest(position);
    if (hit == kInvalidNodeIndex) {
        return ClearHover();
    }
    ImVec2 anchor(position.x, position.y - params_.tooltip_offset_y);
    if (hit == hovered_node_ && tooltip_.has_value()) {
        // Same node: the tooltip only follows the cursor
        if (tooltip_->screen_position.x == anchor.x && tooltip_->screen_position.y == anchor.y) {
            return kNoChange;
        }
        tooltip_->screen_position = anchor;
        return kTooltipChanged;
    }
    hovered_node_ = hit;
    const graph::GraphNode& node = graph_->nodes[hit];
    tooltip_ = render::TooltipDescriptor{
        anchor,
        node.id,
        node.kind,
        graph::FormatCurrency(node.total)};
    return kTooltipChanged;
}

std::uint32_t InteractionController::ClearHover() {
    if (hovered_node_ == kInvalidNodeIndex && !tooltip_.has_value()) {
        return kNoChange;
    }
    hovered_node_ = kInvalidNodeIndex;
    tooltip_.reset();
    return kTooltipChanged;
}

} // namespace interaction
} // namespace paygraph
