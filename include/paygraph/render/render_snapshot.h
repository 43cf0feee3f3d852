#ifndef PAYGRAPH_RENDER_RENDER_SNAPSHOT_H
#define PAYGRAPH_RENDER_RENDER_SNAPSHOT_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <imgui.h>

#include <paygraph/core/id_types.h>
#include <paygraph/graph/graph_types.h>
#include <paygraph/layout/force_simulation.h>

namespace paygraph {
namespace render {

struct TooltipDescriptor {
    ImVec2 screen_position;
    std::string node_id;
    graph::NodeKind kind;
    std::string formatted_total;
};

struct NodeDrawable {
    std::string id;
    std::string label;
    graph::NodeKind kind;
    ImVec2 position;     // World coordinates
    float radius;
    bool is_pinned;
    bool is_hovered;
};

struct EdgeDrawable {
    NodeIndex source;
    NodeIndex target;
    ImVec2 from;         // World coordinates
    ImVec2 to;
    float width;
};

struct TransformState {
    ImVec2 pan;
    float scale;

    // Canvas-relative screen position of a world point.
    ImVec2 Apply(const ImVec2& world) const {
        return ImVec2(world.x * scale + pan.x, world.y * scale + pan.y);
    }
};

// Read-only view of everything a render target needs for one frame.
// Positions are untransformed; the target applies `transform` once to the whole scene.
struct RenderSnapshot {
    std::uint64_t revision = 0;
    std::vector<NodeDrawable> nodes;
    std::vector<EdgeDrawable> edges;
    TransformState transform{ImVec2(0.0f, 0.0f), 1.0f};
    std::optional<TooltipDescriptor> tooltip;
    layout::SimulationState simulation_state = layout::SimulationState::IDLE;
    float alpha = 0.0f;
    graph::NetworkStats stats;
};

// Abstract base class for anything that paints a RenderSnapshot.
class RenderSink {
public:
    virtual void OnSnapshot(const RenderSnapshot& snapshot) = 0;
    virtual ~RenderSink() = default;
};

} // namespace render
} // namespace paygraph

#endif // PAYGRAPH_RENDER_RENDER_SNAPSHOT_H
