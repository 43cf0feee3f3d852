#pragma once

#include <imgui.h>

#include <paygraph/render/render_snapshot.h>

namespace paygraph {
namespace gui {

// ImGui render target for the network. Caches the newest snapshot and paints it into a
// canvas rectangle on demand. Nodes and edges are emitted in world coordinates and the
// viewport transform is applied once to the whole batch of vertices afterwards.
class GraphView : public render::RenderSink {
public:
    void OnSnapshot(const render::RenderSnapshot& snapshot) override;

    void Draw(ImDrawList* draw_list, const ImVec2& canvas_origin, const ImVec2& canvas_size) const;

private:
    void DrawScene(ImDrawList* draw_list) const;
    void DrawLabels(ImDrawList* draw_list, const ImVec2& canvas_origin) const;
    void DrawTooltip(ImDrawList* draw_list, const ImVec2& canvas_origin) const;
    void DrawLegend(ImDrawList* draw_list, const ImVec2& canvas_origin, const ImVec2& canvas_size) const;

    render::RenderSnapshot snapshot_;
};

} // namespace gui
} // namespace paygraph
