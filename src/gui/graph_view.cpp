#include <paygraph/gui/graph_view.h>
#include <paygraph/gui/theme_utils.h>

#include <cfloat>
#include <cmath>
#include <string>

namespace paygraph {
namespace gui {

namespace {
constexpr float kArrowLength = 6.0f;
constexpr float kArrowHalfWidth = 3.0f;
constexpr float kOrgLabelSize = 11.0f;
constexpr float kContractorLabelSize = 9.0f;
constexpr float kTooltipPadding = 8.0f;

// Applies pan/zoom to every vertex emitted since vtx_start, then offsets into the canvas.
void TransformVertices(ImDrawList* draw_list, int vtx_start, const render::TransformState& transform,
                       const ImVec2& canvas_origin) {
    for (int i = vtx_start; i < draw_list->VtxBuffer.Size; ++i) {
        ImVec2& p = draw_list->VtxBuffer[i].pos;
        ImVec2 screen = transform.Apply(p);
        p.x = screen.x + canvas_origin.x;
        p.y = screen.y + canvas_origin.y;
    }
}
} // namespace

void GraphView::OnSnapshot(const render::RenderSnapshot& snapshot) {
    snapshot_ = snapshot;
}

void GraphView::Draw(ImDrawList* draw_list, const ImVec2& canvas_origin, const ImVec2& canvas_size) const {
    if (!draw_list) return;

    ImVec2 canvas_max(canvas_origin.x + canvas_size.x, canvas_origin.y + canvas_size.y);
    draw_list->AddRectFilled(canvas_origin, canvas_max, ThemeUtils::GetCanvasBackgroundColor(), 6.0f);
    draw_list->PushClipRect(canvas_origin, canvas_max, true);

    int vtx_start = draw_list->VtxBuffer.Size;
    DrawScene(draw_list);
    TransformVertices(draw_list, vtx_start, snapshot_.transform, canvas_origin);
    DrawLabels(draw_list, canvas_origin);

    // Overlays stay in screen space
    DrawLegend(draw_list, canvas_origin, canvas_size);
    DrawTooltip(draw_list, canvas_origin);

    draw_list->PopClipRect();
}

void GraphView::DrawScene(ImDrawList* draw_list) const {
    const ImU32 edge_color = ThemeUtils::GetEdgeColor();

    for (const auto& edge : snapshot_.edges) {
        float dx = edge.to.x - edge.from.x;
        float dy = edge.to.y - edge.from.y;
        float len = std::sqrt(dx * dx + dy * dy);
        if (len < 1e-3f) continue;
        float ux = dx / len;
        float uy = dy / len;

        // Arrow tip sits on the target circle's rim
        float target_radius = edge.target < snapshot_.nodes.size() ? snapshot_.nodes[edge.target].radius : 0.0f;
        ImVec2 tip(edge.to.x - ux * target_radius, edge.to.y - uy * target_radius);
        ImVec2 base(tip.x - ux * kArrowLength, tip.y - uy * kArrowLength);

        draw_list->AddLine(edge.from, base, edge_color, edge.width);
        draw_list->AddTriangleFilled(tip,
                                     ImVec2(base.x - uy * kArrowHalfWidth, base.y + ux * kArrowHalfWidth),
                                     ImVec2(base.x + uy * kArrowHalfWidth, base.y - ux * kArrowHalfWidth),
                                     edge_color);
    }

    for (const auto& node : snapshot_.nodes) {
        draw_list->AddCircleFilled(node.position, node.radius, ThemeUtils::GetNodeFillColor(node.kind));
        if (node.is_hovered) {
            draw_list->AddCircle(node.position, node.radius + 1.0f, ThemeUtils::GetNodeHoverBorderColor(), 0, 2.5f);
        } else {
            draw_list->AddCircle(node.position, node.radius, ThemeUtils::GetNodeBorderColor(node.kind), 0, 1.5f);
        }
    }
}

// Text is clipped on the CPU against the current clip rect, so labels are placed in
// screen space after the scene transform and scaled with the zoom.
void GraphView::DrawLabels(ImDrawList* draw_list, const ImVec2& canvas_origin) const {
    ImFont* font = ImGui::GetFont();
    if (!font) return;

    const render::TransformState& transform = snapshot_.transform;
    for (const auto& node : snapshot_.nodes) {
        if (node.label.empty()) continue;
        float font_size = (node.kind == graph::NodeKind::ORG ? kOrgLabelSize : kContractorLabelSize) * transform.scale;
        ImVec2 text_size = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, node.label.c_str());
        ImVec2 anchor = transform.Apply(ImVec2(node.position.x, node.position.y + node.radius + 2.0f));
        ImVec2 text_pos(canvas_origin.x + anchor.x - text_size.x * 0.5f, canvas_origin.y + anchor.y);
        draw_list->AddText(font, font_size, text_pos, ThemeUtils::GetNodeLabelColor(node.kind), node.label.c_str());
    }
}

void GraphView::DrawTooltip(ImDrawList* draw_list, const ImVec2& canvas_origin) const {
    if (!snapshot_.tooltip.has_value()) return;
    const render::TooltipDescriptor& tip = *snapshot_.tooltip;

    std::string kind_line = graph::NodeKindDisplayName(tip.kind);
    std::string total_line = "Total: " + tip.formatted_total;

    ImVec2 id_size = ImGui::CalcTextSize(tip.node_id.c_str());
    ImVec2 kind_size = ImGui::CalcTextSize(kind_line.c_str());
    ImVec2 total_size = ImGui::CalcTextSize(total_line.c_str());
    float line_height = ImGui::GetTextLineHeightWithSpacing();
    float width = std::fmax(id_size.x, std::fmax(kind_size.x, total_size.x)) + kTooltipPadding * 2.0f;
    float height = line_height * 3.0f + kTooltipPadding * 2.0f;

    // Anchored above the cursor, centered horizontally
    ImVec2 anchor(canvas_origin.x + tip.screen_position.x, canvas_origin.y + tip.screen_position.y);
    ImVec2 box_min(anchor.x - width * 0.5f, anchor.y - height);
    ImVec2 box_max(box_min.x + width, anchor.y);

    draw_list->AddRectFilled(box_min, box_max, ThemeUtils::GetTooltipBackgroundColor(), 4.0f);
    draw_list->AddRect(box_min, box_max, ThemeUtils::GetTooltipBorderColor(), 4.0f);

    ImVec2 cursor(box_min.x + kTooltipPadding, box_min.y + kTooltipPadding);
    draw_list->AddText(cursor, ThemeUtils::GetTextColor(), tip.node_id.c_str());
    cursor.y += line_height;
    draw_list->AddText(cursor, ThemeUtils::GetNodeFillColor(tip.kind), kind_line.c_str());
    cursor.y += line_height;
    draw_list->AddText(cursor, ThemeUtils::GetMutedTextColor(), total_line.c_str());
}

void GraphView::DrawLegend(ImDrawList* draw_list, const ImVec2& canvas_origin, const ImVec2& canvas_size) const {
    float line_height = ImGui::GetTextLineHeightWithSpacing();
    ImVec2 cursor(canvas_origin.x + 12.0f, canvas_origin.y + canvas_size.y - line_height - 8.0f);

    const graph::NodeKind kinds[] = {graph::NodeKind::ORG, graph::NodeKind::CONTRACTOR};
    for (graph::NodeKind kind : kinds) {
        ImVec2 dot(cursor.x + 5.0f, cursor.y + line_height * 0.5f);
        draw_list->AddCircleFilled(dot, 5.0f, ThemeUtils::GetNodeFillColor(kind));
        std::string name = graph::NodeKindDisplayName(kind);
        ImVec2 text_pos(cursor.x + 14.0f, cursor.y + (line_height - ImGui::GetTextLineHeight()) * 0.5f);
        draw_list->AddText(text_pos, ThemeUtils::GetMutedTextColor(), name.c_str());
        cursor.x = text_pos.x + ImGui::CalcTextSize(name.c_str()).x + 16.0f;
    }

    const char* hint = "Drag nodes, scroll to zoom, drag background to pan";
    draw_list->AddText(ImVec2(cursor.x + 8.0f, cursor.y + (line_height - ImGui::GetTextLineHeight()) * 0.5f),
                       ThemeUtils::GetMutedTextColor(), hint);
}

} // namespace gui
} // namespace paygraph
