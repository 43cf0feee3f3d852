#include <paygraph/gui/theme_utils.h>

namespace paygraph {
namespace gui {
namespace ThemeUtils {

void applyDarkTheme() {
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 6.0f;
    style.FrameRounding = 4.0f;
    style.WindowBorderSize = 0.0f;

    // Slate palette
    style.Colors[ImGuiCol_WindowBg]      = ImVec4(0.059f, 0.090f, 0.165f, 1.0f); // #0f172a
    style.Colors[ImGuiCol_ChildBg]       = ImVec4(0.059f, 0.090f, 0.165f, 1.0f);
    style.Colors[ImGuiCol_FrameBg]       = ImVec4(0.118f, 0.161f, 0.231f, 1.0f); // #1e293b
    style.Colors[ImGuiCol_FrameBgHovered] = ImVec4(0.200f, 0.255f, 0.333f, 1.0f); // #334155
    style.Colors[ImGuiCol_Button]        = ImVec4(0.118f, 0.161f, 0.231f, 1.0f);
    style.Colors[ImGuiCol_ButtonHovered] = ImVec4(0.200f, 0.255f, 0.333f, 1.0f);
    style.Colors[ImGuiCol_ButtonActive]  = ImVec4(0.145f, 0.388f, 0.922f, 1.0f); // #2563eb
    style.Colors[ImGuiCol_Text]          = ImVec4(0.886f, 0.910f, 0.941f, 1.0f); // #e2e8f0
    style.Colors[ImGuiCol_TextDisabled]  = ImVec4(0.392f, 0.455f, 0.545f, 1.0f); // #64748b
}

ImU32 GetCanvasBackgroundColor() {
    return IM_COL32(2, 6, 23, 255); // #020617
}

ImU32 GetNodeFillColor(graph::NodeKind kind) {
    switch (kind) {
        case graph::NodeKind::ORG:
            return IM_COL32(79, 143, 247, 255);  // #4f8ff7
        case graph::NodeKind::CONTRACTOR:
            return IM_COL32(245, 158, 11, 255);  // #f59e0b
    }
    return IM_COL32(148, 163, 184, 255);
}

ImU32 GetNodeBorderColor(graph::NodeKind kind) {
    switch (kind) {
        case graph::NodeKind::ORG:
            return IM_COL32(37, 99, 235, 255);   // #2563eb
        case graph::NodeKind::CONTRACTOR:
            return IM_COL32(217, 119, 6, 255);   // #d97706
    }
    return IM_COL32(100, 116, 139, 255);
}

ImU32 GetNodeHoverBorderColor() {
    return IM_COL32(255, 255, 255, 255);
}

ImU32 GetNodeLabelColor(graph::NodeKind kind) {
    return kind == graph::NodeKind::ORG ? IM_COL32(148, 163, 184, 255)  // #94a3b8
                                        : IM_COL32(100, 116, 139, 255); // #64748b
}

ImU32 GetEdgeColor() {
    return IM_COL32(51, 65, 85, 153); // #334155 at 0.6 opacity
}

ImU32 GetTooltipBackgroundColor() {
    return IM_COL32(15, 23, 42, 235);
}

ImU32 GetTooltipBorderColor() {
    return IM_COL32(51, 65, 85, 255);
}

ImU32 GetTextColor() {
    return IM_COL32(226, 232, 240, 255);
}

ImU32 GetMutedTextColor() {
    return IM_COL32(100, 116, 139, 255);
}

ImU32 GetErrorTextColor() {
    return IM_COL32(248, 113, 113, 255); // #f87171
}

} // namespace ThemeUtils
} // namespace gui
} // namespace paygraph
