#pragma once

#include <imgui.h> // For ImU32

#include <paygraph/graph/graph_types.h>

namespace paygraph {
namespace gui {
namespace ThemeUtils {

void applyDarkTheme();

// Graph-specific theme colors
ImU32 GetCanvasBackgroundColor();
ImU32 GetNodeFillColor(graph::NodeKind kind);
ImU32 GetNodeBorderColor(graph::NodeKind kind);
ImU32 GetNodeHoverBorderColor();
ImU32 GetNodeLabelColor(graph::NodeKind kind);
ImU32 GetEdgeColor();
ImU32 GetTooltipBackgroundColor();
ImU32 GetTooltipBorderColor();
ImU32 GetTextColor();
ImU32 GetMutedTextColor();
ImU32 GetErrorTextColor();

} // namespace ThemeUtils
} // namespace gui
} // namespace paygraph
