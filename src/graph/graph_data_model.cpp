#include <paygraph/graph/graph_data_model.h>

#include <algorithm>
#include <cmath>

namespace paygraph {
namespace graph {

namespace {
// NaN and negatives both collapse to zero so they never become negative geometry.
inline double NonNegative(double value) {
    return (value > 0.0 && std::isfinite(value)) ? value : 0.0;
}
} // namespace

std::optional<NodeKind> ParseNodeKind(const std::string& type) {
    if (type == "org") return NodeKind::ORG;
    if (type == "contractor") return NodeKind::CONTRACTOR;
    return std::nullopt;
}

const char* NodeKindName(NodeKind kind) {
    return kind == NodeKind::ORG ? "org" : "contractor";
}

const char* NodeKindDisplayName(NodeKind kind) {
    return kind == NodeKind::ORG ? "Organization" : "Contractor";
}

GraphScales::GraphScales(double max_edge_amount, double max_node_total)
    : max_edge_amount_(std::max(NonNegative(max_edge_amount), 1.0)),
      max_node_total_(std::max(NonNegative(max_node_total), 1.0)) {}

float GraphScales::EdgeWidth(double amount) const {
    double width = NonNegative(amount) / max_edge_amount_ * kMaxEdgeWidth;
    return static_cast<float>(std::clamp(width, static_cast<double>(kMinEdgeWidth),
                                         static_cast<double>(kMaxEdgeWidth)));
}

float GraphScales::NodeRadius(NodeKind kind, double total) const {
    double ratio = std::min(NonNegative(total) / max_node_total_, 1.0);
    float scale = static_cast<float>(std::sqrt(ratio));
    if (kind == NodeKind::ORG) {
        return kOrgBaseRadius + scale * kOrgRadiusScale;
    }
    return kContractorBaseRadius + scale * kContractorRadiusScale;
}

double GraphScales::EdgeWeight(double amount) const {
    return std::min(NonNegative(amount) / max_edge_amount_, 1.0);
}

NodeIndex GraphSnapshot::FindNode(const std::string& id) const {
    auto it = index.find(id);
    return it != index.end() ? it->second : kInvalidNodeIndex;
}

std::string GraphDataModel::MakeLabel(const std::string& id) {
    // Count code points, not bytes: continuation bytes match 10xxxxxx
    std::size_t code_points = 0;
    for (std::size_t i = 0; i < id.size(); ++i) {
        if ((static_cast<unsigned char>(id[i]) & 0xC0) == 0x80) {
            continue;
        }
        if (code_points == kMaxLabelLength) {
            return id.substr(0, i) + "…";
        }
        ++code_points;
    }
    return id;
}

GraphSnapshot GraphDataModel::Build(const std::vector<RawNode>& raw_nodes,
                                    const std::vector<RawEdge>& raw_edges) {
    GraphSnapshot snapshot;
    snapshot.nodes.reserve(raw_nodes.size());
    snapshot.index.reserve(raw_nodes.size());

    double max_total = 0.0;
    for (const auto& raw : raw_nodes) {
        if (snapshot.index.count(raw.id)) {
            ++snapshot.dropped_node_count;
            continue;
        }
        GraphNode node{raw.id, raw.kind, NonNegative(raw.total), MakeLabel(raw.id)};
        max_total = std::max(max_total, node.total);
        snapshot.index.emplace(node.id, snapshot.nodes.size());
        snapshot.nodes.push_back(std::move(node));
    }

    double max_amount = 0.0;
    snapshot.edges.reserve(raw_edges.size());
    for (const auto& raw : raw_edges) {
        NodeIndex source = snapshot.FindNode(raw.source);
        NodeIndex target = snapshot.FindNode(raw.target);
        if (source == kInvalidNodeIndex || target == kInvalidNodeIndex) {
            ++snapshot.dropped_edge_count;
            continue;
        }
        GraphEdge edge{source, target, NonNegative(raw.amount), std::max<std::int64_t>(raw.contracts, 0)};
        max_amount = std::max(max_amount, edge.amount);
        snapshot.edges.push_back(edge);
    }

    snapshot.scales = GraphScales(max_amount, max_total);

    for (const auto& node : snapshot.nodes) {
        if (node.kind == NodeKind::ORG) {
            ++snapshot.stats.org_count;
        } else {
            ++snapshot.stats.contractor_count;
        }
    }
    snapshot.stats.edge_count = static_cast<std::int64_t>(snapshot.edges.size());
    return snapshot;
}

GraphSnapshot GraphDataModel::Build(const NetworkPayload& payload) {
    GraphSnapshot snapshot = Build(payload.nodes, payload.edges);
    snapshot.dropped_node_count += payload.rejected_node_count;
    if (payload.stats.has_value()) {
        snapshot.stats = *payload.stats;
    }
    return snapshot;
}

} // namespace graph
} // namespace paygraph
