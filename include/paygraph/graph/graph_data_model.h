#ifndef PAYGRAPH_GRAPH_GRAPH_DATA_MODEL_H
#define PAYGRAPH_GRAPH_GRAPH_DATA_MODEL_H

#include <string>
#include <unordered_map>
#include <vector>

#include <paygraph/graph/graph_types.h>

namespace paygraph {
namespace graph {

/*
 * Scale factors derived from one graph snapshot.
 * Both maxima are floored at 1 so an empty or all-zero graph never divides by zero.
 */
class GraphScales {
public:
    GraphScales() = default;
    GraphScales(double max_edge_amount, double max_node_total);

    double MaxEdgeAmount() const { return max_edge_amount_; }
    double MaxNodeTotal() const { return max_node_total_; }

    // Stroke width in [1, 6], proportional to amount / max edge amount.
    float EdgeWidth(double amount) const;

    // base(kind) + sqrt(total / max node total) * scale(kind); orgs draw larger.
    float NodeRadius(NodeKind kind, double total) const;
    float NodeRadius(const GraphNode& node) const { return NodeRadius(node.kind, node.total); }

    // Share of the heaviest edge carried by this amount, in [0, 1].
    double EdgeWeight(double amount) const;

    static constexpr float kMinEdgeWidth = 1.0f;
    static constexpr float kMaxEdgeWidth = 6.0f;
    static constexpr float kOrgBaseRadius = 12.0f;
    static constexpr float kOrgRadiusScale = 16.0f;
    static constexpr float kContractorBaseRadius = 6.0f;
    static constexpr float kContractorRadiusScale = 10.0f;

private:
    double max_edge_amount_ = 1.0;
    double max_node_total_ = 1.0;
};

struct GraphSnapshot {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    GraphScales scales;
    NetworkStats stats;
    std::unordered_map<std::string, NodeIndex> index; // id -> position in nodes

    std::size_t dropped_edge_count = 0;  // Edges with an endpoint missing from nodes
    std::size_t dropped_node_count = 0;  // Duplicate ids and parser rejects

    bool Empty() const { return nodes.empty(); }
    NodeIndex FindNode(const std::string& id) const;
};

class GraphDataModel {
public:
    // Validates referential integrity and derives scales. Never throws on bad references:
    // unresolved edges and duplicate nodes are dropped and counted.
    static GraphSnapshot Build(const std::vector<RawNode>& raw_nodes,
                               const std::vector<RawEdge>& raw_edges);

    // Same as Build, then carries over the payload's stats (or derives them when absent).
    static GraphSnapshot Build(const NetworkPayload& payload);

    static constexpr std::size_t kMaxLabelLength = 20;
    static std::string MakeLabel(const std::string& id);
};

} // namespace graph
} // namespace paygraph

#endif // PAYGRAPH_GRAPH_GRAPH_DATA_MODEL_H
