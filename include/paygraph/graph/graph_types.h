#ifndef PAYGRAPH_GRAPH_GRAPH_TYPES_H
#define PAYGRAPH_GRAPH_GRAPH_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <paygraph/core/id_types.h>

namespace paygraph {
namespace graph {

enum class NodeKind {
    ORG,
    CONTRACTOR
};

// Returns std::nullopt for anything other than "org" / "contractor".
std::optional<NodeKind> ParseNodeKind(const std::string& type);
const char* NodeKindName(NodeKind kind);         // "org" / "contractor"
const char* NodeKindDisplayName(NodeKind kind);  // "Organization" / "Contractor"

// --- Records as they arrive from the data source ---
struct RawNode {
    std::string id;
    NodeKind kind = NodeKind::CONTRACTOR;
    double total = 0.0;
};

struct RawEdge {
    std::string source;
    std::string target;
    double amount = 0.0;
    std::int64_t contracts = 0;
};

struct NetworkStats {
    std::int64_t org_count = 0;
    std::int64_t contractor_count = 0;
    std::int64_t edge_count = 0;
};

struct NetworkPayload {
    std::vector<RawNode> nodes;
    std::vector<RawEdge> edges;
    std::optional<NetworkStats> stats; // Absent when the payload carries no "stats" object
    std::size_t rejected_node_count = 0; // Nodes dropped by the parser (unknown type)
};

// --- Validated graph, ready for the simulation ---
struct GraphNode {
    std::string id;
    NodeKind kind;
    double total;        // Never negative
    std::string label;   // Truncated id used for drawing
};

// Edges refer to nodes by index into GraphSnapshot::nodes, never by pointer.
struct GraphEdge {
    NodeIndex source;
    NodeIndex target;
    double amount;       // Never negative
    std::int64_t contracts;
};

} // namespace graph
} // namespace paygraph

#endif // PAYGRAPH_GRAPH_GRAPH_TYPES_H
