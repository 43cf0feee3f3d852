#ifndef PAYGRAPH_GRAPH_PAYLOAD_PARSER_H
#define PAYGRAPH_GRAPH_PAYLOAD_PARSER_H

#include <string>
#include <nlohmann/json_fwd.hpp>

#include <paygraph/graph/graph_types.h>

namespace paygraph {
namespace graph {

// Decodes the /network response body.
// Throws std::runtime_error when the body is not JSON or "nodes"/"edges" are not arrays.
// Nodes with an unknown "type" are skipped and counted in rejected_node_count.
NetworkPayload ParseNetworkPayload(const std::string& body);
NetworkPayload ParseNetworkPayload(const nlohmann::json& j);

} // namespace graph
} // namespace paygraph

#endif // PAYGRAPH_GRAPH_PAYLOAD_PARSER_H
