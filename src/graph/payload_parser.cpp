#include <paygraph/graph/payload_parser.h>

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace paygraph {
namespace graph {

namespace {

double NumberOr(const nlohmann::json& obj, const char* key, double fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    if (!obj[key].is_number()) {
        throw std::runtime_error(std::string("Field '") + key + "' is not a number");
    }
    return obj[key].get<double>();
}

std::int64_t IntegerOr(const nlohmann::json& obj, const char* key, std::int64_t fallback) {
    if (!obj.contains(key) || obj[key].is_null()) return fallback;
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
    if (obj[key].is_number_unsigned()) {
        std::uint64_t value = obj[key].get<std::uint64_t>();
        return value > static_cast<std::uint64_t>(kMax) ? kMax : static_cast<std::int64_t>(value);
    }
    if (obj[key].is_number_integer()) return obj[key].get<std::int64_t>();
    if (obj[key].is_number()) {
        // Saturate instead of casting out-of-range doubles; 2^63 is exact as a double
        double value = std::trunc(obj[key].get<double>());
        if (value >= 9223372036854775808.0) return kMax;
        if (value < -9223372036854775808.0) return kMin;
        return static_cast<std::int64_t>(value);
    }
    throw std::runtime_error(std::string("Field '") + key + "' is not a number");
}

std::string StringField(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_string()) {
        throw std::runtime_error(std::string("Field '") + key + "' is missing or not a string");
    }
    return obj[key].get<std::string>();
}

} // namespace

NetworkPayload ParseNetworkPayload(const std::string& body) {
    if (body.empty()) {
        throw std::runtime_error("Network response is empty, cannot parse graph.");
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse network response: " + std::string(e.what()));
    }
    return ParseNetworkPayload(j);
}

NetworkPayload ParseNetworkPayload(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Network response is not a JSON object");
    }
    if (!j.contains("nodes") || !j["nodes"].is_array()) {
        throw std::runtime_error("Network response has no 'nodes' array");
    }
    if (!j.contains("edges") || !j["edges"].is_array()) {
        throw std::runtime_error("Network response has no 'edges' array");
    }

    NetworkPayload payload;
    try {
        payload.nodes.reserve(j["nodes"].size());
        for (const auto& node_obj : j["nodes"]) {
            auto kind = ParseNodeKind(node_obj.value("type", ""));
            if (!kind.has_value()) {
                ++payload.rejected_node_count;
                continue;
            }
            RawNode node;
            node.id = StringField(node_obj, "id");
            node.kind = *kind;
            node.total = NumberOr(node_obj, "total", 0.0);
            payload.nodes.push_back(std::move(node));
        }

        payload.edges.reserve(j["edges"].size());
        for (const auto& edge_obj : j["edges"]) {
            RawEdge edge;
            edge.source = StringField(edge_obj, "source");
            edge.target = StringField(edge_obj, "target");
            edge.amount = NumberOr(edge_obj, "amount", 0.0);
            edge.contracts = IntegerOr(edge_obj, "contracts", 0);
            payload.edges.push_back(std::move(edge));
        }

        if (j.contains("stats") && j["stats"].is_object()) {
            const auto& stats_obj = j["stats"];
            NetworkStats stats;
            stats.org_count = IntegerOr(stats_obj, "org_count", 0);
            stats.contractor_count = IntegerOr(stats_obj, "contractor_count", 0);
            stats.edge_count = IntegerOr(stats_obj, "edge_count", 0);
            payload.stats = stats;
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed network response: " + std::string(e.what()));
    }
    return payload;
}

} // namespace graph
} // namespace paygraph
