#pragma once

#include <paygraph/core/ui_interface.h>
#include <paygraph/graph/graph_data_model.h>

#include <string>
#include <vector>

namespace paygraph {
namespace test_support {

// Records notices instead of showing them.
class RecordingInterface : public UserInterface {
public:
    void displayError(const std::string& error) override { errors.push_back(error); }
    void displayStatus(const std::string& status) override { statuses.push_back(status); }
    void initialize() override {}
    void shutdown() override {}
    bool isGuiMode() const override { return false; }

    bool HasStatusContaining(const std::string& needle) const {
        for (const auto& s : statuses) {
            if (s.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::string> errors;
    std::vector<std::string> statuses;
};

// Org "A" paying contractor "B" 100.
inline graph::GraphSnapshot MakeTwoNodeGraph() {
    return graph::GraphDataModel::Build(
        {{"A", graph::NodeKind::ORG, 100.0}, {"B", graph::NodeKind::CONTRACTOR, 50.0}},
        {{"A", "B", 100.0, 1}});
}

// One org fanning out to `contractors` contractors with increasing amounts.
inline graph::GraphSnapshot MakeStarGraph(int contractors) {
    std::vector<graph::RawNode> nodes{{"hub", graph::NodeKind::ORG, 1000.0}};
    std::vector<graph::RawEdge> edges;
    for (int i = 0; i < contractors; ++i) {
        std::string id = "c" + std::to_string(i);
        nodes.push_back({id, graph::NodeKind::CONTRACTOR, 10.0 * (i + 1)});
        edges.push_back({"hub", id, 10.0 * (i + 1), 1});
    }
    return graph::GraphDataModel::Build(nodes, edges);
}

} // namespace test_support
} // namespace paygraph
