#include "gtest/gtest.h"
#include "test_helpers.h"

#include <paygraph/graph/graph_data_model.h>

#include <cmath>
#include <limits>

using namespace paygraph;
using graph::GraphDataModel;
using graph::GraphScales;
using graph::NodeKind;

TEST(GraphDataModelTest, OrgAndContractorSingleEdge) {
    graph::GraphSnapshot g = test_support::MakeTwoNodeGraph();

    ASSERT_EQ(g.nodes.size(), 2u);
    ASSERT_EQ(g.edges.size(), 1u);
    EXPECT_EQ(g.edges[0].source, g.FindNode("A"));
    EXPECT_EQ(g.edges[0].target, g.FindNode("B"));

    // The only edge is the heaviest one
    EXPECT_FLOAT_EQ(g.scales.EdgeWidth(g.edges[0].amount), 6.0f);

    float radius_a = g.scales.NodeRadius(g.nodes[g.FindNode("A")]);
    float radius_b = g.scales.NodeRadius(g.nodes[g.FindNode("B")]);
    EXPECT_TRUE(std::isfinite(radius_a));
    EXPECT_TRUE(std::isfinite(radius_b));
    EXPECT_GT(radius_a, radius_b);

    EXPECT_EQ(g.stats.org_count, 1);
    EXPECT_EQ(g.stats.contractor_count, 1);
    EXPECT_EQ(g.stats.edge_count, 1);
}

TEST(GraphDataModelTest, HeaviestEdgeIsFullWidthAndOrgOutweighsContractor) {
    graph::GraphSnapshot g = GraphDataModel::Build(
        {{"A", NodeKind::ORG, 100000.0}, {"B", NodeKind::CONTRACTOR, 5000.0}},
        {{"A", "B", 50000.0, 3}});

    ASSERT_EQ(g.edges.size(), 1u);
    EXPECT_EQ(g.edges[0].contracts, 3);
    EXPECT_FLOAT_EQ(g.scales.EdgeWidth(50000.0), 6.0f);
    EXPECT_GT(g.scales.NodeRadius(g.nodes[0]), g.scales.NodeRadius(g.nodes[1]));
}

TEST(GraphDataModelTest, DropsEdgesWithUnknownEndpoints) {
    graph::GraphSnapshot g = GraphDataModel::Build(
        {{"A", NodeKind::ORG, 10.0}},
        {{"A", "missing", 5.0, 1}, {"ghost", "A", 5.0, 1}});

    EXPECT_EQ(g.nodes.size(), 1u);
    EXPECT_TRUE(g.edges.empty());
    EXPECT_EQ(g.dropped_edge_count, 2u);
    EXPECT_EQ(g.stats.edge_count, 0);
}

TEST(GraphDataModelTest, EmptyGraphHasSafeScales) {
    graph::GraphSnapshot g = GraphDataModel::Build({}, {});

    EXPECT_TRUE(g.Empty());
    EXPECT_DOUBLE_EQ(g.scales.MaxEdgeAmount(), 1.0);
    EXPECT_DOUBLE_EQ(g.scales.MaxNodeTotal(), 1.0);
    EXPECT_FLOAT_EQ(g.scales.NodeRadius(NodeKind::ORG, 0.0), GraphScales::kOrgBaseRadius);
    EXPECT_FLOAT_EQ(g.scales.EdgeWidth(0.0), GraphScales::kMinEdgeWidth);
}

TEST(GraphDataModelTest, AllZeroTotalsStayFinite) {
    graph::GraphSnapshot g = GraphDataModel::Build(
        {{"A", NodeKind::ORG, 0.0}, {"B", NodeKind::CONTRACTOR, 0.0}},
        {{"A", "B", 0.0, 0}});

    for (const auto& node : g.nodes) {
        float r = g.scales.NodeRadius(node);
        EXPECT_TRUE(std::isfinite(r));
        EXPECT_GT(r, 0.0f);
    }
    EXPECT_FLOAT_EQ(g.scales.EdgeWidth(g.edges[0].amount), 1.0f);
}

TEST(GraphDataModelTest, EdgeWidthIsClampedAndProportional) {
    GraphScales scales(1000.0, 1.0);
    EXPECT_FLOAT_EQ(scales.EdgeWidth(1000.0), 6.0f);
    EXPECT_FLOAT_EQ(scales.EdgeWidth(500.0), 3.0f);
    EXPECT_FLOAT_EQ(scales.EdgeWidth(10.0), 1.0f);   // 0.06 clamps up to the minimum
    EXPECT_FLOAT_EQ(scales.EdgeWidth(5000.0), 6.0f); // Never above the maximum
    EXPECT_FLOAT_EQ(scales.EdgeWidth(-20.0), 1.0f);
}

TEST(GraphDataModelTest, NodeRadiusUsesSquareRootOfShare) {
    GraphScales scales(1.0, 400.0);
    EXPECT_FLOAT_EQ(scales.NodeRadius(NodeKind::ORG, 400.0), 12.0f + 16.0f);
    EXPECT_FLOAT_EQ(scales.NodeRadius(NodeKind::ORG, 100.0), 12.0f + 0.5f * 16.0f);
    EXPECT_FLOAT_EQ(scales.NodeRadius(NodeKind::CONTRACTOR, 400.0), 6.0f + 10.0f);
    EXPECT_FLOAT_EQ(scales.NodeRadius(NodeKind::CONTRACTOR, 0.0), 6.0f);
}

TEST(GraphDataModelTest, NegativeAndNanValuesAreClampedToZero) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    graph::GraphSnapshot g = GraphDataModel::Build(
        {{"A", NodeKind::ORG, -50.0}, {"B", NodeKind::CONTRACTOR, nan}},
        {{"A", "B", nan, -3}});

    EXPECT_DOUBLE_EQ(g.nodes[0].total, 0.0);
    EXPECT_DOUBLE_EQ(g.nodes[1].total, 0.0);
    EXPECT_DOUBLE_EQ(g.edges[0].amount, 0.0);
    EXPECT_EQ(g.edges[0].contracts, 0);
    EXPECT_TRUE(std::isfinite(g.scales.EdgeWidth(g.edges[0].amount)));
}

TEST(GraphDataModelTest, DuplicateIdsKeepFirstOccurrence) {
    graph::GraphSnapshot g = GraphDataModel::Build(
        {{"A", NodeKind::ORG, 10.0}, {"A", NodeKind::CONTRACTOR, 99.0}, {"B", NodeKind::CONTRACTOR, 1.0}},
        {{"A", "B", 1.0, 1}});

    ASSERT_EQ(g.nodes.size(), 2u);
    EXPECT_EQ(g.nodes[g.FindNode("A")].kind, NodeKind::ORG);
    EXPECT_DOUBLE_EQ(g.nodes[g.FindNode("A")].total, 10.0);
    EXPECT_EQ(g.dropped_node_count, 1u);
    EXPECT_EQ(g.edges.size(), 1u);
}

TEST(GraphDataModelTest, PayloadStatsWinOverDerivedOnes) {
    graph::NetworkPayload payload;
    payload.nodes = {{"A", NodeKind::ORG, 1.0}, {"B", NodeKind::CONTRACTOR, 1.0}};
    payload.edges = {{"A", "B", 1.0, 1}};
    payload.stats = graph::NetworkStats{10, 20, 30};
    payload.rejected_node_count = 2;

    graph::GraphSnapshot g = GraphDataModel::Build(payload);
    EXPECT_EQ(g.stats.org_count, 10);
    EXPECT_EQ(g.stats.contractor_count, 20);
    EXPECT_EQ(g.stats.edge_count, 30);
    EXPECT_EQ(g.dropped_node_count, 2u);
}

TEST(GraphDataModelTest, LabelsAreTruncated) {
    EXPECT_EQ(GraphDataModel::MakeLabel("short"), "short");
    EXPECT_EQ(GraphDataModel::MakeLabel("12345678901234567890"), "12345678901234567890");
    EXPECT_EQ(GraphDataModel::MakeLabel("123456789012345678901"), "12345678901234567890…");
}

TEST(GraphDataModelTest, LabelTruncationCountsCharactersNotBytes) {
    // 19 ASCII letters then three two-byte Greek letters
    std::string id = std::string(19, 'x') + "αβγ";
    EXPECT_EQ(GraphDataModel::MakeLabel(id), std::string(19, 'x') + "α…");
}

TEST(GraphDataModelTest, ShortGreekIdsAreKeptWhole) {
    std::string fifteen = "ΔΗΜΟΣ ΑΘΗΝΑΙΩΝ";
    fifteen += "Α";
    EXPECT_EQ(GraphDataModel::MakeLabel(fifteen), fifteen);
    EXPECT_EQ(GraphDataModel::MakeLabel("ΥΠΟΥΡΓΕΙΟ ΥΓΕΙΑΣ"), "ΥΠΟΥΡΓΕΙΟ ΥΓΕΙΑΣ");
}

TEST(GraphDataModelTest, LongGreekIdsKeepTwentyCharacters) {
    EXPECT_EQ(GraphDataModel::MakeLabel("ΠΕΡΙΦΕΡΕΙΑ ΑΤΤΙΚΗΣ ΑΘΗΝΑ"), "ΠΕΡΙΦΕΡΕΙΑ ΑΤΤΙΚΗΣ Α…");
    // Exactly twenty Greek letters need no ellipsis
    std::string twenty;
    for (int i = 0; i < 20; ++i) twenty += "Ω";
    EXPECT_EQ(GraphDataModel::MakeLabel(twenty), twenty);
}

TEST(GraphDataModelTest, NodeKindNames) {
    EXPECT_EQ(graph::ParseNodeKind("org"), NodeKind::ORG);
    EXPECT_EQ(graph::ParseNodeKind("contractor"), NodeKind::CONTRACTOR);
    EXPECT_FALSE(graph::ParseNodeKind("vendor").has_value());
    EXPECT_STREQ(graph::NodeKindName(NodeKind::ORG), "org");
    EXPECT_STREQ(graph::NodeKindDisplayName(NodeKind::CONTRACTOR), "Contractor");
}
