#include <paygraph/session/graph_session.h>

#include <algorithm>
#include <string>
#include <utility>

namespace paygraph {
namespace session {

GraphSession::GraphSession(render::FrameSource& frames, UserInterface& ui, const SessionParams& params)
    : frames_(frames),
      ui_(ui),
      params_(params),
      simulation_(params.layout),
      transform_(params.zoom_limits),
      controller_(simulation_, transform_, params.interaction) {
    controller_.SetGraph(&graph_);
    Publish();
}

GraphSession::~GraphSession() {
    Detach();
}

void GraphSession::LoadPayload(const graph::NetworkPayload& payload) {
    LoadGraph(graph::GraphDataModel::Build(payload));
}

void GraphSession::LoadGraph(graph::GraphSnapshot graph) {
    // The old simulation must stop ticking before its nodes go away
    Detach();
    graph_ = std::move(graph);
    controller_.SetGraph(&graph_);
    simulation_.Seed(graph_, params_.viewport_size);
    ReportLoad();
    Publish();
    EnsureScheduled();
}

void GraphSession::ReportLoad() {
    ui_.displayStatus("Network loaded: " + std::to_string(graph_.stats.org_count) + " orgs, " +
                      std::to_string(graph_.stats.contractor_count) + " contractors, " +
                      std::to_string(graph_.stats.edge_count) + " links");
    if (graph_.dropped_edge_count > 0) {
        ui_.displayStatus("Skipped " + std::to_string(graph_.dropped_edge_count) +
                          " link(s) with unknown endpoints");
    }
    if (graph_.dropped_node_count > 0) {
        ui_.displayStatus("Skipped " + std::to_string(graph_.dropped_node_count) +
                          " duplicate or unrecognized node(s)");
    }
}

std::uint32_t GraphSession::HandleInput(const interaction::InputEvent& event) {
    std::uint32_t result = controller_.Handle(event);
    if (result & interaction::kSimulationReheated) {
        EnsureScheduled();
    }
    if (result != interaction::kNoChange) {
        Publish();
    }
    return result;
}

void GraphSession::HandleInput(interaction::InputSource& source) {
    for (const auto& event : source.PollEvents()) {
        HandleInput(event);
    }
}

bool GraphSession::Tick() {
    bool more = simulation_.Tick();
    Publish();
    return more;
}

void GraphSession::OnFrame() {
    if (!Tick()) {
        Detach();
    }
}

void GraphSession::EnsureScheduled() {
    if (!subscription_.Active() && simulation_.IsRunning()) {
        subscription_ = frames_.Subscribe([this]() { OnFrame(); });
    }
}

void GraphSession::Detach() {
    subscription_.Reset();
}

void GraphSession::ZoomIn() {
    if (transform_.ZoomAroundCenter(params_.toolbar_zoom_in, params_.viewport_size)) {
        Publish();
    }
}

void GraphSession::ZoomOut() {
    if (transform_.ZoomAroundCenter(params_.toolbar_zoom_out, params_.viewport_size)) {
        Publish();
    }
}

void GraphSession::ResetView() {
    transform_.Reset();
    Publish();
}

void GraphSession::SetViewportSize(const ImVec2& size) {
    params_.viewport_size = size;
}

void GraphSession::AddRenderSink(render::RenderSink* sink) {
    if (!sink || std::find(sinks_.begin(), sinks_.end(), sink) != sinks_.end()) {
        return;
    }
    sinks_.push_back(sink);
    sink->OnSnapshot(snapshot_);
}

void GraphSession::RemoveRenderSink(render::RenderSink* sink) {
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void GraphSession::Publish() {
    render::RenderSnapshot next;
    next.revision = snapshot_.revision + 1;

    const auto& bodies = simulation_.Bodies();
    // Before the first seed the simulation has no bodies for the (empty) graph
    std::size_t node_count = std::min(graph_.nodes.size(), bodies.size());
    next.nodes.reserve(node_count);
    for (std::size_t i = 0; i < node_count; ++i) {
        const graph::GraphNode& node = graph_.nodes[i];
        next.nodes.push_back(render::NodeDrawable{
            node.id,
            node.label,
            node.kind,
            bodies[i].position,
            graph_.scales.NodeRadius(node),
            bodies[i].is_pinned,
            controller_.HoveredNode() == i});
    }

    if (node_count == graph_.nodes.size()) {
        next.edges.reserve(graph_.edges.size());
        for (const auto& edge : graph_.edges) {
            next.edges.push_back(render::EdgeDrawable{
                edge.source,
                edge.target,
                bodies[edge.source].position,
                bodies[edge.target].position,
                graph_.scales.EdgeWidth(edge.amount)});
        }
    }

    next.transform = render::TransformState{transform_.Pan(), transform_.Scale()};
    next.tooltip = controller_.ActiveTooltip();
    next.simulation_state = simulation_.State();
    next.alpha = simulation_.Alpha();
    next.stats = graph_.stats;

    snapshot_ = std::move(next);
    for (auto* sink : sinks_) {
        sink->OnSnapshot(snapshot_);
    }
}

} // namespace session
} // namespace paygraph
