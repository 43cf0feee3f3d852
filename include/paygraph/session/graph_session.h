#ifndef PAYGRAPH_SESSION_GRAPH_SESSION_H
#define PAYGRAPH_SESSION_GRAPH_SESSION_H

#include <cstdint>
#include <vector>
#include <imgui.h>

#include <paygraph/core/ui_interface.h>
#include <paygraph/graph/graph_data_model.h>
#include <paygraph/interaction/input_source.h>
#include <paygraph/interaction/interaction_controller.h>
#include <paygraph/layout/force_simulation.h>
#include <paygraph/render/frame_source.h>
#include <paygraph/render/render_snapshot.h>
#include <paygraph/render/viewport_transform.h>

namespace paygraph {
namespace session {

struct SessionParams {
    ImVec2 viewport_size = ImVec2(960.0f, 500.0f);
    layout::ForceSimulation::LayoutParams layout;
    render::ZoomLimits zoom_limits;
    interaction::InteractionParams interaction;
    float toolbar_zoom_in = 1.3f;
    float toolbar_zoom_out = 0.7f;
};

/*
 * One interactive network view: the current graph snapshot, its simulation, the viewport
 * transform and the input controller.
 *
 * While the simulation runs, the session is subscribed to the FrameSource and ticks once per
 * pumped frame. It unsubscribes when the layout settles, when the graph is replaced and when
 * the session is destroyed; reheating through interaction subscribes again.
 * After every tick and every visible change a RenderSnapshot is published to the sinks.
 */
class GraphSession {
public:
    GraphSession(render::FrameSource& frames, UserInterface& ui, const SessionParams& params = SessionParams());
    ~GraphSession();

    GraphSession(const GraphSession&) = delete;
    GraphSession& operator=(const GraphSession&) = delete;

    // Replaces the graph wholesale. The running simulation is discarded and reseeded;
    // the viewport transform is kept.
    void LoadPayload(const graph::NetworkPayload& payload);
    void LoadGraph(graph::GraphSnapshot graph);

    std::uint32_t HandleInput(const interaction::InputEvent& event);
    void HandleInput(interaction::InputSource& source);

    // Advances the simulation by one tick and publishes. Returns true while more ticks are wanted.
    bool Tick();

    void ZoomIn();
    void ZoomOut();
    void ResetView();
    void SetViewportSize(const ImVec2& size);

    // Sinks are not owned and must be removed before they are destroyed.
    void AddRenderSink(render::RenderSink* sink);
    void RemoveRenderSink(render::RenderSink* sink);

    const render::RenderSnapshot& Snapshot() const { return snapshot_; }
    bool IsScheduled() const { return subscription_.Active(); }

    const graph::GraphSnapshot& Graph() const { return graph_; }
    const layout::ForceSimulation& Simulation() const { return simulation_; }
    layout::ForceSimulation& Simulation() { return simulation_; }
    const render::ViewportTransform& Transform() const { return transform_; }
    const interaction::InteractionController& Controller() const { return controller_; }
    ImVec2 ViewportSize() const { return params_.viewport_size; }

private:
    void OnFrame();
    void EnsureScheduled();
    void Detach();
    void Publish();
    void ReportLoad();

    render::FrameSource& frames_;
    UserInterface& ui_;
    SessionParams params_;

    graph::GraphSnapshot graph_;
    layout::ForceSimulation simulation_;
    render::ViewportTransform transform_;
    interaction::InteractionController controller_;

    render::FrameSubscription subscription_;
    render::RenderSnapshot snapshot_;
    std::vector<render::RenderSink*> sinks_;
};

} // namespace session
} // namespace paygraph

#endif // PAYGRAPH_SESSION_GRAPH_SESSION_H
