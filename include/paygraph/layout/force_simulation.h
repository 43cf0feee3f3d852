#ifndef PAYGRAPH_LAYOUT_FORCE_SIMULATION_H
#define PAYGRAPH_LAYOUT_FORCE_SIMULATION_H

#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include <imgui.h>

#include <paygraph/graph/graph_data_model.h>

namespace paygraph {
namespace layout {

// Per-node physics state, kept parallel to GraphSnapshot::nodes
struct NodePhysics {
    ImVec2 position;
    ImVec2 velocity;
    bool is_pinned;
    ImVec2 pin;
    NodePhysics() : position(0.0f, 0.0f), velocity(0.0f, 0.0f), is_pinned(false), pin(0.0f, 0.0f) {}
};

// Link endpoints resolved to indices once at seed time, plus the spring rest length
struct LinkSpring {
    NodeIndex source;
    NodeIndex target;
    float rest_length;
};

enum class SimulationState {
    IDLE,     // Nothing seeded yet, or stopped
    RUNNING,
    SETTLED   // Alpha fell below alpha_min; waits for Reheat / SetAlphaTarget
};

/*
 * Force layout driven by a cooling temperature (alpha). Every tick applies centering, link
 * springs and pairwise charge, all scaled by alpha, then integrates with velocity decay.
 *
 * Nodes and links are visited in index order so results are bit-for-bit reproducible for a
 * given seed. Charge is O(n^2) per tick: fine for low hundreds of nodes, not for thousands.
 */
class ForceSimulation {
public:
    struct LayoutParams {
        float center_strength;
        float spring_strength;
        float base_rest_length;
        float rest_length_span;   // Added to the rest length of the lightest edges
        float charge_strength;    // Negative repels
        float velocity_decay;     // Multiplier applied each tick, < 1
        float initial_alpha;
        float alpha_min;
        float alpha_decay;
        float alpha_target;
        float seed_spread;        // Fraction of the bounds used for the random seed box
        std::uint32_t random_seed;

        LayoutParams();
    };

    explicit ForceSimulation(const LayoutParams& params = LayoutParams());

    // Replaces all state: randomizes positions inside bounds (origin at 0,0) and starts running.
    void Seed(const graph::GraphSnapshot& graph, const ImVec2& bounds);

    // Advances one step. Returns true while the simulation wants another tick.
    bool Tick();

    // Pins the node with the given id. Returns false if the id is unknown.
    bool Pin(const std::string& node_id, float x, float y);
    bool Pin(NodeIndex index, float x, float y);
    bool Unpin(const std::string& node_id);
    bool Unpin(NodeIndex index);

    // Sets alpha (clamped to [0, 1]) and resumes ticking if anything is seeded.
    void Reheat(float alpha);
    void SetAlphaTarget(float alpha_target);

    // Drops all nodes and returns to IDLE.
    void Stop();

    SimulationState State() const { return state_; }
    bool IsRunning() const { return state_ == SimulationState::RUNNING; }
    float Alpha() const { return alpha_; }
    float AlphaTarget() const { return alpha_target_; }
    std::uint64_t TickCount() const { return tick_count_; }

    std::size_t NodeCount() const { return bodies_.size(); }
    std::size_t LiveEdgeCount() const { return springs_.size(); }
    const std::vector<NodePhysics>& Bodies() const { return bodies_; }
    std::vector<ImVec2> Positions() const;
    const std::vector<LinkSpring>& Springs() const { return springs_; }
    ImVec2 NodePosition(NodeIndex index) const;
    bool IsPinned(NodeIndex index) const;

    const LayoutParams& GetParams() const { return params_; }
    void SetParams(const LayoutParams& params);

private:
    void ApplyCenteringForce();
    void ApplyLinkForce();
    void ApplyChargeForce();
    void Integrate();

    LayoutParams params_;
    std::vector<NodePhysics> bodies_;
    std::vector<LinkSpring> springs_;
    std::unordered_map<std::string, NodeIndex> index_;
    ImVec2 center_;
    float alpha_ = 0.0f;
    float alpha_target_ = 0.0f;
    SimulationState state_ = SimulationState::IDLE;
    std::uint64_t tick_count_ = 0;
    std::mt19937 rng_;
};

const char* SimulationStateName(SimulationState state);

} // namespace layout
} // namespace paygraph

#endif // PAYGRAPH_LAYOUT_FORCE_SIMULATION_H
