#include <paygraph/layout/force_simulation.h>

#include <algorithm>
#include <cmath>

namespace paygraph {
namespace layout {

ForceSimulation::LayoutParams::LayoutParams()
    : center_strength(0.001f),
      spring_strength(0.05f),
      base_rest_length(120.0f),
      rest_length_span(80.0f),
      charge_strength(-300.0f),
      velocity_decay(0.6f),
      initial_alpha(1.0f),
      alpha_min(0.001f),
      alpha_decay(0.02f),
      alpha_target(0.0f),
      seed_spread(0.6f),
      random_seed(123) {} // fixed seed for reproducible layouts

ForceSimulation::ForceSimulation(const LayoutParams& params)
    : params_(params), center_(0.0f, 0.0f), alpha_target_(params.alpha_target), rng_(params.random_seed) {}

void ForceSimulation::Seed(const graph::GraphSnapshot& graph, const ImVec2& bounds) {
    bodies_.assign(graph.nodes.size(), NodePhysics());
    springs_.clear();
    springs_.reserve(graph.edges.size());
    index_ = graph.index;
    center_ = ImVec2(bounds.x * 0.5f, bounds.y * 0.5f);

    rng_.seed(params_.random_seed);
    std::uniform_real_distribution<float> jitter(-0.5f, 0.5f);
    for (auto& body : bodies_) {
        body.position.x = center_.x + jitter(rng_) * bounds.x * params_.seed_spread;
        body.position.y = center_.y + jitter(rng_) * bounds.y * params_.seed_spread;
    }

    // Heavier edges get shorter springs and pull their endpoints closer
    for (const auto& edge : graph.edges) {
        float weight = static_cast<float>(graph.scales.EdgeWeight(edge.amount));
        springs_.push_back(LinkSpring{edge.source, edge.target,
                                      params_.base_rest_length + (1.0f - weight) * params_.rest_length_span});
    }

    alpha_ = std::clamp(params_.initial_alpha, 0.0f, 1.0f);
    alpha_target_ = std::clamp(params_.alpha_target, 0.0f, 1.0f);
    tick_count_ = 0;
    state_ = SimulationState::RUNNING;
}

bool ForceSimulation::Tick() {
    if (state_ != SimulationState::RUNNING) {
        return false;
    }
    if (bodies_.empty()) {
        state_ = SimulationState::SETTLED;
        return false;
    }

    ApplyCenteringForce();
    ApplyLinkForce();
    ApplyChargeForce();
    Integrate();
    ++tick_count_;

    alpha_ += (alpha_target_ - alpha_) * params_.alpha_decay;
    if (alpha_ < params_.alpha_min) {
        state_ = SimulationState::SETTLED;
        return false;
    }
    return true;
}

void ForceSimulation::ApplyCenteringForce() {
    const float k = params_.center_strength * alpha_;
    for (auto& body : bodies_) {
        if (body.is_pinned) continue;
        body.velocity.x += (center_.x - body.position.x) * k;
        body.velocity.y += (center_.y - body.position.y) * k;
    }
}

void ForceSimulation::ApplyLinkForce() {
    for (const auto& spring : springs_) {
        NodePhysics& source = bodies_[spring.source];
        NodePhysics& target = bodies_[spring.target];

        float dx = target.position.x - source.position.x;
        float dy = target.position.y - source.position.y;
        float distance = std::sqrt(dx * dx + dy * dy);
        if (distance == 0.0f) distance = 1.0f;

        float force = (distance - spring.rest_length) / distance * params_.spring_strength * alpha_;
        source.velocity.x += dx * force;
        source.velocity.y += dy * force;
        target.velocity.x -= dx * force;
        target.velocity.y -= dy * force;
    }
}

void ForceSimulation::ApplyChargeForce() {
    const float strength = params_.charge_strength * alpha_;
    for (std::size_t i = 0; i < bodies_.size(); ++i) {
        NodePhysics& a = bodies_[i];
        for (std::size_t j = i + 1; j < bodies_.size(); ++j) {
            NodePhysics& b = bodies_[j];

            float dx = b.position.x - a.position.x;
            float dy = b.position.y - a.position.y;
            float dist_sq = dx * dx + dy * dy;
            if (dist_sq == 0.0f) dist_sq = 1.0f;
            float distance = std::sqrt(dist_sq);
            float force = strength / dist_sq;

            // force is negative for repulsion, so a moves away from b and b away from a
            float fx = dx / distance * force;
            float fy = dy / distance * force;
            a.velocity.x += fx;
            a.velocity.y += fy;
            b.velocity.x -= fx;
            b.velocity.y -= fy;
        }
    }
}

void ForceSimulation::Integrate() {
    for (auto& body : bodies_) {
        if (body.is_pinned) {
            body.position = body.pin;
            body.velocity = ImVec2(0.0f, 0.0f);
            continue;
        }
        body.velocity.x *= params_.velocity_decay;
        body.velocity.y *= params_.velocity_decay;
        body.position.x += body.velocity.x;
        body.position.y += body.velocity.y;
    }
}

bool ForceSimulation::Pin(const std::string& node_id, float x, float y) {
    auto it = index_.find(node_id);
    if (it == index_.end()) return false;
    return Pin(it->second, x, y);
}

bool ForceSimulation::Pin(NodeIndex index, float x, float y) {
    if (index >= bodies_.size()) return false;
    NodePhysics& body = bodies_[index];
    body.is_pinned = true;
    body.pin = ImVec2(x, y);
    body.velocity = ImVec2(0.0f, 0.0f);
    return true;
}

bool ForceSimulation::Unpin(const std::string& node_id) {
    auto it = index_.find(node_id);
    if (it == index_.end()) return false;
    return Unpin(it->second);
}

bool ForceSimulation::Unpin(NodeIndex index) {
    if (index >= bodies_.size()) return false;
    bodies_[index].is_pinned = false;
    return true;
}

void ForceSimulation::Reheat(float alpha) {
    alpha_ = std::clamp(alpha, 0.0f, 1.0f);
    if (state_ != SimulationState::IDLE) {
        state_ = SimulationState::RUNNING;
    }
}

void ForceSimulation::SetAlphaTarget(float alpha_target) {
    alpha_target_ = std::clamp(alpha_target, 0.0f, 1.0f);
    if (state_ == SimulationState::SETTLED && alpha_target_ >= params_.alpha_min) {
        state_ = SimulationState::RUNNING;
    }
}

void ForceSimulation::Stop() {
    bodies_.clear();
    springs_.clear();
    index_.clear();
    alpha_ = 0.0f;
    state_ = SimulationState::IDLE;
}

std::vector<ImVec2> ForceSimulation::Positions() const {
    std::vector<ImVec2> positions;
    positions.reserve(bodies_.size());
    for (const auto& body : bodies_) {
        positions.push_back(body.position);
    }
    return positions;
}

ImVec2 ForceSimulation::NodePosition(NodeIndex index) const {
    if (index >= bodies_.size()) return ImVec2(0.0f, 0.0f);
    return bodies_[index].position;
}

bool ForceSimulation::IsPinned(NodeIndex index) const {
    return index < bodies_.size() && bodies_[index].is_pinned;
}

void ForceSimulation::SetParams(const LayoutParams& params) {
    params_ = params;
    alpha_target_ = std::clamp(params_.alpha_target, 0.0f, 1.0f);
}

const char* SimulationStateName(SimulationState state) {
    switch (state) {
        case SimulationState::IDLE: return "idle";
        case SimulationState::RUNNING: return "running";
        case SimulationState::SETTLED: return "settled";
    }
    return "unknown";
}

} // namespace layout
} // namespace paygraph
