#pragma once
#include <cstddef>
#include <limits>

namespace paygraph {

// Index of a node inside one graph snapshot. Stable for the lifetime of the snapshot.
using NodeIndex = std::size_t;

// Sentinel value representing "no node" (nothing hovered, nothing dragged)
constexpr NodeIndex kInvalidNodeIndex = std::numeric_limits<NodeIndex>::max();

} // namespace paygraph
