#pragma once

#include <string>
#include <vector>

namespace paygraph {

struct ViewerConfig {
    std::string api_base;
    double min_amount;
    int max_edges;
    std::vector<double> min_amount_choices; // Offered by the "Min amount" selector
};

// Compiled-in defaults from config.h, overridden by PAYGRAPH_API_BASE, PAYGRAPH_MIN_AMOUNT and
// PAYGRAPH_MAX_EDGES. Invalid values are reported on std::cerr and ignored.
ViewerConfig LoadViewerConfig();

} // namespace paygraph
