#include <paygraph/core/app_config.h>
#include "config.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace paygraph {

namespace {
const char* GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}
} // namespace

ViewerConfig LoadViewerConfig() {
    ViewerConfig config;
    config.api_base = PAYGRAPH_DEFAULT_API_BASE;
    config.min_amount = static_cast<double>(PAYGRAPH_DEFAULT_MIN_AMOUNT);
    config.max_edges = PAYGRAPH_DEFAULT_MAX_EDGES;
    config.min_amount_choices = {5000.0, 10000.0, 30000.0, 50000.0, 100000.0};

    if (const char* api_base = GetEnv("PAYGRAPH_API_BASE")) {
        config.api_base = api_base;
    }

    if (const char* min_amount = GetEnv("PAYGRAPH_MIN_AMOUNT")) {
        try {
            std::size_t consumed = 0;
            double value = std::stod(min_amount, &consumed);
            if (consumed != std::string(min_amount).size() || !std::isfinite(value) || value < 0.0) {
                throw std::invalid_argument("not a finite non-negative number");
            }
            config.min_amount = value;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Ignoring PAYGRAPH_MIN_AMOUNT='" << min_amount << "': " << e.what() << std::endl;
        }
    }

    if (const char* max_edges = GetEnv("PAYGRAPH_MAX_EDGES")) {
        try {
            std::size_t consumed = 0;
            int value = std::stoi(max_edges, &consumed);
            if (consumed != std::string(max_edges).size() || value <= 0) {
                throw std::invalid_argument("not a positive integer");
            }
            config.max_edges = value;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Ignoring PAYGRAPH_MAX_EDGES='" << max_edges << "': " << e.what() << std::endl;
        }
    }

    bool listed = false;
    for (double choice : config.min_amount_choices) {
        if (choice == config.min_amount) listed = true;
    }
    if (!listed) {
        config.min_amount_choices.push_back(config.min_amount);
        std::sort(config.min_amount_choices.begin(), config.min_amount_choices.end());
    }
    return config;
}

} // namespace paygraph
