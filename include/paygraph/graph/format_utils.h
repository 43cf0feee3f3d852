#ifndef PAYGRAPH_GRAPH_FORMAT_UTILS_H
#define PAYGRAPH_GRAPH_FORMAT_UTILS_H

#include <string>

namespace paygraph {
namespace graph {

// Whole euros with '.' thousands grouping, e.g. 1234567.4 -> "1.234.567 €".
std::string FormatCurrency(double amount);

// Plain integer grouping without the currency sign, e.g. 30000 -> "30.000".
std::string FormatNumber(double value);

// Compact selector label, e.g. 5000 -> "€5k", 100000 -> "€100k".
std::string FormatAmountShort(double amount);

} // namespace graph
} // namespace paygraph

#endif // PAYGRAPH_GRAPH_FORMAT_UTILS_H
