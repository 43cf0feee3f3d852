#include <paygraph/graph/format_utils.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace paygraph {
namespace graph {

namespace {
// Decimal digits of a non-negative whole number; works beyond the range of any integer type.
std::string WholeDigits(double value) {
    char buffer[400];
    std::snprintf(buffer, sizeof(buffer), "%.0f", value);
    return buffer;
}
} // namespace

std::string FormatNumber(double value) {
    if (!std::isfinite(value)) {
        return "0";
    }
    double rounded = std::round(value);
    bool negative = rounded < 0.0;
    std::string digits = WholeDigits(std::fabs(rounded));
    std::string grouped;
    grouped.reserve(digits.size() + digits.size() / 3 + 1);
    int lead = static_cast<int>(digits.size() % 3);
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && static_cast<int>(i % 3) == lead) {
            grouped += '.';
        }
        grouped += digits[i];
    }
    return (negative && digits != "0") ? "-" + grouped : grouped;
}

std::string FormatCurrency(double amount) {
    return FormatNumber(amount) + " €";
}

std::string FormatAmountShort(double amount) {
    if (std::isfinite(amount) && amount >= 1000.0 && std::fmod(amount, 1000.0) == 0.0) {
        return "€" + WholeDigits(amount / 1000.0) + "k";
    }
    return "€" + FormatNumber(amount);
}

} // namespace graph
} // namespace paygraph
