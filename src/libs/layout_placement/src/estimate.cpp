#include <layout_placement/estimate.hpp>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace layout_placement {

Estimate make_estimate(const PatternResult& result, double tax_rate) {
    if (!std::isfinite(tax_rate) || tax_rate < 0.0) {
        throw std::invalid_argument("tax rate must be finite and non-negative");
    }

    Estimate out;
    for (const auto& c : result.counts) {
        EstimateLine line;
        line.spec_id = c.spec.id;
        line.name = c.spec.name;
        line.count = c.count;
        line.unit_price = c.spec.unit_price;
        line.subtotal = c.spec.unit_price * c.count;
        out.subtotal += line.subtotal;
        out.lines.push_back(std::move(line));
    }
    out.tax = static_cast<long long>(std::floor(static_cast<double>(out.subtotal) * tax_rate));
    out.total = out.subtotal + out.tax;
    return out;
}

} // namespace layout_placement
