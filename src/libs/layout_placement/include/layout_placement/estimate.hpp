#pragma once

#include <layout_placement/types.hpp>
#include <string>
#include <vector>

namespace layout_placement {

constexpr double default_tax_rate = 0.10;

struct EstimateLine {
    std::string spec_id;
    std::string name;
    int count = 0;
    long long unit_price = 0;
    long long subtotal = 0;
};

struct Estimate {
    std::vector<EstimateLine> lines;
    long long subtotal = 0;
    long long tax = 0;    // floor(subtotal * tax_rate)
    long long total = 0;
};

// Line-itemized cost of one pattern result. Unit prices are taken from the
// spec snapshot carried by each item. Throws std::invalid_argument for a
// negative or non-finite tax rate.
Estimate make_estimate(const PatternResult& result, double tax_rate = default_tax_rate);

} // namespace layout_placement
