#include <layout_geometry/rectilinear.hpp>
#include <algorithm>
#include <cmath>
#include <map>

namespace layout_geometry {

namespace {

// Accumulates offsets from the first member so a chain of identical values
// averages back to exactly that value.
double chain_mean(const std::vector<double>& chain) {
    const double base = chain.front();
    double offset_sum = 0.0;
    for (double v : chain) offset_sum += v - base;
    return base + offset_sum / static_cast<double>(chain.size());
}

} // namespace

std::vector<double> snap_values(const std::vector<double>& values, double threshold) {
    if (values.empty()) return {};

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    std::vector<std::vector<double>> chains;
    chains.push_back({ sorted.front() });
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        auto& current = chains.back();
        if (std::abs(sorted[i] - current.back()) <= threshold) {
            current.push_back(sorted[i]);
        } else {
            chains.push_back({ sorted[i] });
        }
    }

    // Equal raw values always land in the same chain, so keying by value is safe.
    std::map<double, double> snapped;
    for (const auto& chain : chains) {
        const double mean = chain_mean(chain);
        for (double v : chain) snapped[v] = mean;
    }

    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        const auto it = snapped.find(v);
        out.push_back(it != snapped.end() ? it->second : v);
    }
    return out;
}

layout_model::Polygon snap_to_rectilinear(const layout_model::Polygon& points, double threshold) {
    if (points.size() < 3) return points;

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& p : points) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }

    const std::vector<double> snapped_xs = snap_values(xs, threshold);
    const std::vector<double> snapped_ys = snap_values(ys, threshold);

    layout_model::Polygon out;
    out.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        out.push_back({ snapped_xs[i], snapped_ys[i] });
    }
    return out;
}

} // namespace layout_geometry
