#include <layout_geometry/scale.hpp>
#include <layout_geometry/polygon.hpp>
#include <cmath>
#include <string>

namespace layout_geometry {

bool is_valid_scale(double pixels_per_mm) {
    return std::isfinite(pixels_per_mm) && pixels_per_mm > 0.0;
}

Scale::Scale(double pixels_per_mm) : pixels_per_mm_(pixels_per_mm) {
    if (!is_valid_scale(pixels_per_mm)) {
        throw InvalidScaleError("scale must be positive and finite, got " + std::to_string(pixels_per_mm));
    }
}

std::optional<Scale> Scale::try_from(double pixels_per_mm) {
    if (!is_valid_scale(pixels_per_mm)) return std::nullopt;
    return Scale(pixels_per_mm);
}

Scale Scale::from_segment(const layout_model::Point& start, const layout_model::Point& end,
    double real_length_mm)
{
    if (!std::isfinite(real_length_mm) || real_length_mm <= 0.0) {
        throw InvalidScaleError("reference length must be positive, got " + std::to_string(real_length_mm));
    }
    const double length_px = segment_length(start, end);
    if (length_px <= 0.0) {
        throw InvalidScaleError("reference segment has zero length");
    }
    return Scale(length_px / real_length_mm);
}

double Scale::area_to_square_meters(double area_px) const {
    // px^2 -> mm^2 -> m^2
    return area_px / (pixels_per_mm_ * pixels_per_mm_) / 1'000'000.0;
}

} // namespace layout_geometry
