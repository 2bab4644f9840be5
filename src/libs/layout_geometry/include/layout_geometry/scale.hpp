#pragma once

#include <layout_model/types.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace layout_geometry {

class InvalidScaleError : public std::invalid_argument {
public:
    explicit InvalidScaleError(const std::string& what) : std::invalid_argument(what) {}
};

// Pixels per millimeter. The only bridge between editing pixels and physical
// dimensions; always strictly positive and finite once constructed.
class Scale {
public:
    // Throws InvalidScaleError for zero, negative, NaN or infinite values.
    explicit Scale(double pixels_per_mm);

    static std::optional<Scale> try_from(double pixels_per_mm);

    // Calibrates from a drawn reference segment of known physical length.
    static Scale from_segment(const layout_model::Point& start, const layout_model::Point& end,
        double real_length_mm);

    double pixels_per_mm() const { return pixels_per_mm_; }

    double to_pixels(double mm) const { return mm * pixels_per_mm_; }
    double to_millimeters(double px) const { return px / pixels_per_mm_; }
    double area_to_square_meters(double area_px) const;

private:
    double pixels_per_mm_;
};

bool is_valid_scale(double pixels_per_mm);

} // namespace layout_geometry
