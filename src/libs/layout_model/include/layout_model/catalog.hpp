#pragma once

#include <layout_model/types.hpp>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace layout_model {

// Aisle gaps per density pattern, in millimeters.
namespace aisle {

constexpr double tight_mm = 1000.0;
constexpr double standard_mm = 1300.0;
constexpr double generous_mm = 1600.0;

} // namespace aisle

constexpr ChairDimensions default_chair{500.0, 600.0};

constexpr std::array<LayoutPattern, 3> all_patterns = {
    LayoutPattern::Tight, LayoutPattern::Standard, LayoutPattern::Generous
};

inline constexpr double pattern_aisle_gap_mm(LayoutPattern pattern) {
    switch (pattern) {
    case LayoutPattern::Tight: return aisle::tight_mm;
    case LayoutPattern::Standard: return aisle::standard_mm;
    case LayoutPattern::Generous: return aisle::generous_mm;
    }
    return aisle::standard_mm;
}

inline std::string pattern_name(LayoutPattern pattern) {
    switch (pattern) {
    case LayoutPattern::Tight: return "tight";
    case LayoutPattern::Standard: return "standard";
    case LayoutPattern::Generous: return "generous";
    }
    return "standard";
}

// Accepts the older "cramped"/"spacious" names used by saved plans.
inline std::optional<LayoutPattern> pattern_from_name(const std::string& name) {
    if (name == "tight" || name == "cramped") return LayoutPattern::Tight;
    if (name == "standard") return LayoutPattern::Standard;
    if (name == "generous" || name == "spacious") return LayoutPattern::Generous;
    return std::nullopt;
}

// Table sets offered when a plan does not bring its own catalog.
// Order is placement priority: wider tables are tried first.
inline std::vector<FurnitureSpec> default_catalog() {
    return {
        FurnitureSpec{ "type1", "Type 1 (1800x450)", 1800, 450, 3, 50000, "#3b82f6", true },
        FurnitureSpec{ "type2", "Type 2 (1500x450)", 1500, 450, 2, 45000, "#10b981", true },
        FurnitureSpec{ "type3", "Type 3 (1200x450)", 1200, 450, 2, 40000, "#f59e0b", true },
    };
}

} // namespace layout_model
