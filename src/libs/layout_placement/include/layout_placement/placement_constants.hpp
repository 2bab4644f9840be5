#pragma once

#include <cstddef>

namespace layout_placement {

// Sweep constants in millimeters; converted to pixels through the plan scale.
namespace sweep {

// Clearance between neighbouring tables in a row.
constexpr double item_gap_mm = 50.0;
// Cursor advance when nothing fits at the current column.
constexpr double search_step_mm = 50.0;
// Cursor advance after a row in which nothing was placed.
constexpr double empty_row_step_mm = 100.0;

// Column steps the command-line tool allows per pattern unless told otherwise.
constexpr std::size_t default_step_ceiling = 50'000'000;

} // namespace sweep

} // namespace layout_placement
