#pragma once

#include <layout_placement/types.hpp>
#include <cstdint>
#include <string>

namespace layout_placement {

// "<prefix>-1", "<prefix>-2", ... Each copy of the returned generator counts on its own.
IdGenerator sequential_ids(const std::string& prefix = "item");

// Version-4 UUID strings drawn from a seeded engine; the same seed repeats the sequence.
IdGenerator random_ids(std::uint64_t seed);

} // namespace layout_placement
