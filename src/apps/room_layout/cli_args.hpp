#pragma once

#include <layout_model/types.hpp>
#include <spdlog/common.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace room_layout {

struct Args {
    std::string plan_path;
    std::string out_path;
    std::optional<layout_model::LayoutPattern> only_pattern;
    std::optional<double> rectify;
    // 0 means no ceiling.
    std::size_t max_steps;
    std::optional<std::uint64_t> seed;
    spdlog::level::level_enum log_level = spdlog::level::info;

    Args();
};

void print_usage();

// Throws std::runtime_error on an unknown flag, a missing value or a malformed value.
Args parse_args(int argc, const char* const argv[]);

// Decimal digits only; rejects signs, blanks and values above uint64 max.
std::uint64_t parse_u64(const std::string& text, const std::string& flag);

spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace room_layout
