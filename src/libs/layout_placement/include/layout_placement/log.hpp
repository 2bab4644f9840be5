#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace layout_placement {

constexpr const char* logger_name = "room_layout";

// The "room_layout" logger when the application registered one, otherwise spdlog's default.
std::shared_ptr<spdlog::logger> logger();

} // namespace layout_placement
