#include <layout_placement/log.hpp>

namespace layout_placement {

std::shared_ptr<spdlog::logger> logger() {
    if (auto registered = spdlog::get(logger_name)) return registered;
    return spdlog::default_logger();
}

} // namespace layout_placement
