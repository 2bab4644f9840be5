#include "cli_args.hpp"

#include <layout_model/catalog.hpp>
#include <layout_placement/placement_constants.hpp>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace room_layout {

namespace {

std::string require_arg(int& i, int argc, const char* const argv[], const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("missing value for " + flag);
    }
    return argv[++i];
}

double parse_double(const std::string& text, const std::string& flag) {
    std::size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects a number, got '" + text + "'");
    }
    if (pos != text.size() || !std::isfinite(value)) {
        throw std::runtime_error(flag + " expects a number, got '" + text + "'");
    }
    return value;
}

} // namespace

Args::Args() : max_steps(layout_placement::sweep::default_step_ceiling) {}

void print_usage() {
    (void)fprintf(stderr,
        "usage: room_layout [plan.json] [--out report.json] [--pattern tight|standard|generous]\n"
        "                   [--rectify <px>] [--max-steps N (0 = no limit)] [--seed N]\n"
        "                   [--log-level trace|debug|info|warn|error|critical|off]\n");
}

std::uint64_t parse_u64(const std::string& text, const std::string& flag) {
    if (text.empty()) {
        throw std::runtime_error(flag + " expects a non-negative integer, got ''");
    }
    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::runtime_error(flag + " expects a non-negative integer, got '" + text + "'");
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (max - digit) / 10) {
            throw std::runtime_error(flag + " is out of range: " + text);
        }
        value = value * 10 + digit;
    }
    return value;
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    // from_str maps unknown names to off.
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw std::runtime_error("unknown log level: " + name);
    }
    return level;
}

Args parse_args(int argc, const char* const argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--out") {
            args.out_path = require_arg(i, argc, argv, arg);
        } else if (arg == "--pattern") {
            const std::string name = require_arg(i, argc, argv, arg);
            args.only_pattern = layout_model::pattern_from_name(name);
            if (!args.only_pattern) throw std::runtime_error("unknown pattern: " + name);
        } else if (arg == "--rectify") {
            args.rectify = parse_double(require_arg(i, argc, argv, arg), arg);
            if (*args.rectify < 0) throw std::runtime_error("--rectify must be non-negative");
        } else if (arg == "--max-steps") {
            const auto steps = parse_u64(require_arg(i, argc, argv, arg), arg);
            if (steps > std::numeric_limits<std::size_t>::max()) {
                throw std::runtime_error("--max-steps is out of range");
            }
            args.max_steps = static_cast<std::size_t>(steps);
        } else if (arg == "--seed") {
            args.seed = parse_u64(require_arg(i, argc, argv, arg), arg);
        } else if (arg == "--log-level") {
            args.log_level = parse_log_level(require_arg(i, argc, argv, arg));
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::runtime_error("unknown option: " + arg);
        } else if (args.plan_path.empty()) {
            args.plan_path = arg;
        } else {
            throw std::runtime_error("unexpected argument: " + arg);
        }
    }
    return args;
}

} // namespace room_layout
