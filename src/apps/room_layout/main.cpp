// Room layout planner: fills a floor plan with table rows per density pattern
// and prints a JSON report with cost estimates.
#include "cli_args.hpp"

#include <layout_geometry/polygon.hpp>
#include <layout_geometry/rectilinear.hpp>
#include <layout_geometry/scale.hpp>
#include <layout_loaders/json_loader.hpp>
#include <layout_loaders/report_writer.hpp>
#include <layout_model/catalog.hpp>
#include <layout_placement/id_generator.hpp>
#include <layout_placement/log.hpp>
#include <layout_placement/pattern_runs.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

// Console plus logs/room_layout_latest.log; console only if the file cannot be opened.
void init_logging(spdlog::level::level_enum level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "room_layout_latest.log";
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true));
    } catch (const spdlog::spdlog_ex& e) {
        (void)fprintf(stderr, "file logging disabled: %s\n", e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        (void)fprintf(stderr, "file logging disabled: %s\n", e.what());
    }

    auto logger = std::make_shared<spdlog::logger>(layout_placement::logger_name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    spdlog::register_logger(logger);
}

} // namespace

int main(int argc, char* argv[])
{
    room_layout::Args args;
    try {
        args = room_layout::parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        (void)fprintf(stderr, "room_layout: %s\n", e.what());
        room_layout::print_usage();
        return 1;
    }

    init_logging(args.log_level);
    auto log = layout_placement::logger();

    std::optional<layout_loaders::FloorPlan> plan;
    if (args.plan_path.empty()) {
        log->info("no plan given, using the built-in sample");
        plan = layout_loaders::sample_floor_plan();
    } else {
        plan = layout_loaders::load_floor_plan_from_json_file(args.plan_path);
        if (!plan) {
            log->error("could not load floor plan {}", args.plan_path);
            return 1;
        }
    }

    const auto threshold = args.rectify ? args.rectify : plan->rectify_threshold;
    if (threshold) {
        plan->polygon = layout_geometry::snap_to_rectilinear(plan->polygon, *threshold);
        log->info("outline rectified with threshold {} px", *threshold);
    }

    const double area_m2 = plan->scale.area_to_square_meters(layout_geometry::polygon_area_px(plan->polygon));
    log->info("plan '{}': {} vertices, {} holes, area {:.2f} m2, 1px = {:.2f} mm",
        plan->name, plan->polygon.size(), plan->holes.size(), area_m2, plan->scale.to_millimeters(1.0));

    layout_placement::PlacementOptions options;
    options.max_sweep_steps = args.max_steps;

    const layout_placement::IdGeneratorFactory make_ids =
        [&args](layout_model::LayoutPattern pattern) -> layout_placement::IdGenerator {
            if (args.seed) return layout_placement::random_ids(*args.seed);
            return layout_placement::sequential_ids(layout_model::pattern_name(pattern));
        };

    std::vector<layout_placement::PatternResult> results;
    try {
        if (args.only_pattern) {
            const auto pattern = *args.only_pattern;
            const double gap = layout_model::pattern_aisle_gap_mm(pattern);
            auto items = layout_placement::place_furniture(plan->polygon, plan->holes, plan->scale,
                plan->catalog, gap, make_ids(pattern), options);
            results.push_back(layout_placement::summarize(pattern, gap, std::move(items), plan->catalog));
        } else {
            results = layout_placement::run_all_patterns(plan->polygon, plan->holes, plan->scale,
                plan->catalog, make_ids, options);
        }
    } catch (const layout_placement::PlacementLimitError& e) {
        log->error("layout too large: {}", e.what());
        return 2;
    } catch (const std::invalid_argument& e) {
        log->error("invalid placement input: {}", e.what());
        return 2;
    }

    for (const auto& r : results) {
        if (r.items.empty()) {
            log->warn("pattern {}: no furniture fits (aisle {} mm)", layout_model::pattern_name(r.pattern), r.aisle_gap_mm);
        }
    }

    if (args.out_path.empty()) {
        layout_loaders::write_report_json(std::cout, *plan, results);
    } else {
        std::ofstream out(args.out_path);
        if (!out) {
            log->error("cannot write report to {}", args.out_path);
            return 1;
        }
        layout_loaders::write_report_json(out, *plan, results);
        log->info("report written to {}", args.out_path);
    }
    return 0;
}
