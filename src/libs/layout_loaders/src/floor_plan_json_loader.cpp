#include <layout_loaders/json_loader.hpp>
#include <layout_geometry/polygon.hpp>
#include <layout_placement/log.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <utility>

namespace layout_loaders {

namespace {

using layout_placement::logger;

constexpr std::uint64_t max_chair_count = 1000;
// Prices above this no longer round-trip through double.
constexpr double max_unit_price = 1e15;

std::optional<layout_model::Point> parse_point(const nlohmann::json& p) {
    if (!p.is_object()) return std::nullopt;
    if (!p.contains("x") || !p["x"].is_number()) return std::nullopt;
    if (!p.contains("y") || !p["y"].is_number()) return std::nullopt;
    return layout_model::Point{ p["x"].get<double>(), p["y"].get<double>() };
}

std::optional<layout_model::Polygon> parse_polygon(const nlohmann::json& arr) {
    if (!arr.is_array()) return std::nullopt;
    layout_model::Polygon out;
    for (const auto& p : arr) {
        auto pt = parse_point(p);
        if (!pt) return std::nullopt;
        out.push_back(*pt);
    }
    return out;
}

std::optional<layout_model::FurnitureSpec> parse_spec(const nlohmann::json& f) {
    if (!f.is_object()) return std::nullopt;
    if (!f.contains("id") || !f["id"].is_string()) return std::nullopt;
    if (!f.contains("table_width") || !f["table_width"].is_number()) return std::nullopt;
    if (!f.contains("table_depth") || !f["table_depth"].is_number()) return std::nullopt;

    layout_model::FurnitureSpec spec;
    spec.id = f["id"].get<std::string>();
    spec.name = f.contains("name") && f["name"].is_string() ? f["name"].get<std::string>() : spec.id;
    spec.table_width = f["table_width"].get<double>();
    spec.table_depth = f["table_depth"].get<double>();
    if (f.contains("chair_count") && f["chair_count"].is_number()) {
        const auto& chairs = f["chair_count"];
        if (!chairs.is_number_unsigned() || chairs.get<std::uint64_t>() > max_chair_count) {
            logger()->warn("floor plan: catalog entry '{}' has chair_count out of range", spec.id);
            return std::nullopt;
        }
        spec.chair_count = static_cast<int>(chairs.get<std::uint64_t>());
    }
    if (f.contains("unit_price") && f["unit_price"].is_number()) {
        const double price = f["unit_price"].get<double>();
        if (!(price >= 0.0 && price <= max_unit_price)) {
            logger()->warn("floor plan: catalog entry '{}' has unit_price out of range", spec.id);
            return std::nullopt;
        }
        spec.unit_price = std::llround(price);
    }
    spec.color = f.contains("color") && f["color"].is_string() ? f["color"].get<std::string>() : "";
    spec.enabled = f.contains("enabled") && f["enabled"].is_boolean() ? f["enabled"].get<bool>() : true;
    return spec;
}

std::optional<layout_model::Polygon> resolve_outline(const nlohmann::json& j) {
    if (j.contains("polygon")) return parse_polygon(j["polygon"]);

    if (!j.contains("normalized_polygon")) return std::nullopt;
    auto normalized = parse_polygon(j["normalized_polygon"]);
    if (!normalized) return std::nullopt;
    if (!j.contains("image") || !j["image"].is_object()) {
        logger()->warn("floor plan: normalized_polygon requires image dimensions");
        return std::nullopt;
    }
    const auto& image = j["image"];
    const double width = image.contains("width") && image["width"].is_number() ? image["width"].get<double>() : 0;
    const double height = image.contains("height") && image["height"].is_number() ? image["height"].get<double>() : 0;
    if (!(width > 0) || !(height > 0)) {
        logger()->warn("floor plan: image dimensions must be positive");
        return std::nullopt;
    }
    return layout_geometry::from_normalized_grid(*normalized, width, height);
}

std::optional<layout_geometry::Scale> resolve_scale(const nlohmann::json& j) {
    if (j.contains("scale")) {
        if (!j["scale"].is_number()) return std::nullopt;
        auto scale = layout_geometry::Scale::try_from(j["scale"].get<double>());
        if (!scale) logger()->warn("floor plan: scale must be positive and finite");
        return scale;
    }

    if (!j.contains("scale_segment") || !j["scale_segment"].is_object()) return std::nullopt;
    const auto& seg = j["scale_segment"];
    if (!seg.contains("start") || !seg.contains("end")) return std::nullopt;
    if (!seg.contains("length_mm") || !seg["length_mm"].is_number()) return std::nullopt;
    const auto start = parse_point(seg["start"]);
    const auto end = parse_point(seg["end"]);
    if (!start || !end) return std::nullopt;
    try {
        return layout_geometry::Scale::from_segment(*start, *end, seg["length_mm"].get<double>());
    } catch (const layout_geometry::InvalidScaleError& e) {
        logger()->warn("floor plan: {}", e.what());
        return std::nullopt;
    }
}

std::optional<FloorPlan> parse_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    FloorPlan plan;
    if (j.contains("name") && j["name"].is_string()) plan.name = j["name"].get<std::string>();

    auto outline = resolve_outline(j);
    if (!outline) {
        logger()->warn("floor plan: missing or malformed room polygon");
        return std::nullopt;
    }
    plan.polygon = std::move(*outline);
    if (plan.polygon.size() < 3) {
        logger()->warn("floor plan: room polygon has {} points, nothing can be placed", plan.polygon.size());
    }

    if (j.contains("holes")) {
        if (!j["holes"].is_array()) return std::nullopt;
        for (const auto& h : j["holes"]) {
            auto hole = parse_polygon(h);
            if (!hole) {
                logger()->warn("floor plan: malformed hole polygon");
                return std::nullopt;
            }
            plan.holes.push_back(std::move(*hole));
        }
    }

    auto scale = resolve_scale(j);
    if (!scale) {
        logger()->warn("floor plan: no usable scale or scale_segment");
        return std::nullopt;
    }
    plan.scale = *scale;

    if (j.contains("catalog")) {
        if (!j["catalog"].is_array()) return std::nullopt;
        plan.catalog.clear();
        for (const auto& f : j["catalog"]) {
            auto spec = parse_spec(f);
            if (!spec) {
                logger()->warn("floor plan: malformed catalog entry");
                return std::nullopt;
            }
            plan.catalog.push_back(std::move(*spec));
        }
    }

    if (j.contains("rectify_threshold") && j["rectify_threshold"].is_number()) {
        const double t = j["rectify_threshold"].get<double>();
        if (t < 0) {
            logger()->warn("floor plan: rectify_threshold must be non-negative, got {}", t);
            return std::nullopt;
        }
        plan.rectify_threshold = t;
    }
    if (j.contains("tax_rate") && j["tax_rate"].is_number()) {
        const double rate = j["tax_rate"].get<double>();
        if (rate < 0) {
            logger()->warn("floor plan: tax_rate must be non-negative, got {}", rate);
            return std::nullopt;
        }
        plan.tax_rate = rate;
    }

    return plan;
}

} // namespace

std::optional<FloorPlan> load_floor_plan_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("floor plan: invalid JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<FloorPlan> load_floor_plan_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        logger()->warn("floor plan: cannot open {}", path);
        return std::nullopt;
    }
    return load_floor_plan_from_json(f);
}

} // namespace layout_loaders
