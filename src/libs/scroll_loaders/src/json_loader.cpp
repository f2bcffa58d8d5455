#include <scroll_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

namespace scroll_loaders {

namespace {

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

double number_or(const nlohmann::json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

scroll_model::FlingConfig parse_fling(const nlohmann::json& f) {
    scroll_model::FlingConfig fling;
    fling.linear_damping = number_or(f, "linear_damping", fling.linear_damping);
    fling.min_fling_velocity = number_or(f, "min_fling_velocity", fling.min_fling_velocity);
    fling.stop_velocity = number_or(f, "stop_velocity", fling.stop_velocity);
    return fling;
}

std::optional<scroll_model::ViewerConfig> parse_json(const nlohmann::json& j) {
    scroll_model::ViewerConfig out;
    if (!j.contains("panes") || !j["panes"].is_array()) return std::nullopt;

    for (const auto& p : j["panes"]) {
        scroll_model::PaneConfig pane;
        if (!p.contains("id") || !p["id"].is_string()) return std::nullopt;
        pane.id = p["id"].get<std::string>();
        pane.label = string_or(p, "label", pane.id);
        if (p.contains("row_count") && p["row_count"].is_number_integer())
            pane.row_count = std::max(0, p["row_count"].get<int>());
        const double row_height = number_or(p, "row_height", pane.row_height);
        if (row_height > 0) pane.row_height = row_height;
        out.panes.push_back(std::move(pane));
    }

    out.name = string_or(j, "name", "");
    out.log_level = string_or(j, "log_level", out.log_level);
    if (j.contains("fling") && j["fling"].is_object())
        out.fling = parse_fling(j["fling"]);

    return out;
}

} // namespace

std::optional<scroll_model::ViewerConfig> load_viewer_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<scroll_model::ViewerConfig> load_viewer_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_viewer_config_from_json(f);
}

} // namespace scroll_loaders
