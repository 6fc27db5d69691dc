#include <xdot_loaders/viewer_config.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace xdot_loaders {

namespace {

std::optional<ViewerConfig> parse_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    ViewerConfig c;
    if (j.contains("layout_program") && j["layout_program"].is_string())
        c.layout_program = j["layout_program"].get<std::string>();
    if (j.contains("layout_format") && j["layout_format"].is_string())
        c.layout_format = j["layout_format"].get<std::string>();
    if (j.contains("window_width") && j["window_width"].is_number_integer() && j["window_width"].get<int>() > 0)
        c.window_width = j["window_width"].get<int>();
    if (j.contains("window_height") && j["window_height"].is_number_integer() && j["window_height"].get<int>() > 0)
        c.window_height = j["window_height"].get<int>();
    if (j.contains("log_level") && j["log_level"].is_string())
        c.log_level = j["log_level"].get<std::string>();
    if (j.contains("log_to_file") && j["log_to_file"].is_boolean())
        c.log_to_file = j["log_to_file"].get<bool>();
    if (j.contains("font_path") && j["font_path"].is_string())
        c.font_path = j["font_path"].get<std::string>();
    return c;
}

} // namespace

std::optional<ViewerConfig> load_viewer_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<ViewerConfig> load_viewer_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_viewer_config_from_json(f);
}

} // namespace xdot_loaders
