#pragma once

#include <optional>
#include <istream>
#include <string>

namespace xdot_loaders {

struct ViewerConfig {
    std::string layout_program = "dot";
    std::string layout_format = "xdot";
    int window_width = 512;
    int window_height = 512;
    std::string log_level = "info";
    bool log_to_file = false;
    std::string font_path;
};

std::optional<ViewerConfig> load_viewer_config_from_json(std::istream& in);
std::optional<ViewerConfig> load_viewer_config_from_json_file(const std::string& path);

} // namespace xdot_loaders
