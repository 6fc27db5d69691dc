#pragma once

#include <xdot_model/pen.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace xdot_parser {

xdot_model::Color hsv_to_rgb(double h, double s, double v);

// "#RRGGBB[AA]", "H S V" / "H,S,V", or a color name.
// Returns std::nullopt when the text names no known color.
std::optional<xdot_model::Color> parse_color(std::string_view text);

// Case and whitespace insensitive X11 color name lookup.
std::optional<xdot_model::Color> lookup_color_name(std::string_view name);

} // namespace xdot_parser
