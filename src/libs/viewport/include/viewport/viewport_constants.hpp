#pragma once

namespace viewport {

constexpr double zoom_increment = 1.25;
constexpr double zoom_to_fit_margin = 12.0;
// Arrow-key pan step in screen pixels.
constexpr double pos_increment = 100.0;

} // namespace viewport
