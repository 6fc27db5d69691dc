#pragma once

namespace interaction {

// Max pointer travel (pixels) and press duration (seconds) still counted as a click.
constexpr double click_fuzz = 4.0;
constexpr double click_timeout = 1.0;

// Zoom drag: ratio *= drag_zoom_base ^ (dx + dy).
constexpr double drag_zoom_base = 1.005;

} // namespace interaction
