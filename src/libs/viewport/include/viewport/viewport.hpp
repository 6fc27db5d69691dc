#pragma once

#include <xdot_model/pen.hpp>

namespace viewport {

// Focus point (graph space, shown at the centre of the widget) plus zoom ratio
// (pixels per graph unit).
class Viewport {
public:
    Viewport() = default;

    void set_size(double width, double height);
    double width() const { return width_; }
    double height() const { return height_; }

    double x() const { return x_; }
    double y() const { return y_; }
    double zoom_ratio() const { return zoom_ratio_; }
    xdot_model::Point focus() const { return {x_, y_}; }

    void set_focus(double x, double y);
    void set_zoom_ratio(double ratio);

    xdot_model::Point window_to_graph(double wx, double wy) const;
    xdot_model::Point graph_to_window(double gx, double gy) const;

    // Sets the ratio; with center, focuses the middle of a graph_width x graph_height graph.
    void zoom_image(double ratio, bool center = false, double graph_width = 0.0, double graph_height = 0.0);
    void zoom_to_fit(double graph_width, double graph_height, double margin);
    void zoom_to_area(double x1, double y1, double x2, double y2);

    void zoom_in();
    void zoom_out();
    // Moves the focus by a screen-pixel distance.
    void pan_pixels(double dx, double dy);

private:
    double width_ = 0.0;
    double height_ = 0.0;
    double x_ = 0.0;
    double y_ = 0.0;
    double zoom_ratio_ = 1.0;
};

} // namespace viewport
