#include <viewport/viewport.hpp>
#include <viewport/viewport_constants.hpp>
#include <algorithm>
#include <cmath>

namespace viewport {

void Viewport::set_size(double width, double height) {
    width_ = std::max(0.0, width);
    height_ = std::max(0.0, height);
}

void Viewport::set_focus(double x, double y) {
    x_ = x;
    y_ = y;
}

void Viewport::set_zoom_ratio(double ratio) {
    if (ratio > 0.0 && std::isfinite(ratio)) zoom_ratio_ = ratio;
}

xdot_model::Point Viewport::window_to_graph(double wx, double wy) const {
    double x = wx - 0.5 * width_;
    double y = wy - 0.5 * height_;
    x /= zoom_ratio_;
    y /= zoom_ratio_;
    return {x + x_, y + y_};
}

xdot_model::Point Viewport::graph_to_window(double gx, double gy) const {
    return {(gx - x_) * zoom_ratio_ + 0.5 * width_, (gy - y_) * zoom_ratio_ + 0.5 * height_};
}

void Viewport::zoom_image(double ratio, bool center, double graph_width, double graph_height) {
    if (center) {
        x_ = graph_width / 2;
        y_ = graph_height / 2;
    }
    set_zoom_ratio(ratio);
}

void Viewport::zoom_to_fit(double graph_width, double graph_height, double margin) {
    const double w = width_ - 2 * margin;
    const double h = height_ - 2 * margin;
    double ratio = zoom_ratio_;
    if (graph_width > 0 && graph_height > 0 && w > 0 && h > 0)
        ratio = std::min(w / graph_width, h / graph_height);
    zoom_image(ratio, true, graph_width, graph_height);
}

void Viewport::zoom_to_area(double x1, double y1, double x2, double y2) {
    const double dx = std::abs(x1 - x2);
    const double dy = std::abs(y1 - y2);
    if (dx > 0 && dy > 0)
        set_zoom_ratio(std::min(width_ / dx, height_ / dy));
    else if (dx > 0)
        set_zoom_ratio(width_ / dx);
    else if (dy > 0)
        set_zoom_ratio(height_ / dy);
    x_ = (x1 + x2) / 2;
    y_ = (y1 + y2) / 2;
}

void Viewport::zoom_in() {
    zoom_image(zoom_ratio_ * zoom_increment);
}

void Viewport::zoom_out() {
    zoom_image(zoom_ratio_ / zoom_increment);
}

void Viewport::pan_pixels(double dx, double dy) {
    x_ += dx / zoom_ratio_;
    y_ += dy / zoom_ratio_;
}

} // namespace viewport
