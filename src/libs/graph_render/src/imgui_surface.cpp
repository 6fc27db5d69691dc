#include <graph_render/imgui_surface.hpp>
#include "imgui.h"
#include <algorithm>
#include <cfloat>
#include <cmath>

namespace graph_render {

namespace {

unsigned int to_u32(const xdot_model::Color& c) {
    return ImGui::ColorConvertFloat4ToU32(ImVec4(static_cast<float>(c.r), static_cast<float>(c.g), static_cast<float>(c.b), static_cast<float>(c.a)));
}

std::vector<ImVec2> to_points(const std::vector<float>& xy) {
    std::vector<ImVec2> pts;
    pts.reserve(xy.size() / 2);
    for (std::size_t i = 0; i + 1 < xy.size(); i += 2)
        pts.emplace_back(xy[i], xy[i + 1]);
    return pts;
}

// Strokes a polyline with an on/off dash pattern (odd-length patterns repeat).
void stroke_dashed(ImDrawList* dl, const std::vector<ImVec2>& pts, bool closed,
    const std::vector<float>& pattern, unsigned int col, float thickness)
{
    std::vector<float> dashes = pattern;
    if (dashes.size() % 2 == 1) dashes.insert(dashes.end(), pattern.begin(), pattern.end());
    float total = 0.0f;
    for (float d : dashes) total += d;
    if (total <= 0.0f) return;

    std::size_t dash_index = 0;
    float remaining = dashes[0];
    bool on = true;

    const std::size_t n = pts.size();
    const std::size_t segments = closed ? n : n - 1;
    for (std::size_t i = 0; i < segments; ++i) {
        ImVec2 a = pts[i];
        const ImVec2 b = pts[(i + 1) % n];
        float len = std::sqrt((b.x - a.x) * (b.x - a.x) + (b.y - a.y) * (b.y - a.y));
        if (len <= 0.0f) continue;
        const float ux = (b.x - a.x) / len;
        const float uy = (b.y - a.y) / len;
        while (len > 0.0f) {
            const float step = std::min(remaining, len);
            const ImVec2 next(a.x + ux * step, a.y + uy * step);
            if (on) dl->AddLine(a, next, col, thickness);
            a = next;
            len -= step;
            remaining -= step;
            if (remaining <= 0.0f) {
                dash_index = (dash_index + 1) % dashes.size();
                remaining = dashes[dash_index];
                on = !on;
            }
        }
    }
}

} // namespace

ImGuiSurface::ImGuiSurface(ImDrawList* draw_list, ImFont* font)
    : draw_list_(draw_list)
    , font_(font)
{
}

ImGuiSurface::~ImGuiSurface() {
    while (clip_depth_ > 0)
        pop_clip();
}

void ImGuiSurface::set_transform(float offset_x, float offset_y, float zoom) {
    offset_x_ = offset_x;
    offset_y_ = offset_y;
    zoom_ = zoom;
}

void ImGuiSurface::to_screen(xdot_model::Point p, float& sx, float& sy) const {
    sx = static_cast<float>(p.x) * zoom_ + offset_x_;
    sy = static_cast<float>(p.y) * zoom_ + offset_y_;
}

ImGuiSurface::SubPath& ImGuiSurface::current() {
    if (path_.empty() || path_.back().closed) {
        path_.emplace_back();
        path_.back().xy = {cur_x_, cur_y_};
    }
    return path_.back();
}

void ImGuiSurface::clear_path() {
    path_.clear();
}

void ImGuiSurface::move_to(xdot_model::Point p) {
    to_screen(p, cur_x_, cur_y_);
    path_.emplace_back();
    path_.back().xy = {cur_x_, cur_y_};
}

void ImGuiSurface::line_to(xdot_model::Point p) {
    SubPath& sub = current();
    to_screen(p, cur_x_, cur_y_);
    sub.xy.push_back(cur_x_);
    sub.xy.push_back(cur_y_);
}

void ImGuiSurface::curve_to(xdot_model::Point c1, xdot_model::Point c2, xdot_model::Point end) {
    SubPath& sub = current();
    float x0 = cur_x_, y0 = cur_y_;
    float x1, y1, x2, y2, x3, y3;
    to_screen(c1, x1, y1);
    to_screen(c2, x2, y2);
    to_screen(end, x3, y3);

    const float chord = std::hypot(x1 - x0, y1 - y0) + std::hypot(x2 - x1, y2 - y1) + std::hypot(x3 - x2, y3 - y2);
    const int segments = std::clamp(static_cast<int>(chord / 4.0f), 4, 64);
    for (int i = 1; i <= segments; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(segments);
        const float u = 1.0f - t;
        const float a = u * u * u;
        const float b = 3.0f * u * u * t;
        const float c = 3.0f * u * t * t;
        const float d = t * t * t;
        sub.xy.push_back(a * x0 + b * x1 + c * x2 + d * x3);
        sub.xy.push_back(a * y0 + b * y1 + c * y2 + d * y3);
    }
    cur_x_ = x3;
    cur_y_ = y3;
}

void ImGuiSurface::close_path() {
    if (path_.empty()) return;
    SubPath& sub = path_.back();
    sub.closed = true;
    if (sub.xy.size() >= 2) {
        cur_x_ = sub.xy[0];
        cur_y_ = sub.xy[1];
    }
}

void ImGuiSurface::fill(const xdot_model::Color& color) {
    const unsigned int col = to_u32(color);
    for (const auto& sub : path_) {
        std::vector<ImVec2> pts = to_points(sub.xy);
        if (pts.size() >= 3)
            draw_list_->AddConcavePolyFilled(pts.data(), static_cast<int>(pts.size()), col);
    }
    clear_path();
}

void ImGuiSurface::stroke(const xdot_model::Color& color, double line_width, const std::vector<double>& dash) {
    const unsigned int col = to_u32(color);
    const float thickness = static_cast<float>(line_width) * zoom_;
    std::vector<float> pattern;
    for (double d : dash)
        pattern.push_back(static_cast<float>(d) * zoom_);

    for (const auto& sub : path_) {
        std::vector<ImVec2> pts = to_points(sub.xy);
        if (pts.size() < 2) continue;
        if (pattern.empty())
            draw_list_->AddPolyline(pts.data(), static_cast<int>(pts.size()), col,
                sub.closed ? ImDrawFlags_Closed : ImDrawFlags_None, thickness);
        else
            stroke_dashed(draw_list_, pts, sub.closed, pattern, col, thickness);
    }
    clear_path();
}

void ImGuiSurface::clip_rect(xdot_model::Point min, xdot_model::Point max) {
    float x0, y0, x1, y1;
    to_screen(min, x0, y0);
    to_screen(max, x1, y1);
    draw_list_->PushClipRect(ImVec2(x0, y0), ImVec2(x1, y1), true);
    ++clip_depth_;
}

void ImGuiSurface::pop_clip() {
    if (clip_depth_ == 0) return;
    draw_list_->PopClipRect();
    --clip_depth_;
}

xdot_model::TextExtent ImGuiSurface::measure_text(const std::string& text, const std::string& font_family, double font_size) {
    (void)font_family;
    if (!font_ || text.empty()) return {};
    const ImVec2 size = font_->CalcTextSizeA(static_cast<float>(font_size), FLT_MAX, 0.0f, text.data(), text.data() + text.size());
    return {size.x, size.y};
}

void ImGuiSurface::draw_text(xdot_model::Point origin, const std::string& text, const std::string& font_family,
    double font_size, const xdot_model::Color& color)
{
    (void)font_family;
    if (!font_ || text.empty()) return;
    float sx, sy;
    to_screen(origin, sx, sy);
    draw_list_->AddText(font_, static_cast<float>(font_size) * zoom_, ImVec2(sx, sy), to_u32(color),
        text.data(), text.data() + text.size());
}

} // namespace graph_render
