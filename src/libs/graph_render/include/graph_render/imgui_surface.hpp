#pragma once

#include <xdot_model/draw_surface.hpp>
#include <string>
#include <vector>

struct ImDrawList;
struct ImFont;
struct ImVec2;

namespace graph_render {

// DrawSurface writing into an ImGui draw list. Points are mapped to the
// screen by screen = p * zoom + offset; line widths, dashes and font sizes
// scale with zoom.
class ImGuiSurface : public xdot_model::DrawSurface {
public:
    ImGuiSurface(ImDrawList* draw_list, ImFont* font);
    ~ImGuiSurface() override;

    void set_transform(float offset_x, float offset_y, float zoom);
    // Pixel space, for overlays.
    void reset_transform() { set_transform(0.0f, 0.0f, 1.0f); }

    void move_to(xdot_model::Point p) override;
    void line_to(xdot_model::Point p) override;
    void curve_to(xdot_model::Point c1, xdot_model::Point c2, xdot_model::Point end) override;
    void close_path() override;

    void fill(const xdot_model::Color& color) override;
    void stroke(const xdot_model::Color& color, double line_width, const std::vector<double>& dash) override;

    void clip_rect(xdot_model::Point min, xdot_model::Point max) override;
    void pop_clip();

    xdot_model::TextExtent measure_text(const std::string& text, const std::string& font_family, double font_size) override;
    void draw_text(xdot_model::Point origin, const std::string& text, const std::string& font_family,
        double font_size, const xdot_model::Color& color) override;

private:
    struct SubPath {
        std::vector<float> xy; // screen-space x,y pairs
        bool closed = false;
    };

    void to_screen(xdot_model::Point p, float& sx, float& sy) const;
    SubPath& current();
    void clear_path();

    ImDrawList* draw_list_;
    ImFont* font_;
    float offset_x_ = 0.0f;
    float offset_y_ = 0.0f;
    float zoom_ = 1.0f;
    std::vector<SubPath> path_;
    float cur_x_ = 0.0f;
    float cur_y_ = 0.0f;
    int clip_depth_ = 0;
};

} // namespace graph_render
