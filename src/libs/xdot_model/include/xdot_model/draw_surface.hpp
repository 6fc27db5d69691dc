#pragma once

#include <xdot_model/pen.hpp>
#include <string>
#include <vector>

namespace xdot_model {

struct TextExtent {
    double width = 0.0;
    double height = 0.0;
};

// Path/fill/stroke/text primitives a rendering backend provides.
// fill() and stroke() consume the current path.
class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    virtual void move_to(Point p) = 0;
    virtual void line_to(Point p) = 0;
    virtual void curve_to(Point c1, Point c2, Point end) = 0;
    virtual void close_path() = 0;

    virtual void fill(const Color& color) = 0;
    virtual void stroke(const Color& color, double line_width, const std::vector<double>& dash) = 0;

    virtual void clip_rect(Point min, Point max) = 0;

    virtual TextExtent measure_text(const std::string& text, const std::string& font_family, double font_size) = 0;
    // origin is the top-left corner of the text box.
    virtual void draw_text(Point origin, const std::string& text, const std::string& font_family,
        double font_size, const Color& color) = 0;
};

} // namespace xdot_model
