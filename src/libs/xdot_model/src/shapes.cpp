#include <xdot_model/shapes.hpp>
#include <type_traits>

namespace xdot_model {

namespace {

// Cubic Bezier approximation of a quarter circle.
const double kappa = 0.5522847498307936;

void ellipse_path(DrawSurface& surface, Point c, double rx, double ry) {
    const double ox = rx * kappa;
    const double oy = ry * kappa;
    surface.move_to({c.x + rx, c.y});
    surface.curve_to({c.x + rx, c.y + oy}, {c.x + ox, c.y + ry}, {c.x, c.y + ry});
    surface.curve_to({c.x - ox, c.y + ry}, {c.x - rx, c.y + oy}, {c.x - rx, c.y});
    surface.curve_to({c.x - rx, c.y - oy}, {c.x - ox, c.y - ry}, {c.x, c.y - ry});
    surface.curve_to({c.x + ox, c.y - ry}, {c.x + rx, c.y - oy}, {c.x + rx, c.y});
    surface.close_path();
}

void fill_or_stroke(DrawSurface& surface, const Pen& pen, bool filled) {
    if (filled)
        surface.fill(pen.fillcolor);
    else
        surface.stroke(pen.color, pen.linewidth, pen.dash);
}

void draw_text(DrawSurface& surface, const TextShape& s, const Pen& pen) {
    TextExtent extent = surface.measure_text(s.text, s.pen.fontname, s.pen.fontsize);
    double width = extent.width;
    double height = extent.height;
    double descent = text_descent;
    double f = 1.0;
    // The layout engine knows the width the text should take; our fonts may differ.
    if (width > s.width && width > 0.0) {
        f = s.width / width;
        width = s.width;
        height *= f;
        descent *= f;
    }

    double x = s.pos.x;
    switch (s.justify) {
    case Justification::Left:
        break;
    case Justification::Center:
        x = s.pos.x - 0.5 * width;
        break;
    case Justification::Right:
        x = s.pos.x - width;
        break;
    }
    const double y = s.pos.y - height + descent;

    surface.draw_text({x, y}, s.text, s.pen.fontname, s.pen.fontsize * f, pen.color);
}

void draw_polygon(DrawSurface& surface, const PolygonShape& s, const Pen& pen) {
    if (s.points.empty()) return;
    surface.move_to(s.points.back());
    for (const auto& p : s.points)
        surface.line_to(p);
    surface.close_path();
    fill_or_stroke(surface, pen, s.filled);
}

void draw_bezier(DrawSurface& surface, const BezierShape& s, const Pen& pen) {
    if (s.points.empty()) return;
    surface.move_to(s.points.front());
    for (std::size_t i = 1; i + 2 < s.points.size(); i += 3)
        surface.curve_to(s.points[i], s.points[i + 1], s.points[i + 2]);
    surface.stroke(pen.color, pen.linewidth, pen.dash);
}

} // namespace

const Pen* Shape::pen() const {
    return std::visit([](const auto& s) -> const Pen* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, CompoundShape>)
            return nullptr;
        else
            return &s.pen;
    }, v_);
}

const Pen* Shape::select_pen(bool highlight) const {
    return std::visit([highlight](const auto& s) -> const Pen* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, CompoundShape>)
            return nullptr;
        else
            return highlight ? &s.highlight_pen.get(s.pen) : &s.pen;
    }, v_);
}

void Shape::draw(DrawSurface& surface, bool highlight) const {
    std::visit([&](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, CompoundShape>) {
            for (const auto& child : s.shapes)
                child.draw(surface, highlight);
        } else {
            const Pen& pen = highlight ? s.highlight_pen.get(s.pen) : s.pen;
            if constexpr (std::is_same_v<T, TextShape>) {
                draw_text(surface, s, pen);
            } else if constexpr (std::is_same_v<T, EllipseShape>) {
                ellipse_path(surface, s.center, s.rx, s.ry);
                fill_or_stroke(surface, pen, s.filled);
            } else if constexpr (std::is_same_v<T, PolygonShape>) {
                draw_polygon(surface, s, pen);
            } else {
                draw_bezier(surface, s, pen);
            }
        }
    }, v_);
}

std::size_t count_leaf_shapes(const ShapeList& shapes) {
    std::size_t n = 0;
    for (const auto& shape : shapes) {
        if (const auto* compound = shape.as<CompoundShape>())
            n += count_leaf_shapes(compound->shapes);
        else
            ++n;
    }
    return n;
}

} // namespace xdot_model
