#pragma once

#include <xdot_model/draw_surface.hpp>
#include <xdot_model/pen.hpp>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace xdot_model {

enum class Justification { Left = -1, Center = 0, Right = 1 };

struct TextShape {
    Pen pen;
    Point pos;
    Justification justify = Justification::Center;
    double width = 0.0; // width the layout engine reserved for the text
    std::string text;
    HighlightPenCache highlight_pen;
};

struct EllipseShape {
    Pen pen;
    Point center;
    double rx = 0.0;
    double ry = 0.0;
    bool filled = false;
    HighlightPenCache highlight_pen;
};

struct PolygonShape {
    Pen pen;
    std::vector<Point> points;
    bool filled = false;
    HighlightPenCache highlight_pen;
};

// points.size() == 1 + 3k
struct BezierShape {
    Pen pen;
    std::vector<Point> points;
    HighlightPenCache highlight_pen;
};

class Shape;

struct CompoundShape {
    std::vector<Shape> shapes;
};

class Shape {
public:
    using Variant = std::variant<TextShape, EllipseShape, PolygonShape, BezierShape, CompoundShape>;

    Shape(TextShape s) : v_(std::move(s)) {}
    Shape(EllipseShape s) : v_(std::move(s)) {}
    Shape(PolygonShape s) : v_(std::move(s)) {}
    Shape(BezierShape s) : v_(std::move(s)) {}
    Shape(CompoundShape s) : v_(std::move(s)) {}

    const Variant& variant() const { return v_; }

    template <typename T>
    const T* as() const { return std::get_if<T>(&v_); }

    // Pen used for drawing; nullptr for compound shapes.
    const Pen* pen() const;
    const Pen* select_pen(bool highlight) const;

    void draw(DrawSurface& surface, bool highlight = false) const;

private:
    Variant v_;
};

using ShapeList = std::vector<Shape>;

// Number of leaf shapes, counting through compounds.
std::size_t count_leaf_shapes(const ShapeList& shapes);

// Fixed descent adjustment applied to text baselines, before scaling.
constexpr double text_descent = 2.0;

} // namespace xdot_model
