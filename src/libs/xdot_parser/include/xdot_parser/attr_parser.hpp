#pragma once

#include <xdot_model/pen.hpp>
#include <xdot_model/shapes.hpp>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace xdot_parser {

// Maps layout-engine coordinates to canvas coordinates.
using Transform = std::function<xdot_model::Point(double x, double y)>;

// Malformed or truncated operand inside a drawing directive string.
class TokenError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Interpreter for one xdot drawing attribute (_draw_, _ldraw_, ...).
// See http://www.graphviz.org/doc/info/output.html#d:xdot
class AttrParser {
public:
    AttrParser(std::string_view buf, Transform transform);

    // Shapes in emission order. Stops at the first unknown opcode or bad
    // operand, keeping what was emitted before it.
    xdot_model::ShapeList parse();

    static std::string unescape(std::string_view buf);

private:
    bool at_end() const { return pos_ >= buf_.size(); }
    void skip_space();

    std::string read_code();
    double read_float();
    long read_number();
    std::size_t read_count();
    xdot_model::Point read_point();
    std::string read_text();
    std::vector<xdot_model::Point> read_polygon();
    xdot_model::Color read_color(const xdot_model::Color& fallback);
    void apply_style(xdot_model::Pen& pen, const std::string& style);

    std::string buf_;
    std::size_t pos_ = 0;
    Transform transform_;
};

xdot_model::ShapeList parse_xdot_attr(std::string_view buf, const Transform& transform);

} // namespace xdot_parser
