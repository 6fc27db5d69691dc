#include <xdot_parser/attr_parser.hpp>
#include <xdot_parser/color.hpp>
#include <xdot_parser/diagnostics.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace xdot_parser {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

xdot_model::Justification to_justification(long j) {
    switch (j) {
    case -1: return xdot_model::Justification::Left;
    case 0: return xdot_model::Justification::Center;
    case 1: return xdot_model::Justification::Right;
    default:
        throw TokenError("invalid text justification " + std::to_string(j));
    }
}

} // namespace

AttrParser::AttrParser(std::string_view buf, Transform transform)
    : buf_(unescape(buf))
    , transform_(std::move(transform))
{
    skip_space();
}

std::string AttrParser::unescape(std::string_view buf) {
    std::string out(buf);
    replace_all(out, "\\\"", "\"");
    replace_all(out, "\\n", "\n");
    return out;
}

void AttrParser::skip_space() {
    while (pos_ < buf_.size() && is_space(buf_[pos_]))
        ++pos_;
}

std::string AttrParser::read_code() {
    std::size_t end = pos_;
    while (end < buf_.size() && !is_space(buf_[end]))
        ++end;
    std::string res = buf_.substr(pos_, end - pos_);
    pos_ = end;
    skip_space();
    return res;
}

double AttrParser::read_float() {
    const std::string code = read_code();
    char* end = nullptr;
    const double v = std::strtod(code.c_str(), &end);
    if (code.empty() || *end != '\0' || !std::isfinite(v))
        throw TokenError("expected number, got '" + code + "'");
    return v;
}

long AttrParser::read_number() {
    const double v = read_float();
    if (v != std::floor(v))
        throw TokenError("expected integer, got " + std::to_string(v));
    if (v < static_cast<double>(std::numeric_limits<long>::min())
        || v >= -static_cast<double>(std::numeric_limits<long>::min()))
        throw TokenError("integer out of range " + std::to_string(v));
    return static_cast<long>(v);
}

std::size_t AttrParser::read_count() {
    const long n = read_number();
    if (n < 0) throw TokenError("negative count " + std::to_string(n));
    // Every counted item takes at least one byte of what is left.
    if (static_cast<unsigned long>(n) > buf_.size() - pos_)
        throw TokenError("count " + std::to_string(n) + " runs past end of attribute");
    return static_cast<std::size_t>(n);
}

xdot_model::Point AttrParser::read_point() {
    const double x = read_float();
    const double y = read_float();
    return transform_(x, y);
}

std::string AttrParser::read_text() {
    const std::size_t num = read_count();
    const std::size_t dash = buf_.find('-', pos_);
    if (dash == std::string::npos)
        throw TokenError("missing '-' before text");
    const std::size_t start = dash + 1;
    if (start + num > buf_.size())
        throw TokenError("text runs past end of attribute");
    std::string res = buf_.substr(start, num);
    pos_ = start + num;
    skip_space();
    return res;
}

std::vector<xdot_model::Point> AttrParser::read_polygon() {
    const std::size_t n = read_count();
    // "x y" plus a separator per point.
    if (n > (buf_.size() - pos_ + 1) / 4)
        throw TokenError(std::to_string(n) + " points do not fit in attribute");
    std::vector<xdot_model::Point> points;
    points.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        points.push_back(read_point());
    return points;
}

// See http://www.graphviz.org/doc/info/attrs.html#k:color
xdot_model::Color AttrParser::read_color(const xdot_model::Color& fallback) {
    const std::string c = read_text();
    if (auto color = parse_color(c)) return *color;
    diagnostics()->warn("unknown color '{}'", c);
    return fallback;
}

void AttrParser::apply_style(xdot_model::Pen& pen, const std::string& style) {
    static const std::string linewidth_prefix = "setlinewidth(";
    if (style.rfind(linewidth_prefix, 0) == 0) {
        const std::size_t close = style.find(')', linewidth_prefix.size());
        const std::string lw = style.substr(linewidth_prefix.size(),
            close == std::string::npos ? std::string::npos : close - linewidth_prefix.size());
        char* end = nullptr;
        const double v = std::strtod(lw.c_str(), &end);
        if (lw.empty() || *end != '\0')
            throw TokenError("bad line width '" + lw + "'");
        pen.linewidth = v;
    } else if (style == "solid") {
        pen.dash.clear();
    } else if (style == "dashed") {
        pen.dash = {6.0}; // 6pt on, 6pt off
    }
}

xdot_model::ShapeList AttrParser::parse() {
    using namespace xdot_model;

    ShapeList shapes;
    Pen pen;

    try {
        while (!at_end()) {
            const std::string op = read_code();
            if (op == "c") {
                pen.color = read_color(pen.color);
            } else if (op == "C") {
                pen.fillcolor = read_color(pen.fillcolor);
            } else if (op == "S") {
                apply_style(pen, read_text());
            } else if (op == "F") {
                const double size = read_float();
                pen.fontsize = size;
                pen.fontname = read_text();
            } else if (op == "T") {
                TextShape t;
                t.pos = read_point();
                t.justify = to_justification(read_number());
                t.width = read_float();
                t.text = read_text();
                t.pen = pen;
                shapes.emplace_back(std::move(t));
            } else if (op == "E" || op == "e") {
                EllipseShape e;
                e.center = read_point();
                e.rx = read_float();
                e.ry = read_float();
                e.pen = pen;
                // "E" means a filled shape with an outline.
                if (op == "E") {
                    EllipseShape filled = e;
                    filled.filled = true;
                    shapes.emplace_back(std::move(filled));
                }
                shapes.emplace_back(std::move(e));
            } else if (op == "B") {
                BezierShape b;
                b.points = read_polygon();
                if (b.points.empty() || (b.points.size() - 1) % 3 != 0)
                    throw TokenError("bezier with " + std::to_string(b.points.size()) + " points");
                b.pen = pen;
                shapes.emplace_back(std::move(b));
            } else if (op == "P" || op == "p") {
                PolygonShape p;
                p.points = read_polygon();
                p.pen = pen;
                if (op == "P") {
                    PolygonShape filled = p;
                    filled.filled = true;
                    shapes.emplace_back(std::move(filled));
                }
                shapes.emplace_back(std::move(p));
            } else {
                diagnostics()->warn("unknown xdot opcode '{}'", op);
                break;
            }
        }
    } catch (const TokenError& e) {
        diagnostics()->warn("malformed xdot attribute at offset {}: {}", pos_, e.what());
    }
    return shapes;
}

xdot_model::ShapeList parse_xdot_attr(std::string_view buf, const Transform& transform) {
    AttrParser parser(buf, transform);
    return parser.parse();
}

} // namespace xdot_parser
