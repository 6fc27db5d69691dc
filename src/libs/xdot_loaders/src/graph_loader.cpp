#include <xdot_loaders/graph_loader.hpp>
#include <xdot_parser/attr_parser.hpp>
#include <xdot_parser/diagnostics.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace xdot_loaders {

namespace {

const double points_per_inch = 72.0;
const double default_node_width = 0.75;  // inches
const double default_node_height = 0.5;

const char* const node_draw_attrs[] = {"_draw_", "_ldraw_"};
const char* const edge_draw_attrs[] = {"_draw_", "_ldraw_", "_hdraw_", "_tdraw_", "_hldraw_", "_tldraw_"};

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return *end == '\0' && std::isfinite(out);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string field;
    std::istringstream in(s);
    while (std::getline(in, field, sep))
        out.push_back(field);
    return out;
}

// "x,y" with an optional trailing '!' (pinned position).
bool parse_pair(std::string s, double& x, double& y) {
    if (!s.empty() && s.back() == '!') s.pop_back();
    const auto fields = split(s, ',');
    if (fields.size() != 2) return false;
    return parse_double(fields[0], x) && parse_double(fields[1], y);
}

bool parse_bounding_box(const std::string& s, double& xmin, double& ymin, double& xmax, double& ymax) {
    const auto fields = split(s, ',');
    if (fields.size() != 4) return false;
    return parse_double(fields[0], xmin) && parse_double(fields[1], ymin)
        && parse_double(fields[2], xmax) && parse_double(fields[3], ymax);
}

// Spline control points; "s,x,y" / "e,x,y" arrow end points are skipped.
std::vector<xdot_model::Point> parse_edge_pos(const std::string& pos, const CoordinateTransform& transform) {
    std::vector<xdot_model::Point> points;
    std::istringstream in(pos);
    std::string entry;
    while (in >> entry) {
        double x, y;
        if (!parse_pair(entry, x, y)) continue;
        points.push_back(transform(x, y));
    }
    return points;
}

double size_attr(const Attributes& attrs, const std::string& key, double fallback) {
    double v;
    if (auto s = find_attr(attrs, key); s && parse_double(*s, v)) return v;
    return fallback;
}

template <std::size_t N>
xdot_model::ShapeList parse_draw_attrs(const Attributes& attrs, const char* const (&keys)[N],
    const xdot_parser::Transform& transform)
{
    xdot_model::ShapeList shapes;
    for (const char* key : keys) {
        auto it = attrs.find(key);
        if (it == attrs.end()) continue;
        auto parsed = xdot_parser::parse_xdot_attr(it->second, transform);
        for (auto& shape : parsed)
            shapes.push_back(std::move(shape));
    }
    return shapes;
}

struct PlacedNode {
    std::optional<xdot_model::ElementId> id;
    xdot_model::Point center;
};

} // namespace

const char* to_string(LoadError::Kind kind) {
    switch (kind) {
    case LoadError::Kind::MissingBoundingBox: return "missing bounding box";
    case LoadError::Kind::InconsistentLayout: return "inconsistent layout";
    case LoadError::Kind::Syntax: return "syntax error";
    case LoadError::Kind::LayoutEngine: return "layout engine failure";
    case LoadError::Kind::Io: return "i/o error";
    }
    return "unknown";
}

CoordinateTransform CoordinateTransform::from_bounding_box(double xmin, double ymin, double xmax, double ymax) {
    (void)ymin;
    (void)xmax;
    CoordinateTransform t;
    t.xoffset = -xmin;
    t.yoffset = -ymax;
    t.xscale = 1.0;
    t.yscale = -1.0;
    return t;
}

xdot_model::Point CoordinateTransform::operator()(double x, double y) const {
    return {(x + xoffset) * xscale, (y + yoffset) * yscale};
}

LoadResult build_graph(const AnnotatedLayout& layout) {
    auto logger = xdot_parser::diagnostics();

    const auto bb = find_attr(layout.graph_attrs, "bb");
    if (!bb) {
        logger->error("graph '{}' has no bounding box; was it laid out?", layout.name);
        return LoadError{LoadError::Kind::MissingBoundingBox, "graph has no bounding box (bb attribute)"};
    }
    double xmin, ymin, xmax, ymax;
    if (!parse_bounding_box(*bb, xmin, ymin, xmax, ymax)) {
        logger->error("malformed bounding box '{}'", *bb);
        return LoadError{LoadError::Kind::Syntax, "malformed bounding box '" + *bb + "'"};
    }

    const CoordinateTransform transform = CoordinateTransform::from_bounding_box(xmin, ymin, xmax, ymax);
    const xdot_parser::Transform attr_transform = [&transform](double x, double y) {
        return transform(x, y);
    };

    std::vector<xdot_model::Node> nodes;
    std::vector<xdot_model::Edge> edges;
    std::unordered_map<std::string, PlacedNode> node_by_name;

    for (const auto& node : layout.nodes) {
        const auto pos = find_attr(node.attrs, "pos");
        if (!pos) continue;
        double px, py;
        if (!parse_pair(*pos, px, py)) {
            logger->warn("node '{}' has malformed position '{}'", node.name, *pos);
            continue;
        }
        const xdot_model::Point center = transform(px, py);
        const double w = size_attr(node.attrs, "width", default_node_width) * points_per_inch;
        const double h = size_attr(node.attrs, "height", default_node_height) * points_per_inch;

        xdot_model::ShapeList shapes = parse_draw_attrs(node.attrs, node_draw_attrs, attr_transform);

        std::optional<std::string> url = find_attr(node.attrs, "URL");
        if (!url) url = find_attr(node.attrs, "href");

        PlacedNode placed{std::nullopt, center};
        if (!shapes.empty()) {
            const auto index = static_cast<std::uint32_t>(nodes.size());
            nodes.emplace_back(index, center, w, h, std::move(shapes), std::move(url));
            placed.id = xdot_model::ElementId::node(index);
        }
        node_by_name[node.name] = placed;
    }

    for (const auto& edge : layout.edges) {
        const auto pos = find_attr(edge.attrs, "pos");
        if (!pos) continue;
        std::vector<xdot_model::Point> points = parse_edge_pos(*pos, transform);

        xdot_model::ShapeList shapes = parse_draw_attrs(edge.attrs, edge_draw_attrs, attr_transform);
        if (shapes.empty()) continue;

        auto src = node_by_name.find(edge.tail);
        auto dst = node_by_name.find(edge.head);
        if (src == node_by_name.end() || dst == node_by_name.end()) {
            const std::string& missing = src == node_by_name.end() ? edge.tail : edge.head;
            logger->error("edge {} -> {} refers to unplaced node '{}'", edge.tail, edge.head, missing);
            return LoadError{LoadError::Kind::InconsistentLayout,
                "edge " + edge.tail + " -> " + edge.head + " refers to unplaced node '" + missing + "'"};
        }

        const auto index = static_cast<std::uint32_t>(edges.size());
        edges.emplace_back(index,
            xdot_model::EdgeEnd{src->second.id, src->second.center},
            xdot_model::EdgeEnd{dst->second.id, dst->second.center},
            std::move(points), std::move(shapes));
    }

    logger->debug("built graph '{}': {} nodes, {} edges, {}x{}",
        layout.name, nodes.size(), edges.size(), xmax - xmin, ymax - ymin);
    return xdot_model::Graph(xmax - xmin, ymax - ymin, std::move(nodes), std::move(edges));
}

LoadResult load_graph_from_xdot(std::string_view xdot_text) {
    auto parsed = parse_annotated_layout(xdot_text);
    if (auto* error = std::get_if<LoadError>(&parsed)) {
        xdot_parser::diagnostics()->error("could not read layout: {}", error->message);
        return *error;
    }
    return build_graph(std::get<AnnotatedLayout>(parsed));
}

LoadResult load_graph_from_xdot_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return LoadError{LoadError::Kind::Io, "cannot open '" + path + "'"};
    std::ostringstream contents;
    contents << f.rdbuf();
    return load_graph_from_xdot(contents.str());
}

} // namespace xdot_loaders
