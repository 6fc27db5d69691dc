#include <xdot_model/graph.hpp>

namespace xdot_model {

namespace {

double square_distance(Point a, Point b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    return dx * dx + dy * dy;
}

HighlightSet edge_highlight(ElementId edge, const EdgeEnd& end) {
    HighlightSet set{edge};
    if (end.node) set.insert(*end.node);
    return set;
}

} // namespace

void Element::draw(DrawSurface& surface, bool highlight) const {
    for (const auto& shape : shapes_)
        shape.draw(surface, highlight);
}

Node::Node(std::uint32_t index, Point center, double width, double height,
    ShapeList shapes, std::optional<std::string> url)
    : Element(ElementId::node(index), std::move(shapes))
    , center_(center)
    , x1_(center.x - 0.5 * width)
    , y1_(center.y - 0.5 * height)
    , x2_(center.x + 0.5 * width)
    , y2_(center.y + 0.5 * height)
    , url_(std::move(url))
{
}

bool Node::is_inside(Point p) const {
    return x1_ <= p.x && p.x <= x2_ && y1_ <= p.y && p.y <= y2_;
}

std::optional<Url> Node::get_url(Point p) const {
    if (!url_) return std::nullopt;
    if (!is_inside(p)) return std::nullopt;
    return Url{id(), *url_, HighlightSet{id()}};
}

std::optional<Jump> Node::get_jump(Point p) const {
    if (!is_inside(p)) return std::nullopt;
    return Jump{id(), center_, HighlightSet{id()}};
}

Edge::Edge(std::uint32_t index, EdgeEnd src, EdgeEnd dst, std::vector<Point> points, ShapeList shapes)
    : Element(ElementId::edge(index), std::move(shapes))
    , src_(std::move(src))
    , dst_(std::move(dst))
    , points_(std::move(points))
{
}

std::optional<Jump> Edge::get_jump(Point p) const {
    if (points_.empty()) return std::nullopt;
    const double r2 = jump_radius * jump_radius;
    if (square_distance(p, points_.front()) <= r2)
        return Jump{id(), dst_.center, edge_highlight(id(), dst_)};
    if (square_distance(p, points_.back()) <= r2)
        return Jump{id(), src_.center, edge_highlight(id(), src_)};
    return std::nullopt;
}

Graph::Graph(double width, double height, std::vector<Node> nodes, std::vector<Edge> edges)
    : width_(width)
    , height_(height)
    , nodes_(std::move(nodes))
    , edges_(std::move(edges))
{
}

const Element* Graph::find(ElementId id) const {
    if (id.kind == ElementId::Kind::Node) {
        if (id.index < nodes_.size()) return &nodes_[id.index];
        return nullptr;
    }
    if (id.index < edges_.size()) return &edges_[id.index];
    return nullptr;
}

std::optional<Url> Graph::get_url(Point p) const {
    for (const auto& node : nodes_) {
        if (auto url = node.get_url(p)) return url;
    }
    return std::nullopt;
}

std::optional<Jump> Graph::get_jump(Point p) const {
    for (const auto& edge : edges_) {
        if (auto jump = edge.get_jump(p)) return jump;
    }
    for (const auto& node : nodes_) {
        if (auto jump = node.get_jump(p)) return jump;
    }
    return std::nullopt;
}

void Graph::draw(DrawSurface& surface, const HighlightSet& highlight) const {
    for (const auto& edge : edges_)
        edge.draw(surface, highlight.count(edge.id()) > 0);
    for (const auto& node : nodes_)
        node.draw(surface, highlight.count(node.id()) > 0);
}

} // namespace xdot_model
