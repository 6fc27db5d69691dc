#pragma once

#include <xdot_model/pen.hpp>
#include <xdot_model/shapes.hpp>
#include <compare>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace xdot_model {

// Stable handle of a node or edge, issued when the graph is built.
struct ElementId {
    enum class Kind : std::uint8_t { Node, Edge };
    Kind kind = Kind::Node;
    std::uint32_t index = 0;

    static ElementId node(std::uint32_t i) { return {Kind::Node, i}; }
    static ElementId edge(std::uint32_t i) { return {Kind::Edge, i}; }

    auto operator<=>(const ElementId&) const = default;
};

using HighlightSet = std::set<ElementId>;

struct Url {
    ElementId item;
    std::string url;
    HighlightSet highlight;
};

struct Jump {
    ElementId item;
    Point target;
    HighlightSet highlight;
};

class Element {
public:
    Element(ElementId id, ShapeList shapes) : id_(id), shapes_(std::move(shapes)) {}

    ElementId id() const { return id_; }
    const ShapeList& shapes() const { return shapes_; }

    void draw(DrawSurface& surface, bool highlight = false) const;

private:
    ElementId id_;
    ShapeList shapes_;
};

class Node : public Element {
public:
    Node(std::uint32_t index, Point center, double width, double height,
        ShapeList shapes, std::optional<std::string> url = std::nullopt);

    Point center() const { return center_; }
    double x1() const { return x1_; }
    double y1() const { return y1_; }
    double x2() const { return x2_; }
    double y2() const { return y2_; }
    const std::optional<std::string>& url() const { return url_; }

    bool is_inside(Point p) const;
    std::optional<Url> get_url(Point p) const;
    std::optional<Jump> get_jump(Point p) const;

private:
    Point center_;
    double x1_ = 0.0;
    double y1_ = 0.0;
    double x2_ = 0.0;
    double y2_ = 0.0;
    std::optional<std::string> url_;
};

// One end of an edge. node is empty when the endpoint node was not built
// (it had no drawing shapes) but still has a position.
struct EdgeEnd {
    std::optional<ElementId> node;
    Point center;
};

class Edge : public Element {
public:
    static constexpr double jump_radius = 10.0;

    Edge(std::uint32_t index, EdgeEnd src, EdgeEnd dst, std::vector<Point> points, ShapeList shapes);

    const EdgeEnd& src() const { return src_; }
    const EdgeEnd& dst() const { return dst_; }
    const std::vector<Point>& points() const { return points_; }

    std::optional<Url> get_url(Point) const { return std::nullopt; }
    // Near the tail jumps to the destination, near the head jumps to the source.
    std::optional<Jump> get_jump(Point p) const;

private:
    EdgeEnd src_;
    EdgeEnd dst_;
    std::vector<Point> points_; // first = tail, last = head
};

class Graph {
public:
    Graph() = default;
    Graph(double width, double height, std::vector<Node> nodes, std::vector<Edge> edges);

    double width() const { return width_; }
    double height() const { return height_; }
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }
    bool empty() const { return nodes_.empty() && edges_.empty(); }

    const Element* find(ElementId id) const;

    std::optional<Url> get_url(Point p) const;
    std::optional<Jump> get_jump(Point p) const;

    // Edges first, then nodes, so nodes draw over edge ends.
    void draw(DrawSurface& surface, const HighlightSet& highlight = {}) const;

private:
    double width_ = 1.0;
    double height_ = 1.0;
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
};

} // namespace xdot_model
