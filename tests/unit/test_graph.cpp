#include <xdot_model/graph.hpp>
#include "util/recording_surface.hpp"
#include <gtest/gtest.h>

using namespace xdot_model;
using xdotview_test::RecordingSurface;

namespace {

ShapeList outline(Color color) {
    PolygonShape p;
    p.points = {{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}};
    p.pen.color = color;
    ShapeList shapes;
    shapes.emplace_back(std::move(p));
    return shapes;
}

const Color black{0.0, 0.0, 0.0, 1.0};
const Color blue{0.0, 0.0, 1.0, 1.0};
const Color red{1.0, 0.0, 0.0, 1.0};

Edge diagonal_edge() {
    return Edge(0,
        EdgeEnd{ElementId::node(0), {-100.0, -100.0}},
        EdgeEnd{ElementId::node(1), {200.0, 200.0}},
        {{0.0, 0.0}, {5.0, 5.0}, {10.0, 10.0}},
        outline(blue));
}

} // namespace

TEST(NodeTest, BoundsAreInclusive) {
    Node node(0, {50.0, 50.0}, 20.0, 10.0, outline(black));
    EXPECT_DOUBLE_EQ(node.x1(), 40.0);
    EXPECT_DOUBLE_EQ(node.x2(), 60.0);
    EXPECT_DOUBLE_EQ(node.y1(), 45.0);
    EXPECT_DOUBLE_EQ(node.y2(), 55.0);

    EXPECT_TRUE(node.is_inside({60.0, 50.0}));
    EXPECT_TRUE(node.is_inside({40.0, 45.0}));
    EXPECT_TRUE(node.is_inside({60.0, 55.0}));
    EXPECT_FALSE(node.is_inside({60.001, 50.0}));
    EXPECT_FALSE(node.is_inside({50.0, 44.999}));
}

TEST(NodeTest, UrlRequiresLinkAndHit) {
    Node linked(3, {0.0, 0.0}, 10.0, 10.0, outline(black), std::string("http://example.com"));
    auto url = linked.get_url({5.0, 5.0});
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->url, "http://example.com");
    EXPECT_EQ(url->item, ElementId::node(3));
    EXPECT_EQ(url->highlight, HighlightSet{ElementId::node(3)});
    EXPECT_FALSE(linked.get_url({6.0, 0.0}).has_value());

    Node plain(0, {0.0, 0.0}, 10.0, 10.0, outline(black));
    EXPECT_FALSE(plain.get_url({0.0, 0.0}).has_value());
}

TEST(NodeTest, JumpTargetsCenter) {
    Node node(1, {30.0, 40.0}, 10.0, 10.0, outline(black));
    auto jump = node.get_jump({34.0, 44.0});
    ASSERT_TRUE(jump.has_value());
    EXPECT_EQ(jump->target, (Point{30.0, 40.0}));
    EXPECT_EQ(jump->highlight, HighlightSet{ElementId::node(1)});
    EXPECT_FALSE(node.get_jump({0.0, 0.0}).has_value());
}

TEST(EdgeTest, NearTailJumpsToDestination) {
    Edge edge = diagonal_edge();
    auto jump = edge.get_jump({3.0, 0.0});
    ASSERT_TRUE(jump.has_value());
    EXPECT_EQ(jump->item, ElementId::edge(0));
    EXPECT_EQ(jump->target, (Point{200.0, 200.0}));
    EXPECT_EQ(jump->highlight, (HighlightSet{ElementId::edge(0), ElementId::node(1)}));
}

TEST(EdgeTest, NearHeadJumpsToSource) {
    Edge edge = diagonal_edge();
    auto jump = edge.get_jump({12.0, 10.0});
    ASSERT_TRUE(jump.has_value());
    EXPECT_EQ(jump->target, (Point{-100.0, -100.0}));
    EXPECT_EQ(jump->highlight, (HighlightSet{ElementId::edge(0), ElementId::node(0)}));
}

TEST(EdgeTest, TailWinsWhenBothEndsAreInRange) {
    Edge edge = diagonal_edge();
    auto jump = edge.get_jump({5.0, 5.0});
    ASSERT_TRUE(jump.has_value());
    EXPECT_EQ(jump->target, (Point{200.0, 200.0}));
}

TEST(EdgeTest, RadiusIsTen) {
    Edge edge = diagonal_edge();
    EXPECT_TRUE(edge.get_jump({-10.0, 0.0}).has_value());
    EXPECT_FALSE(edge.get_jump({-10.01, 0.0}).has_value());
    EXPECT_FALSE(edge.get_jump({30.0, 30.0}).has_value());
    EXPECT_FALSE(edge.get_url({0.0, 0.0}).has_value());
}

TEST(EdgeTest, UnbuiltEndpointOnlyHighlightsEdge) {
    Edge edge(2, EdgeEnd{std::nullopt, {7.0, 7.0}}, EdgeEnd{ElementId::node(0), {1.0, 1.0}},
        {{0.0, 0.0}, {50.0, 50.0}}, outline(black));
    auto jump = edge.get_jump({50.0, 50.0});
    ASSERT_TRUE(jump.has_value());
    EXPECT_EQ(jump->target, (Point{7.0, 7.0}));
    EXPECT_EQ(jump->highlight, HighlightSet{ElementId::edge(2)});
}

TEST(GraphTest, DefaultGraphIsEmptyUnitSquare) {
    Graph graph;
    EXPECT_TRUE(graph.empty());
    EXPECT_DOUBLE_EQ(graph.width(), 1.0);
    EXPECT_DOUBLE_EQ(graph.height(), 1.0);
    EXPECT_FALSE(graph.get_jump({0.0, 0.0}).has_value());
}

TEST(GraphTest, EdgesAreHitBeforeNodes) {
    std::vector<Node> nodes;
    nodes.emplace_back(0, Point{0.0, 0.0}, 20.0, 20.0, outline(black));
    nodes.emplace_back(1, Point{200.0, 200.0}, 20.0, 20.0, outline(black));
    std::vector<Edge> edges;
    edges.push_back(diagonal_edge());
    Graph graph(300.0, 300.0, std::move(nodes), std::move(edges));

    auto jump = graph.get_jump({1.0, 1.0});
    ASSERT_TRUE(jump.has_value());
    EXPECT_EQ(jump->item, ElementId::edge(0));

    auto node_jump = graph.get_jump({200.0, 195.0});
    ASSERT_TRUE(node_jump.has_value());
    EXPECT_EQ(node_jump->item, ElementId::node(1));
}

TEST(GraphTest, UrlComesFromFirstMatchingNode) {
    std::vector<Node> nodes;
    nodes.emplace_back(0, Point{0.0, 0.0}, 20.0, 20.0, outline(black));
    nodes.emplace_back(1, Point{5.0, 0.0}, 20.0, 20.0, outline(black), std::string("first"));
    nodes.emplace_back(2, Point{5.0, 0.0}, 20.0, 20.0, outline(black), std::string("second"));
    Graph graph(100.0, 100.0, std::move(nodes), {});

    auto url = graph.get_url({5.0, 0.0});
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->url, "first");
    EXPECT_FALSE(graph.get_url({50.0, 50.0}).has_value());
}

TEST(GraphTest, FindResolvesHandles) {
    std::vector<Node> nodes;
    nodes.emplace_back(0, Point{0.0, 0.0}, 20.0, 20.0, outline(black));
    std::vector<Edge> edges;
    edges.push_back(diagonal_edge());
    Graph graph(100.0, 100.0, std::move(nodes), std::move(edges));

    ASSERT_NE(graph.find(ElementId::node(0)), nullptr);
    EXPECT_EQ(graph.find(ElementId::node(0))->id(), ElementId::node(0));
    EXPECT_EQ(graph.find(ElementId::edge(0))->id(), ElementId::edge(0));
    EXPECT_EQ(graph.find(ElementId::node(1)), nullptr);
    EXPECT_EQ(graph.find(ElementId::edge(5)), nullptr);
}

TEST(GraphTest, DrawsEdgesBeforeNodesWithHighlight) {
    std::vector<Node> nodes;
    nodes.emplace_back(0, Point{0.0, 0.0}, 20.0, 20.0, outline(black));
    std::vector<Edge> edges;
    edges.push_back(diagonal_edge());
    Graph graph(100.0, 100.0, std::move(nodes), std::move(edges));

    RecordingSurface plain;
    graph.draw(plain);
    auto paints = plain.paints();
    ASSERT_EQ(paints.size(), 2u);
    EXPECT_EQ(paints[0].color, blue);
    EXPECT_EQ(paints[1].color, black);

    RecordingSurface highlighted;
    graph.draw(highlighted, HighlightSet{ElementId::node(0)});
    paints = highlighted.paints();
    ASSERT_EQ(paints.size(), 2u);
    EXPECT_EQ(paints[0].color, blue);
    EXPECT_EQ(paints[1].color, red);
}
