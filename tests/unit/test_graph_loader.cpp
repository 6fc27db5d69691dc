#include <xdot_loaders/graph_loader.hpp>
#include "util/diagnostics_capture.hpp"
#include <gtest/gtest.h>

using namespace xdot_loaders;
using xdot_model::ElementId;
using xdot_model::Graph;
using xdot_model::Point;
using xdotview_test::DiagnosticsCapture;

namespace {

// Output of `dot -Txdot` for: digraph G { a -> b; b [URL="http://example.com/b"]; a -> c; c [style=invis] }
const char* const two_node_layout = R"xdot(digraph G {
	graph [_draw_="c 9 -#fffffe00 C 7 -#ffffff P 4 0 0 0 108 126 108 126 0 ",
		bb="0,0,126,108",
		xdotversion=1.7
	];
	node [label="\N"];
	a	[_draw_="c 7 -#000000 e 27 90 27 18 ",
		_ldraw_="F 14 11 -Times-Roman c 7 -#000000 T 27 86.3 0 7 1 -a ",
		height=0.5,
		pos="27,90",
		width=0.75];
	b	[URL="http://example.com/b",
		_draw_="c 7 -#000000 e 27 18 27 18 ",
		_ldraw_="F 14 11 -Times-Roman c 7 -#000000 T 27 14.3 0 7 1 -b ",
		height=0.5,
		pos="27,18",
		width=0.75];
	a -> b	[_draw_="c 7 -#000000 B 4 27 71.7 27 63.98 27 54.71 27 46.11 ",
		_hdraw_="S 5 -solid c 7 -#000000 C 7 -#000000 P 3 30.5 46.1 27 36.1 23.5 46.1 ",
		pos="e,27,36.104 27,71.697 27,63.983 27,54.712 27,46.112"];
	c	[height=0.5,
		pos="99,18",
		style=invis,
		width=0.75];
	a -> c	[_draw_="c 7 -#000000 B 4 40.3 74.2 50.6 62.6 65.9 46.1 77.6 33.4 ",
		_hdraw_="S 5 -solid c 7 -#000000 C 7 -#000000 P 3 80.5 35.2 85.2 25.1 75.4 30.4 ",
		pos="e,85.2,25.106 40.3,74.155 50.6,62.6 65.9,46.1 77.6,33.4"];
}
)xdot";

const Graph& expect_graph(const LoadResult& result) {
    if (auto* error = std::get_if<LoadError>(&result))
        ADD_FAILURE() << to_string(error->kind) << ": " << error->message;
    return std::get<Graph>(result);
}

} // namespace

TEST(CoordinateTransformTest, FlipsAndNormalizesBoundingBox) {
    auto t = CoordinateTransform::from_bounding_box(-10.0, -20.0, 90.0, 80.0);
    EXPECT_DOUBLE_EQ(t.xoffset, 10.0);
    EXPECT_DOUBLE_EQ(t.yoffset, -80.0);
    EXPECT_EQ(t(-10.0, 80.0), (Point{0.0, 0.0}));
    EXPECT_EQ(t(90.0, -20.0), (Point{100.0, 100.0}));
}

TEST(GraphLoaderTest, BuildsNodesAndEdgesFromLayout) {
    LoadResult result = load_graph_from_xdot(two_node_layout);
    ASSERT_TRUE(std::holds_alternative<Graph>(result));
    const Graph& graph = expect_graph(result);

    EXPECT_DOUBLE_EQ(graph.width(), 126.0);
    EXPECT_DOUBLE_EQ(graph.height(), 108.0);
    // c has no drawing shapes.
    ASSERT_EQ(graph.nodes().size(), 2u);
    ASSERT_EQ(graph.edges().size(), 2u);

    const auto& a = graph.nodes()[0];
    EXPECT_EQ(a.center(), (Point{27.0, 18.0}));
    EXPECT_DOUBLE_EQ(a.x1(), 0.0);
    EXPECT_DOUBLE_EQ(a.x2(), 54.0);
    EXPECT_DOUBLE_EQ(a.y1(), 0.0);
    EXPECT_DOUBLE_EQ(a.y2(), 36.0);
    EXPECT_EQ(a.shapes().size(), 2u);
    EXPECT_FALSE(a.url().has_value());

    const auto& b = graph.nodes()[1];
    EXPECT_EQ(b.center(), (Point{27.0, 90.0}));
    EXPECT_EQ(b.url(), "http://example.com/b");
}

TEST(GraphLoaderTest, EdgesSkipArrowEndPointsAndConcatenateShapes) {
    LoadResult result = load_graph_from_xdot(two_node_layout);
    const Graph& graph = expect_graph(result);
    ASSERT_EQ(graph.edges().size(), 2u);

    const auto& ab = graph.edges()[0];
    ASSERT_EQ(ab.points().size(), 4u);
    EXPECT_DOUBLE_EQ(ab.points().front().x, 27.0);
    EXPECT_NEAR(ab.points().front().y, 108.0 - 71.697, 1e-9);
    EXPECT_NEAR(ab.points().back().y, 108.0 - 46.112, 1e-9);
    // B from _draw_, then filled and outline P from _hdraw_.
    ASSERT_EQ(ab.shapes().size(), 3u);
    EXPECT_NE(ab.shapes()[0].as<xdot_model::BezierShape>(), nullptr);
    EXPECT_NE(ab.shapes()[1].as<xdot_model::PolygonShape>(), nullptr);
    EXPECT_EQ(ab.src().node, ElementId::node(0));
    EXPECT_EQ(ab.dst().node, ElementId::node(1));
    EXPECT_EQ(ab.dst().center, (Point{27.0, 90.0}));
}

TEST(GraphLoaderTest, EdgeToInvisibleNodeKeepsItsPosition) {
    LoadResult result = load_graph_from_xdot(two_node_layout);
    const Graph& graph = expect_graph(result);
    const auto& ac = graph.edges()[1];
    EXPECT_FALSE(ac.dst().node.has_value());
    EXPECT_EQ(ac.dst().center, (Point{99.0, 90.0}));

    // Near the tail: jump to the invisible node's position, highlighting only the edge.
    auto jump = graph.get_jump(ac.points().front());
    ASSERT_TRUE(jump.has_value());
    EXPECT_EQ(jump->item, ElementId::edge(1));
    EXPECT_EQ(jump->target, (Point{99.0, 90.0}));
    EXPECT_EQ(jump->highlight, xdot_model::HighlightSet{ElementId::edge(1)});
}

TEST(GraphLoaderTest, LoadingTwiceGivesEqualGraphs) {
    LoadResult first = load_graph_from_xdot(two_node_layout);
    LoadResult second = load_graph_from_xdot(two_node_layout);
    const Graph& g1 = expect_graph(first);
    const Graph& g2 = expect_graph(second);

    ASSERT_EQ(g1.nodes().size(), g2.nodes().size());
    ASSERT_EQ(g1.edges().size(), g2.edges().size());
    for (std::size_t i = 0; i < g1.nodes().size(); ++i) {
        EXPECT_EQ(g1.nodes()[i].center(), g2.nodes()[i].center());
        EXPECT_EQ(xdot_model::count_leaf_shapes(g1.nodes()[i].shapes()),
            xdot_model::count_leaf_shapes(g2.nodes()[i].shapes()));
    }
    for (std::size_t i = 0; i < g1.edges().size(); ++i) {
        EXPECT_EQ(g1.edges()[i].points(), g2.edges()[i].points());
        EXPECT_EQ(g1.edges()[i].shapes().size(), g2.edges()[i].shapes().size());
    }
}

TEST(GraphLoaderTest, MissingBoundingBoxIsFatal) {
    DiagnosticsCapture capture;
    LoadResult result = load_graph_from_xdot("digraph { a [pos=\"1,1\", _draw_=\"e 1 1 1 1\"]; }");
    ASSERT_TRUE(std::holds_alternative<LoadError>(result));
    EXPECT_EQ(std::get<LoadError>(result).kind, LoadError::Kind::MissingBoundingBox);
    EXPECT_EQ(capture.count_level("error"), 1u);
}

TEST(GraphLoaderTest, MalformedBoundingBoxIsSyntaxError) {
    DiagnosticsCapture capture;
    LoadResult result = load_graph_from_xdot("digraph { bb=\"0,0,10\"; }");
    ASSERT_TRUE(std::holds_alternative<LoadError>(result));
    EXPECT_EQ(std::get<LoadError>(result).kind, LoadError::Kind::Syntax);
}

TEST(GraphLoaderTest, EdgeToUnplacedNodeIsInconsistent) {
    DiagnosticsCapture capture;
    LoadResult result = load_graph_from_xdot(R"(digraph {
        graph [bb="0,0,100,100"];
        a [pos="10,10", _draw_="e 10 10 5 5"];
        a -> z [pos="10,10 20,20 30,30 40,40", _draw_="B 4 10 10 20 20 30 30 40 40"];
    })");
    ASSERT_TRUE(std::holds_alternative<LoadError>(result));
    const auto& error = std::get<LoadError>(result);
    EXPECT_EQ(error.kind, LoadError::Kind::InconsistentLayout);
    EXPECT_NE(error.message.find("'z'"), std::string::npos);
    EXPECT_EQ(capture.count_level("error"), 1u);
}

TEST(GraphLoaderTest, ElementsWithoutShapesAreDropped) {
    DiagnosticsCapture capture;
    LoadResult result = load_graph_from_xdot(R"(digraph {
        graph [bb="0,0,100,100"];
        a [pos="10,10", _draw_="e 10 10 5 5"];
        b [pos="50,50"];
        c [_draw_="e 1 1 1 1"];
        a -> b [pos="10,10 20,20 30,30 40,40"];
    })");
    const Graph& graph = expect_graph(result);
    EXPECT_EQ(graph.nodes().size(), 1u);
    EXPECT_TRUE(graph.edges().empty());
}

TEST(GraphLoaderTest, HrefIsUsedWhenUrlIsAbsent) {
    LoadResult result = load_graph_from_xdot(R"(digraph {
        graph [bb="0,0,100,100"];
        a [pos="50,50", href="http://example.com/a", _draw_="e 50 50 5 5"];
    })");
    const Graph& graph = expect_graph(result);
    ASSERT_EQ(graph.nodes().size(), 1u);
    EXPECT_EQ(graph.nodes()[0].url(), "http://example.com/a");
}

TEST(GraphLoaderTest, BadDrawAttributeKeepsEarlierShapes) {
    DiagnosticsCapture capture;
    LoadResult result = load_graph_from_xdot(R"(digraph {
        graph [bb="0,0,100,100"];
        a [pos="50,50", _draw_="e 50 50 5 5 Q 1", _ldraw_="e 50 50 1 1"];
    })");
    const Graph& graph = expect_graph(result);
    ASSERT_EQ(graph.nodes().size(), 1u);
    EXPECT_EQ(graph.nodes()[0].shapes().size(), 2u);
    EXPECT_EQ(capture.count_level("warning"), 1u);
}

TEST(GraphLoaderTest, SyntaxErrorsPropagate) {
    DiagnosticsCapture capture;
    LoadResult result = load_graph_from_xdot("digraph { a -> }");
    ASSERT_TRUE(std::holds_alternative<LoadError>(result));
    EXPECT_EQ(std::get<LoadError>(result).kind, LoadError::Kind::Syntax);
}

TEST(GraphLoaderTest, MissingFileIsIoError) {
    LoadResult result = load_graph_from_xdot_file("/nonexistent/xdotview/graph.xdot");
    ASSERT_TRUE(std::holds_alternative<LoadError>(result));
    EXPECT_EQ(std::get<LoadError>(result).kind, LoadError::Kind::Io);
}
