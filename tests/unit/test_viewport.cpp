#include <viewport/viewport.hpp>
#include <viewport/viewport_constants.hpp>
#include <gtest/gtest.h>

using viewport::Viewport;

TEST(ViewportTest, ZoomToFitUsesTighterAxisAndCentersGraph) {
    Viewport view;
    view.set_size(800.0, 600.0);
    view.zoom_to_fit(1000.0, 500.0, viewport::zoom_to_fit_margin);
    EXPECT_NEAR(view.zoom_ratio(), 0.776, 1e-12);
    EXPECT_DOUBLE_EQ(view.x(), 500.0);
    EXPECT_DOUBLE_EQ(view.y(), 250.0);
}

TEST(ViewportTest, ZoomToFitWithoutRoomKeepsRatio) {
    Viewport view;
    view.set_zoom_ratio(2.0);
    view.zoom_to_fit(100.0, 50.0, viewport::zoom_to_fit_margin);
    EXPECT_DOUBLE_EQ(view.zoom_ratio(), 2.0);
    EXPECT_DOUBLE_EQ(view.x(), 50.0);
    EXPECT_DOUBLE_EQ(view.y(), 25.0);
}

TEST(ViewportTest, WindowAndGraphTransformsAreInverse) {
    Viewport view;
    view.set_size(200.0, 100.0);
    view.set_focus(50.0, 50.0);
    view.set_zoom_ratio(2.0);

    EXPECT_EQ(view.window_to_graph(100.0, 50.0), (xdot_model::Point{50.0, 50.0}));
    EXPECT_EQ(view.window_to_graph(0.0, 0.0), (xdot_model::Point{0.0, 25.0}));

    const auto p = view.window_to_graph(37.0, 81.0);
    const auto w = view.graph_to_window(p.x, p.y);
    EXPECT_DOUBLE_EQ(w.x, 37.0);
    EXPECT_DOUBLE_EQ(w.y, 81.0);
}

TEST(ViewportTest, ZoomToArea) {
    Viewport view;
    view.set_size(800.0, 600.0);
    view.zoom_to_area(400.0, 100.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(view.zoom_ratio(), 2.0);
    EXPECT_DOUBLE_EQ(view.x(), 200.0);
    EXPECT_DOUBLE_EQ(view.y(), 50.0);
}

TEST(ViewportTest, ZoomToDegenerateArea) {
    Viewport view;
    view.set_size(800.0, 600.0);
    view.set_zoom_ratio(3.0);

    view.zoom_to_area(10.0, 10.0, 10.0, 10.0);
    EXPECT_DOUBLE_EQ(view.zoom_ratio(), 3.0);
    EXPECT_DOUBLE_EQ(view.x(), 10.0);
    EXPECT_DOUBLE_EQ(view.y(), 10.0);

    view.zoom_to_area(0.0, 5.0, 100.0, 5.0);
    EXPECT_DOUBLE_EQ(view.zoom_ratio(), 8.0);
    EXPECT_DOUBLE_EQ(view.x(), 50.0);
}

TEST(ViewportTest, StepZoomAndPan) {
    Viewport view;
    view.set_size(100.0, 100.0);
    view.zoom_in();
    EXPECT_DOUBLE_EQ(view.zoom_ratio(), viewport::zoom_increment);
    view.zoom_out();
    view.zoom_out();
    EXPECT_DOUBLE_EQ(view.zoom_ratio(), 1.0 / viewport::zoom_increment);

    view.set_zoom_ratio(2.0);
    view.set_focus(0.0, 0.0);
    view.pan_pixels(viewport::pos_increment, -50.0);
    EXPECT_DOUBLE_EQ(view.x(), 50.0);
    EXPECT_DOUBLE_EQ(view.y(), -25.0);
}

TEST(ViewportTest, RejectsNonPositiveRatio) {
    Viewport view;
    view.set_zoom_ratio(0.0);
    view.set_zoom_ratio(-1.0);
    EXPECT_DOUBLE_EQ(view.zoom_ratio(), 1.0);
}
