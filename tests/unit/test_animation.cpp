#include <animation/animation.hpp>
#include <gtest/gtest.h>
#include <vector>

using namespace animation;
using viewport::Viewport;

namespace {

class RecordingAnimation : public LinearAnimation {
public:
    using LinearAnimation::LinearAnimation;
    void animate(double t) override { ts.push_back(t); }
    std::vector<double> ts;
};

Viewport make_view(double w, double h, double x, double y, double zoom) {
    Viewport view;
    view.set_size(w, h);
    view.set_focus(x, y);
    view.set_zoom_ratio(zoom);
    return view;
}

} // namespace

TEST(LinearAnimationTest, ClampsAndStopsAtDuration) {
    Viewport view;
    RecordingAnimation anim(view);
    anim.start(0.0);
    EXPECT_TRUE(anim.tick(0.3));
    EXPECT_FALSE(anim.tick(0.6));
    EXPECT_FALSE(anim.tick(1.0));
    EXPECT_TRUE(anim.tick(-0.6));

    ASSERT_EQ(anim.ts.size(), 4u);
    EXPECT_NEAR(anim.ts[0], 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(anim.ts[1], 1.0);
    EXPECT_DOUBLE_EQ(anim.ts[2], 1.0);
    EXPECT_DOUBLE_EQ(anim.ts[3], 0.0);
}

TEST(MoveToAnimationTest, InterpolatesFocus) {
    Viewport view = make_view(100.0, 100.0, 0.0, 0.0, 1.0);
    MoveToAnimation anim(view, 100.0, 50.0);
    anim.animate(0.25);
    EXPECT_DOUBLE_EQ(view.x(), 25.0);
    EXPECT_DOUBLE_EQ(view.y(), 12.5);
    anim.animate(1.0);
    EXPECT_DOUBLE_EQ(view.x(), 100.0);
    EXPECT_DOUBLE_EQ(view.y(), 50.0);
}

TEST(ZoomToAnimationTest, SameFocusHasNoBump) {
    Viewport view = make_view(800.0, 600.0, 10.0, 10.0, 2.0);
    ZoomToAnimation anim(view, 10.0, 10.0);
    EXPECT_DOUBLE_EQ(anim.extra_zoom(), 0.0);
    for (double t : {0.0, 0.25, 0.5, 0.75, 1.0}) {
        anim.animate(t);
        EXPECT_DOUBLE_EQ(view.zoom_ratio(), 2.0);
        EXPECT_DOUBLE_EQ(view.x(), 10.0);
        EXPECT_DOUBLE_EQ(view.y(), 10.0);
    }
}

TEST(ZoomToAnimationTest, LongJumpZoomsOutMidway) {
    Viewport view = make_view(800.0, 600.0, 0.0, 0.0, 1.0);
    ZoomToAnimation anim(view, 1000.0, 0.0);
    // visible = 0.9 * 600 / 1 = 540, desired middle zoom = 0.54.
    EXPECT_NEAR(anim.extra_zoom(), 4.0 * (0.54 - 1.0), 1e-12);

    anim.animate(0.5);
    EXPECT_NEAR(view.zoom_ratio(), 0.54, 1e-12);
    EXPECT_DOUBLE_EQ(view.x(), 500.0);

    anim.animate(1.0);
    EXPECT_DOUBLE_EQ(view.zoom_ratio(), 1.0);
    EXPECT_DOUBLE_EQ(view.x(), 1000.0);
}

TEST(ZoomToAnimationTest, ShortJumpNeverZoomsIn) {
    Viewport view = make_view(800.0, 600.0, 0.0, 0.0, 1.0);
    ZoomToAnimation anim(view, 100.0, 0.0);
    EXPECT_DOUBLE_EQ(anim.extra_zoom(), 0.0);
    anim.animate(0.5);
    EXPECT_DOUBLE_EQ(view.zoom_ratio(), 1.0);
}

TEST(AnimatorTest, TicksOnStepAndStopsAtEnd) {
    Viewport view = make_view(800.0, 600.0, 0.0, 0.0, 1.0);
    Animator animator(view);
    EXPECT_FALSE(animator.active());
    EXPECT_TRUE(animator.current().is_noop());

    animator.start(std::make_unique<MoveToAnimation>(view, 60.0, 0.0), 0.0);
    EXPECT_TRUE(animator.active());
    EXPECT_DOUBLE_EQ(animator.next_due(), step);

    EXPECT_FALSE(animator.advance(0.01));
    EXPECT_DOUBLE_EQ(view.x(), 0.0);

    EXPECT_TRUE(animator.advance(0.3));
    EXPECT_NEAR(view.x(), 30.0, 1e-9);
    EXPECT_TRUE(animator.active());
    EXPECT_NEAR(animator.next_due(), 0.33, 1e-12);

    EXPECT_TRUE(animator.advance(0.7));
    EXPECT_DOUBLE_EQ(view.x(), 60.0);
    EXPECT_FALSE(animator.active());
    EXPECT_TRUE(animator.current().is_noop());
    EXPECT_FALSE(animator.advance(1.0));
}

TEST(AnimatorTest, StartReplacesRunningAnimation) {
    Viewport view = make_view(800.0, 600.0, 0.0, 0.0, 1.0);
    Animator animator(view);
    animator.start(std::make_unique<MoveToAnimation>(view, 100.0, 0.0), 0.0);
    animator.start(std::make_unique<MoveToAnimation>(view, 0.0, 100.0), 0.0);

    while (animator.active())
        animator.advance(animator.next_due());
    EXPECT_DOUBLE_EQ(view.x(), 0.0);
    EXPECT_DOUBLE_EQ(view.y(), 100.0);
}

TEST(AnimatorTest, StopLeavesViewWhereItIs) {
    Viewport view = make_view(800.0, 600.0, 0.0, 0.0, 1.0);
    Animator animator(view);
    animator.start(std::make_unique<MoveToAnimation>(view, 60.0, 0.0), 0.0);
    animator.advance(0.3);
    animator.stop();
    EXPECT_FALSE(animator.active());
    EXPECT_TRUE(animator.current().is_noop());
    EXPECT_FALSE(animator.advance(0.6));
    EXPECT_NEAR(view.x(), 30.0, 1e-9);
}

TEST(AnimatorTest, NoAnimationDoesNotArm) {
    Viewport view;
    Animator animator(view);
    animator.start(std::make_unique<NoAnimation>(view), 0.0);
    EXPECT_FALSE(animator.active());
}
