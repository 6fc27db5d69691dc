#pragma once

#include <viewport/viewport.hpp>
#include <memory>

namespace animation {

// Timer cadence in seconds.
constexpr double step = 0.03;

// Base contract: start() records the start time, tick() returns whether to
// keep running. The Animator owning it drives the timer.
class Animation {
public:
    explicit Animation(viewport::Viewport& view) : view_(view) {}
    virtual ~Animation() = default;

    virtual void start(double now) { (void)now; }
    virtual bool tick(double now) { (void)now; return false; }
    virtual bool is_noop() const { return false; }

protected:
    viewport::Viewport& view_;
};

class NoAnimation : public Animation {
public:
    using Animation::Animation;
    bool is_noop() const override { return true; }
};

class LinearAnimation : public Animation {
public:
    static constexpr double duration = 0.6;

    using Animation::Animation;

    void start(double now) override { started_ = now; }
    bool tick(double now) override;

    virtual void animate(double t) { (void)t; }

private:
    double started_ = 0.0;
};

class MoveToAnimation : public LinearAnimation {
public:
    MoveToAnimation(viewport::Viewport& view, double target_x, double target_y);

    void animate(double t) override;

protected:
    double source_x_;
    double source_y_;
    double target_x_;
    double target_y_;
};

// Moves while zooming out mid-way so that both ends of a long jump stay in view.
class ZoomToAnimation : public MoveToAnimation {
public:
    ZoomToAnimation(viewport::Viewport& view, double target_x, double target_y);

    void animate(double t) override;

    double source_zoom() const { return source_zoom_; }
    double target_zoom() const { return target_zoom_; }
    double extra_zoom() const { return extra_zoom_; }

private:
    double source_zoom_;
    double target_zoom_;
    double extra_zoom_ = 0.0;
};

// Holds the single active animation and its timer.
class Animator {
public:
    explicit Animator(viewport::Viewport& view);

    // Stops the running animation, then arms the timer for the new one.
    void start(std::unique_ptr<Animation> animation, double now);
    // Disarms the timer and leaves a NoAnimation in place.
    void stop();

    // Runs the tick that is due at now, if any. Returns true if the view moved.
    bool advance(double now);

    bool active() const { return armed_; }
    double next_due() const { return next_due_; }
    const Animation& current() const { return *current_; }

private:
    viewport::Viewport& view_;
    std::unique_ptr<Animation> current_;
    bool armed_ = false;
    double next_due_ = 0.0;
};

} // namespace animation
