#include <animation/animation.hpp>
#include <algorithm>
#include <cmath>

namespace animation {

bool LinearAnimation::tick(double now) {
    const double t = (now - started_) / duration;
    animate(std::max(0.0, std::min(t, 1.0)));
    return t < 1.0;
}

MoveToAnimation::MoveToAnimation(viewport::Viewport& view, double target_x, double target_y)
    : LinearAnimation(view)
    , source_x_(view.x())
    , source_y_(view.y())
    , target_x_(target_x)
    , target_y_(target_y)
{
}

void MoveToAnimation::animate(double t) {
    view_.set_focus(target_x_ * t + source_x_ * (1 - t),
        target_y_ * t + source_y_ * (1 - t));
}

ZoomToAnimation::ZoomToAnimation(viewport::Viewport& view, double target_x, double target_y)
    : MoveToAnimation(view, target_x, target_y)
    , source_zoom_(view.zoom_ratio())
    , target_zoom_(view.zoom_ratio())
{
    const double middle_zoom = 0.5 * (source_zoom_ + target_zoom_);
    const double distance = std::hypot(source_x_ - target_x_, source_y_ - target_y_);
    const double visible = 0.9 * std::min(view.width(), view.height()) / source_zoom_;
    if (distance > 0) {
        const double desired_middle_zoom = visible / distance;
        extra_zoom_ = std::min(0.0, 4 * (desired_middle_zoom - middle_zoom));
    }
}

void ZoomToAnimation::animate(double t) {
    const double a = source_zoom_;
    const double b = extra_zoom_;
    const double c = target_zoom_;
    view_.set_zoom_ratio(c * t + b * t * (1 - t) + a * (1 - t));
    MoveToAnimation::animate(t);
}

Animator::Animator(viewport::Viewport& view)
    : view_(view)
    , current_(std::make_unique<NoAnimation>(view))
{
}

void Animator::start(std::unique_ptr<Animation> animation, double now) {
    stop();
    if (!animation || animation->is_noop()) return;
    current_ = std::move(animation);
    current_->start(now);
    armed_ = true;
    next_due_ = now + step;
}

void Animator::stop() {
    armed_ = false;
    if (!current_->is_noop())
        current_ = std::make_unique<NoAnimation>(view_);
}

bool Animator::advance(double now) {
    if (!armed_ || now < next_due_) return false;
    if (current_->tick(now))
        next_due_ = now + step;
    else
        stop();
    return true;
}

} // namespace animation
