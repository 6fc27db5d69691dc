#include <interaction/graph_controller.hpp>
#include <interaction/interaction_constants.hpp>
#include <viewport/viewport_constants.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>

namespace interaction {

namespace {

double steady_seconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

GraphController::GraphController(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(steady_seconds))
    , animator_(view_)
    , drag_action_(std::make_unique<NullAction>(*this))
{
}

GraphController::~GraphController() = default;

void GraphController::set_graph(xdot_model::Graph graph) {
    animator_.stop();
    abort_drag();
    graph_ = std::move(graph);
    // Handles of the old graph mean nothing in the new one.
    highlight_.clear();
    cursor_ = Cursor::Arrow;
    if (view_.width() > 0 && view_.height() > 0) {
        zoom_to_fit();
        fit_pending_ = false;
    } else {
        view_.zoom_image(view_.zoom_ratio(), true, graph_.width(), graph_.height());
        fit_pending_ = true;
    }
    spdlog::debug("graph set: {} nodes, {} edges", graph_.nodes().size(), graph_.edges().size());
    queue_draw();
}

void GraphController::set_size(double width, double height) {
    if (width == view_.width() && height == view_.height()) return;
    view_.set_size(width, height);
    if (fit_pending_ && view_.width() > 0 && view_.height() > 0) {
        zoom_to_fit();
        fit_pending_ = false;
    }
    queue_draw();
}

void GraphController::abort_drag() {
    drag_action_->abort();
    drag_action_ = std::make_unique<NullAction>(*this);
}

bool GraphController::on_button_press(const PointerEvent& event) {
    animator_.stop();
    abort_drag();
    drag_action_ = make_drag_action(select_drag_kind(event.button, event.modifiers), *this);
    drag_action_->on_button_press(event);
    presstime_ = now();
    pressx_ = event.x;
    pressy_ = event.y;
    return false;
}

bool GraphController::is_click(const PointerEvent& event) const {
    // A release without a press is not a click.
    if (!presstime_) return false;
    const double deltax = pressx_ - event.x;
    const double deltay = pressy_ - event.y;
    return now() < *presstime_ + click_timeout && std::hypot(deltax, deltay) < click_fuzz;
}

bool GraphController::on_button_release(const PointerEvent& event) {
    drag_action_->on_button_release(event);
    drag_action_ = std::make_unique<NullAction>(*this);

    if (event.button == button_left && is_click(event)) {
        presstime_.reset();
        if (auto url = get_url(event.x, event.y)) {
            spdlog::info("clicked url '{}'", url->url);
            if (clicked_) clicked_(url->url, event);
        } else if (auto jump = get_jump(event.x, event.y)) {
            set_highlight(jump->highlight);
            animate_to(jump->target.x, jump->target.y);
        }
        return true;
    }
    presstime_.reset();
    return event.button == button_left || event.button == button_middle;
}

bool GraphController::on_motion_notify(const PointerEvent& event) {
    drag_action_->on_motion_notify(event);
    return true;
}

bool GraphController::on_scroll(ScrollDirection direction) {
    if (direction == ScrollDirection::Up)
        zoom_in();
    else
        zoom_out();
    return true;
}

bool GraphController::on_key_press(Key key) {
    const double step = viewport::pos_increment;
    switch (key) {
    case Key::Left:
        view_.pan_pixels(-step, 0);
        break;
    case Key::Right:
        view_.pan_pixels(step, 0);
        break;
    case Key::Up:
        view_.pan_pixels(0, -step);
        break;
    case Key::Down:
        view_.pan_pixels(0, step);
        break;
    case Key::PageUp:
        zoom_in();
        break;
    case Key::PageDown:
        zoom_out();
        break;
    case Key::Escape:
        abort_drag();
        break;
    case Key::Other:
        return false;
    }
    queue_draw();
    return true;
}

void GraphController::on_timer() {
    if (animator_.advance(now())) queue_draw();
}

void GraphController::zoom_in() {
    view_.zoom_in();
    queue_draw();
}

void GraphController::zoom_out() {
    view_.zoom_out();
    queue_draw();
}

void GraphController::zoom_to_fit() {
    view_.zoom_to_fit(graph_.width(), graph_.height(), viewport::zoom_to_fit_margin);
    queue_draw();
}

void GraphController::zoom_100() {
    view_.zoom_image(1.0);
    queue_draw();
}

void GraphController::zoom_to_area(double x1, double y1, double x2, double y2) {
    view_.zoom_to_area(x1, y1, x2, y2);
    queue_draw();
}

void GraphController::animate_to(double x, double y) {
    animator_.start(std::make_unique<animation::ZoomToAnimation>(view_, x, y), now());
}

std::optional<xdot_model::Url> GraphController::get_url(double x, double y) const {
    return graph_.get_url(view_.window_to_graph(x, y));
}

std::optional<xdot_model::Jump> GraphController::get_jump(double x, double y) const {
    return graph_.get_jump(view_.window_to_graph(x, y));
}

void GraphController::set_highlight(xdot_model::HighlightSet items) {
    if (highlight_ != items) {
        highlight_ = std::move(items);
        queue_draw();
    }
}

void GraphController::draw_graph(xdot_model::DrawSurface& surface) const {
    graph_.draw(surface, highlight_);
}

void GraphController::draw_overlay(xdot_model::DrawSurface& surface) const {
    drag_action_->draw(surface);
}

bool GraphController::take_redraw() {
    const bool r = redraw_;
    redraw_ = false;
    return r;
}

} // namespace interaction
