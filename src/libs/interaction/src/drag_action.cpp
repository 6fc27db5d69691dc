#include <interaction/drag_action.hpp>
#include <interaction/graph_controller.hpp>
#include <interaction/interaction_constants.hpp>
#include <cmath>
#include <optional>

namespace interaction {

DragKind select_drag_kind(int button, const Modifiers& modifiers) {
    if (button == button_left || button == button_middle) {
        if (modifiers.control) return DragKind::Zoom;
        if (modifiers.shift) return DragKind::ZoomArea;
        return DragKind::Pan;
    }
    return DragKind::Null;
}

std::unique_ptr<DragAction> make_drag_action(DragKind kind, GraphController& controller) {
    switch (kind) {
    case DragKind::Pan: return std::make_unique<PanAction>(controller);
    case DragKind::Zoom: return std::make_unique<ZoomAction>(controller);
    case DragKind::ZoomArea: return std::make_unique<ZoomAreaAction>(controller);
    case DragKind::Null: break;
    }
    return std::make_unique<NullAction>(controller);
}

void DragAction::on_button_press(const PointerEvent& event) {
    startmousex_ = prevmousex_ = event.x;
    startmousey_ = prevmousey_ = event.y;
    start();
}

void DragAction::on_motion_notify(const PointerEvent& event) {
    const double deltax = prevmousex_ - event.x;
    const double deltay = prevmousey_ - event.y;
    drag(deltax, deltay);
    prevmousex_ = event.x;
    prevmousey_ = event.y;
}

void DragAction::on_button_release(const PointerEvent& event) {
    stopmousex_ = event.x;
    stopmousey_ = event.y;
    stop();
}

void NullAction::on_motion_notify(const PointerEvent& event) {
    std::optional<xdot_model::HighlightSet> items;
    if (auto url = controller_.get_url(event.x, event.y))
        items = std::move(url->highlight);
    else if (auto jump = controller_.get_jump(event.x, event.y))
        items = std::move(jump->highlight);

    if (items) {
        controller_.set_cursor(Cursor::Hand);
        controller_.set_highlight(std::move(*items));
    } else {
        controller_.set_cursor(Cursor::Arrow);
        controller_.set_highlight({});
    }
}

void PanAction::start() {
    controller_.set_cursor(Cursor::Move);
}

void PanAction::drag(double deltax, double deltay) {
    controller_.view().pan_pixels(deltax, deltay);
    controller_.queue_draw();
}

void PanAction::stop() {
    controller_.set_cursor(Cursor::Arrow);
}

void ZoomAction::drag(double deltax, double deltay) {
    auto& view = controller_.view();
    view.set_zoom_ratio(view.zoom_ratio() * std::pow(drag_zoom_base, deltax + deltay));
    controller_.queue_draw();
}

void ZoomAction::stop() {
    controller_.queue_draw();
}

void ZoomAreaAction::drag(double deltax, double deltay) {
    (void)deltax;
    (void)deltay;
    controller_.queue_draw();
}

void ZoomAreaAction::draw(xdot_model::DrawSurface& surface) const {
    const double x0 = startmousex_;
    const double y0 = startmousey_;
    const double x1 = prevmousex_;
    const double y1 = prevmousey_;

    surface.move_to({x0, y0});
    surface.line_to({x1, y0});
    surface.line_to({x1, y1});
    surface.line_to({x0, y1});
    surface.close_path();
    surface.fill({0.5, 0.5, 1.0, 0.25});

    const double ox = x1 >= x0 ? -0.5 : 0.5;
    const double oy = y1 >= y0 ? -0.5 : 0.5;
    surface.move_to({x0 + ox, y0 + oy});
    surface.line_to({x1 - ox, y0 + oy});
    surface.line_to({x1 - ox, y1 - oy});
    surface.line_to({x0 + ox, y1 - oy});
    surface.close_path();
    surface.stroke({0.5, 0.5, 1.0, 1.0}, 1.0, {});
}

void ZoomAreaAction::stop() {
    const auto p1 = controller_.view().window_to_graph(startmousex_, startmousey_);
    const auto p2 = controller_.view().window_to_graph(stopmousex_, stopmousey_);
    controller_.zoom_to_area(p1.x, p1.y, p2.x, p2.y);
}

void ZoomAreaAction::abort() {
    controller_.queue_draw();
}

} // namespace interaction
