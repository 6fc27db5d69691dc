#pragma once

#include <animation/animation.hpp>
#include <interaction/drag_action.hpp>
#include <interaction/events.hpp>
#include <viewport/viewport.hpp>
#include <xdot_model/draw_surface.hpp>
#include <xdot_model/graph.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace interaction {

// Toolkit-neutral graph widget: owns the graph, the view, the current drag
// action, the highlight and the animation. The host feeds it pointer, key and
// timer events and redraws when take_redraw() says so.
class GraphController {
public:
    using Clock = std::function<double()>;
    using ClickedHandler = std::function<void(const std::string& url, const PointerEvent& event)>;

    explicit GraphController(Clock clock = {});
    ~GraphController();

    GraphController(const GraphController&) = delete;
    GraphController& operator=(const GraphController&) = delete;

    // Replaces the graph and refits the view to it.
    void set_graph(xdot_model::Graph graph);
    const xdot_model::Graph& graph() const { return graph_; }

    void set_size(double width, double height);
    viewport::Viewport& view() { return view_; }
    const viewport::Viewport& view() const { return view_; }
    const animation::Animator& animator() const { return animator_; }
    const DragAction& drag_action() const { return *drag_action_; }

    bool on_button_press(const PointerEvent& event);
    bool on_button_release(const PointerEvent& event);
    bool on_motion_notify(const PointerEvent& event);
    bool on_scroll(ScrollDirection direction);
    bool on_key_press(Key key);

    // Timer callback; runs any animation tick that is due.
    void on_timer();

    void zoom_in();
    void zoom_out();
    void zoom_to_fit();
    void zoom_100();
    void zoom_to_area(double x1, double y1, double x2, double y2);
    void animate_to(double x, double y);

    // Hit tests at widget pixel coordinates.
    std::optional<xdot_model::Url> get_url(double x, double y) const;
    std::optional<xdot_model::Jump> get_jump(double x, double y) const;

    bool is_click(const PointerEvent& event) const;

    const xdot_model::HighlightSet& highlight() const { return highlight_; }
    void set_highlight(xdot_model::HighlightSet items);

    Cursor cursor() const { return cursor_; }
    void set_cursor(Cursor cursor) { cursor_ = cursor; }

    void set_clicked_handler(ClickedHandler handler) { clicked_ = std::move(handler); }

    // Draws the graph through a surface already transformed to graph space.
    void draw_graph(xdot_model::DrawSurface& surface) const;
    // Draws drag overlays through a surface in widget pixel space.
    void draw_overlay(xdot_model::DrawSurface& surface) const;

    void queue_draw() { redraw_ = true; }
    bool take_redraw();

    double now() const { return clock_(); }

private:
    void abort_drag();

    Clock clock_;
    xdot_model::Graph graph_;
    viewport::Viewport view_;
    animation::Animator animator_;
    std::unique_ptr<DragAction> drag_action_;
    xdot_model::HighlightSet highlight_;
    Cursor cursor_ = Cursor::Arrow;
    ClickedHandler clicked_;
    std::optional<double> presstime_;
    double pressx_ = 0.0;
    double pressy_ = 0.0;
    bool fit_pending_ = false;
    bool redraw_ = true;
};

} // namespace interaction
