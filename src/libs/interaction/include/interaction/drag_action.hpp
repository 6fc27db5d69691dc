#pragma once

#include <interaction/events.hpp>
#include <xdot_model/draw_surface.hpp>
#include <memory>

namespace interaction {

class GraphController;

enum class DragKind { Null, Pan, Zoom, ZoomArea };

// Which action a press starts: left or middle button pans, with control
// zooms, with shift zooms to a rubber-band area. Other buttons do nothing.
DragKind select_drag_kind(int button, const Modifiers& modifiers);

class DragAction {
public:
    explicit DragAction(GraphController& controller) : controller_(controller) {}
    virtual ~DragAction() = default;

    virtual DragKind kind() const = 0;

    void on_button_press(const PointerEvent& event);
    virtual void on_motion_notify(const PointerEvent& event);
    void on_button_release(const PointerEvent& event);

    // Overlay in widget pixel coordinates.
    virtual void draw(xdot_model::DrawSurface& surface) const { (void)surface; }
    virtual void abort() {}

protected:
    virtual void start() {}
    virtual void drag(double deltax, double deltay) { (void)deltax; (void)deltay; }
    virtual void stop() {}

    GraphController& controller_;
    double startmousex_ = 0.0;
    double startmousey_ = 0.0;
    double prevmousex_ = 0.0;
    double prevmousey_ = 0.0;
    double stopmousex_ = 0.0;
    double stopmousey_ = 0.0;
};

// Hover: tracks the link or jump target under the pointer.
class NullAction : public DragAction {
public:
    using DragAction::DragAction;
    DragKind kind() const override { return DragKind::Null; }
    void on_motion_notify(const PointerEvent& event) override;
};

class PanAction : public DragAction {
public:
    using DragAction::DragAction;
    DragKind kind() const override { return DragKind::Pan; }
    void abort() override { stop(); }

protected:
    void start() override;
    void drag(double deltax, double deltay) override;
    void stop() override;
};

class ZoomAction : public DragAction {
public:
    using DragAction::DragAction;
    DragKind kind() const override { return DragKind::Zoom; }

protected:
    void drag(double deltax, double deltay) override;
    void stop() override;
};

class ZoomAreaAction : public DragAction {
public:
    using DragAction::DragAction;
    DragKind kind() const override { return DragKind::ZoomArea; }
    void draw(xdot_model::DrawSurface& surface) const override;
    void abort() override;

protected:
    void drag(double deltax, double deltay) override;
    void stop() override;
};

std::unique_ptr<DragAction> make_drag_action(DragKind kind, GraphController& controller);

} // namespace interaction
