#include <canvas/canvas.hpp>
#include <graph_render/imgui_surface.hpp>
#include "imgui.h"

namespace canvas {

namespace {

// ImGui mouse index -> button number (1 left, 2 middle, 3 right).
const int button_for_imgui_index[] = {
    interaction::button_left,
    interaction::button_right,
    interaction::button_middle,
};

interaction::Modifiers current_modifiers() {
    const ImGuiIO& io = ImGui::GetIO();
    interaction::Modifiers m;
    m.control = io.KeyCtrl;
    m.shift = io.KeyShift;
    m.alt = io.KeyAlt;
    return m;
}

struct KeyBinding {
    ImGuiKey imgui_key;
    interaction::Key key;
};

const KeyBinding key_bindings[] = {
    {ImGuiKey_LeftArrow, interaction::Key::Left},
    {ImGuiKey_RightArrow, interaction::Key::Right},
    {ImGuiKey_UpArrow, interaction::Key::Up},
    {ImGuiKey_DownArrow, interaction::Key::Down},
    {ImGuiKey_PageUp, interaction::Key::PageUp},
    {ImGuiKey_PageDown, interaction::Key::PageDown},
    {ImGuiKey_Escape, interaction::Key::Escape},
};

} // namespace

GraphCanvas::GraphCanvas() = default;

GraphCanvas::~GraphCanvas() = default;

void GraphCanvas::set_graph(xdot_model::Graph graph) {
    dragging_ = false;
    drag_button_ = 0;
    controller_.set_graph(std::move(graph));
}

void GraphCanvas::handle_input(ImVec2 region_min, float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    const ImVec2 mouse = io.MousePos;
    const float local_x = mouse.x - region_min.x;
    const float local_y = mouse.y - region_min.y;
    const bool in_region = local_x >= 0 && local_x <= region_width &&
                           local_y >= 0 && local_y <= region_height;
    const bool hovered = in_region && ImGui::IsWindowHovered();

    interaction::PointerEvent event;
    event.x = local_x;
    event.y = local_y;
    event.modifiers = current_modifiers();

    for (int i = 0; i < 3; ++i) {
        if (hovered && !dragging_ && ImGui::IsMouseClicked(i)) {
            event.button = button_for_imgui_index[i];
            controller_.on_button_press(event);
            dragging_ = true;
            drag_button_ = i;
        }
    }

    const bool moved = mouse.x != last_mouse_x_ || mouse.y != last_mouse_y_;
    if (moved && ImGui::IsMousePosValid() && (dragging_ || hovered)) {
        event.button = 0;
        controller_.on_motion_notify(event);
    }
    last_mouse_x_ = mouse.x;
    last_mouse_y_ = mouse.y;

    if (dragging_ && ImGui::IsMouseReleased(drag_button_)) {
        event.button = button_for_imgui_index[drag_button_];
        controller_.on_button_release(event);
        dragging_ = false;
    }

    if (hovered && io.MouseWheel != 0.0f)
        controller_.on_scroll(io.MouseWheel > 0 ? interaction::ScrollDirection::Up : interaction::ScrollDirection::Down);

    if (ImGui::IsWindowFocused()) {
        for (const auto& binding : key_bindings) {
            if (ImGui::IsKeyPressed(binding.imgui_key))
                controller_.on_key_press(binding.key);
        }
    }
}

void GraphCanvas::apply_cursor() const {
    switch (controller_.cursor()) {
    case interaction::Cursor::Hand:
        ImGui::SetMouseCursor(ImGuiMouseCursor_Hand);
        break;
    case interaction::Cursor::Move:
        ImGui::SetMouseCursor(ImGuiMouseCursor_ResizeAll);
        break;
    case interaction::Cursor::Arrow:
        ImGui::SetMouseCursor(ImGuiMouseCursor_Arrow);
        break;
    }
}

bool GraphCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    const ImVec2 region_min = ImGui::GetCursorScreenPos();
    const ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);

    controller_.set_size(region_width, region_height);
    handle_input(region_min, region_width, region_height);
    controller_.on_timer();
    if (ImGui::IsWindowHovered()) apply_cursor();

    // Reserve the region so the window does not scroll or let clicks through.
    ImGui::InvisibleButton("##graph_canvas", ImVec2(region_width, region_height),
        ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonRight | ImGuiButtonFlags_MouseButtonMiddle);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    graph_render::ImGuiSurface surface(draw_list, ImGui::GetFont());
    surface.clip_rect({region_min.x, region_min.y}, {region_max.x, region_max.y});
    draw_list->AddRectFilled(region_min, region_max, IM_COL32(255, 255, 255, 255));

    const auto& view = controller_.view();
    const float zoom = (float)view.zoom_ratio();
    const float offset_x = region_min.x + 0.5f * region_width - (float)view.x() * zoom;
    const float offset_y = region_min.y + 0.5f * region_height - (float)view.y() * zoom;

    surface.set_transform(offset_x, offset_y, zoom);
    controller_.draw_graph(surface);

    surface.set_transform(region_min.x, region_min.y, 1.0f);
    controller_.draw_overlay(surface);

    surface.pop_clip();
    controller_.take_redraw();
    return true;
}

} // namespace canvas
