#pragma once

#include <interaction/graph_controller.hpp>
#include <xdot_model/graph.hpp>

struct ImVec2;

namespace canvas {

// ImGui front end for GraphController: feeds it mouse, wheel and key input
// from the current window and draws the graph into the window's draw list.
class GraphCanvas {
public:
    GraphCanvas();
    ~GraphCanvas();

    interaction::GraphController& controller() { return controller_; }
    const interaction::GraphController& controller() const { return controller_; }

    void set_graph(xdot_model::Graph graph);

    // Call between ImGui::Begin/End with the size of the drawing region.
    bool update_and_draw(float region_width, float region_height);

private:
    void handle_input(ImVec2 region_min, float region_width, float region_height);
    void apply_cursor() const;

    interaction::GraphController controller_;
    bool dragging_ = false;
    int drag_button_ = 0;
    float last_mouse_x_ = -1.0f;
    float last_mouse_y_ = -1.0f;
};

} // namespace canvas
