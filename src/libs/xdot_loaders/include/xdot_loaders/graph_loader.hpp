#pragma once

#include <xdot_loaders/annotated_layout.hpp>
#include <xdot_loaders/load_error.hpp>
#include <xdot_model/graph.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace xdot_loaders {

using LoadResult = std::variant<xdot_model::Graph, LoadError>;

// Layout space (origin bottom-left, y up) to canvas space (origin top-left, y down).
struct CoordinateTransform {
    double xoffset = 0.0;
    double yoffset = 0.0;
    double xscale = 1.0;
    double yscale = -1.0;

    static CoordinateTransform from_bounding_box(double xmin, double ymin, double xmax, double ymax);
    xdot_model::Point operator()(double x, double y) const;
};

LoadResult build_graph(const AnnotatedLayout& layout);

// Parses laid-out xdot text and builds the scene graph from it.
LoadResult load_graph_from_xdot(std::string_view xdot_text);
LoadResult load_graph_from_xdot_file(const std::string& path);

} // namespace xdot_loaders
