#pragma once

#include <xdot_loaders/load_error.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xdot_loaders {

using Attributes = std::map<std::string, std::string>;

struct LayoutNode {
    std::string name;
    Attributes attrs;
};

struct LayoutEdge {
    std::string tail;
    std::string head;
    Attributes attrs;
};

// Graph description as written back by the layout engine, with position and
// drawing attributes attached to every element.
struct AnnotatedLayout {
    std::string name;
    bool directed = true;
    bool strict = false;
    Attributes graph_attrs; // root graph only
    std::vector<LayoutNode> nodes;
    std::vector<LayoutEdge> edges;
};

std::optional<std::string> find_attr(const Attributes& attrs, const std::string& key);

// Reads the DOT language subset emitted by Graphviz (-Txdot, -Tdot).
std::variant<AnnotatedLayout, LoadError> parse_annotated_layout(std::string_view text);

} // namespace xdot_loaders
