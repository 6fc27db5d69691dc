#pragma once

#include <string>

namespace xdot_loaders {

struct LoadError {
    enum class Kind {
        MissingBoundingBox, // layout did not resolve positions
        InconsistentLayout, // edge refers to a node the layout never placed
        Syntax,
        LayoutEngine,
        Io,
    };
    Kind kind = Kind::Syntax;
    std::string message;
};

const char* to_string(LoadError::Kind kind);

} // namespace xdot_loaders
