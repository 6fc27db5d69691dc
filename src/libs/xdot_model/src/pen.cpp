#include <xdot_model/pen.hpp>

namespace xdot_model {

Pen Pen::highlighted() const {
    Pen pen = *this;
    pen.color = Color{1.0, 0.0, 0.0, 1.0};
    pen.fillcolor = Color{1.0, 0.8, 0.8, 1.0};
    return pen;
}

} // namespace xdot_model
