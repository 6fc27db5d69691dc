#pragma once

#include <optional>
#include <string>
#include <vector>

namespace xdot_model {

struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;

    bool operator==(const Color&) const = default;
};

struct Point {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point&) const = default;
};

// Drawing style snapshot copied into every emitted shape.
struct Pen {
    Color color{0.0, 0.0, 0.0, 1.0};
    Color fillcolor{0.0, 0.0, 0.0, 1.0};
    double linewidth = 1.0;
    double fontsize = 14.0;
    std::string fontname = "Times-Roman";
    std::vector<double> dash; // empty = solid

    Pen highlighted() const;

    bool operator==(const Pen&) const = default;
};

// Memo cell for the highlighted derivation of a shape's pen.
class HighlightPenCache {
public:
    const Pen& get(const Pen& base) const {
        if (!cached_) cached_ = base.highlighted();
        return *cached_;
    }
    bool computed() const { return cached_.has_value(); }

    // Copies start with an empty cell.
    HighlightPenCache() = default;
    HighlightPenCache(const HighlightPenCache&) {}
    HighlightPenCache& operator=(const HighlightPenCache&) { cached_.reset(); return *this; }

private:
    mutable std::optional<Pen> cached_;
};

} // namespace xdot_model
