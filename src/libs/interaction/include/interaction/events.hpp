#pragma once

namespace interaction {

// Button numbers: 1 = left, 2 = middle, 3 = right.
constexpr int button_left = 1;
constexpr int button_middle = 2;
constexpr int button_right = 3;

struct Modifiers {
    bool control = false;
    bool shift = false;
    bool alt = false;
};

// Pointer position in widget pixels.
struct PointerEvent {
    double x = 0.0;
    double y = 0.0;
    int button = 0;
    Modifiers modifiers;
};

enum class Key { Left, Right, Up, Down, PageUp, PageDown, Escape, Other };

enum class ScrollDirection { Up, Down };

enum class Cursor { Arrow, Hand, Move };

} // namespace interaction
