#pragma once

#include "core/types.hpp"

namespace scorch::sim {

struct Vector2 {
    f32 x = 0, y = 0;
};

/// Axis-aligned rectangle; (x, y) is the top-left corner (Y grows downward).
struct Rect {
    f32 x = 0, y = 0, width = 0, height = 0;

    bool contains(f32 px, f32 py) const {
        return px >= x && px <= x + width && py >= y && py <= y + height;
    }
};

} // namespace scorch::sim
