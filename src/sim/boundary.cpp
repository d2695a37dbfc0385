#include "sim/boundary.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace scorch::sim {

const char* edge_behavior_name(EdgeBehavior behavior) {
    switch (behavior) {
    case EdgeBehavior::None: return "none";
    case EdgeBehavior::Bounce: return "bounce";
    case EdgeBehavior::Wrap: return "wrap";
    case EdgeBehavior::Absorb: return "absorb";
    }
    return "unknown";
}

bool parse_edge_behavior(std::string_view name, EdgeBehavior& out) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (key == "none") {
        out = EdgeBehavior::None;
    } else if (key == "bounce") {
        out = EdgeBehavior::Bounce;
    } else if (key == "wrap") {
        out = EdgeBehavior::Wrap;
    } else if (key == "absorb") {
        out = EdgeBehavior::Absorb;
    } else {
        return false;
    }
    return true;
}

BoundaryResult resolve_boundary(f32 x, f32 y, f32 vx, f32 vy,
                                f32 world_width, f32 world_height,
                                EdgeBehavior wall, EdgeBehavior ceiling) {
    (void)world_height; // the floor is the integrator's out-of-bounds check
    BoundaryResult r{x, y, vx, vy};

    if ((x < 0 || x > world_width) && wall != EdgeBehavior::None) {
        r.hit = true;
        switch (wall) {
        case EdgeBehavior::Bounce:
            r.vx = -vx * BOUNCE_RESTITUTION;
            r.x = x < 0 ? 0 : world_width;
            r.bounced = true;
            break;
        case EdgeBehavior::Wrap:
            r.x = x < 0 ? world_width : 0;
            break;
        case EdgeBehavior::Absorb:
            r.absorbed = true;
            return r;
        case EdgeBehavior::None:
            break;
        }
    }

    if (y < 0 && ceiling != EdgeBehavior::None) {
        r.hit = true;
        switch (ceiling) {
        case EdgeBehavior::Bounce:
            r.vy = -vy * BOUNCE_RESTITUTION;
            r.y = 0;
            r.bounced = true;
            break;
        case EdgeBehavior::Wrap:
            // Re-enter at the top heading down, slowed so it cannot loop
            r.y = 0;
            r.vy = std::abs(vy) * 0.5f;
            break;
        case EdgeBehavior::Absorb:
            r.absorbed = true;
            return r;
        case EdgeBehavior::None:
            break;
        }
    }

    return r;
}

} // namespace scorch::sim
