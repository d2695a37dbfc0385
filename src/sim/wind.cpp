#include "sim/wind.hpp"

#include <cmath>

namespace scorch::sim {

f32 wind_range_for_round(u32 round) {
    if (round <= 3) return 5.0f;
    if (round <= 6) return 8.0f;
    if (round <= 9) return 10.0f;
    return 12.0f;
}

f32 generate_wind(std::mt19937& rng, f32 range) {
    if (range <= 0) return 0.0f;
    std::uniform_real_distribution<f32> dist(-range, range);
    f32 wind = std::round(dist(rng) * 10.0f) / 10.0f;
    // Rounding may step just past the range
    return std::fmax(-range, std::fmin(range, wind));
}

const char* wind_direction_text(f32 wind) {
    if (wind < -CALM_WIND) return "LEFT";
    if (wind > CALM_WIND) return "RIGHT";
    return "CALM";
}

} // namespace scorch::sim
