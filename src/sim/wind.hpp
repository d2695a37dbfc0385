#pragma once

#include "core/types.hpp"

#include <random>

namespace scorch::sim {

/// Wind value to per-frame horizontal acceleration.
constexpr f32 WIND_FORCE_MULTIPLIER = 0.01f;
/// |wind| at or below this reads as calm.
constexpr f32 CALM_WIND = 0.5f;

/// Maximum |wind| for a round (1-based): 5, 8, 10, then 12 from round 10.
f32 wind_range_for_round(u32 round);

/// Uniform in [-range, range], rounded to one decimal.
f32 generate_wind(std::mt19937& rng, f32 range);

inline f32 wind_force(f32 wind) { return wind * WIND_FORCE_MULTIPLIER; }

/// "LEFT", "RIGHT" or "CALM".
const char* wind_direction_text(f32 wind);

} // namespace scorch::sim
