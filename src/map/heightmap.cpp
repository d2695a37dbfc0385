#include "map/heightmap.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace scorch::map {

Heightmap::Heightmap(u32 width, std::vector<f32> surface)
    : data_(std::move(surface)) {
    width = std::max(width, 1u);
    size_t expected = static_cast<size_t>(width) + 1;
    if (data_.size() != expected) {
        spdlog::warn("Heightmap: {} samples for width {}, expected {}",
                     data_.size(), width, expected);
        f32 fill = data_.empty() ? 0.0f : data_.back();
        data_.resize(expected, fill);
    }
}

Heightmap Heightmap::flat(u32 width, f32 surface_y) {
    return Heightmap(width, std::vector<f32>(width + 1, surface_y));
}

f32 Heightmap::get_height(f32 x) const {
    f32 max_x = static_cast<f32>(width());
    x = std::clamp(x, 0.0f, max_x);

    u32 column = static_cast<u32>(x);
    // Clamp to avoid reading past the last sample
    if (column >= width()) column = width() - 1;

    f32 fx = x - static_cast<f32>(column);
    f32 h0 = data_[column];
    f32 h1 = data_[column + 1];
    return h0 + (h1 - h0) * fx;
}

void Heightmap::smooth(u32 first, u32 last) {
    last = std::min(last, width());
    if (first > last) return;

    std::vector<f32> smoothed;
    smoothed.reserve(last - first + 1);
    for (u32 i = first; i <= last; i++) {
        if (i == 0 || i == width()) {
            smoothed.push_back(data_[i]);
        } else {
            smoothed.push_back(
                (data_[i - 1] + data_[i] * 2.0f + data_[i + 1]) / 4.0f);
        }
    }
    std::copy(smoothed.begin(), smoothed.end(), data_.begin() + first);
}

} // namespace scorch::map
