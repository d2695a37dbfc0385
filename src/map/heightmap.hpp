#pragma once

#include "core/types.hpp"

#include <vector>

namespace scorch::map {

/// One surface sample per pixel column, stored as the screen-space Y of the
/// ground (Y grows downward, so a larger value is a lower surface).
/// Sample count is (width + 1) so that both x = 0 and x = width are valid.
class Heightmap {
public:
    Heightmap(u32 width, std::vector<f32> surface);

    /// Level ground at surface_y across the whole width.
    static Heightmap flat(u32 width, f32 surface_y);

    /// Linearly interpolated surface Y at world x.
    /// Coordinates are clamped to [0, width].
    f32 get_height(f32 x) const;

    /// Raw sample (no interpolation, no bounds check).
    f32 get_height_at_column(u32 column) const { return data_[column]; }
    void set_height_at_column(u32 column, f32 surface_y) {
        data_[column] = surface_y;
    }

    /// One pass of [1 2 1]/4 smoothing over columns [first, last].
    /// The outermost columns of the map are left untouched.
    void smooth(u32 first, u32 last);

    u32 width() const { return static_cast<u32>(data_.size()) - 1; }
    u32 column_count() const { return static_cast<u32>(data_.size()); }

private:
    std::vector<f32> data_;
};

} // namespace scorch::map
