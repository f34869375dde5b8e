#pragma once

#include "bay.hpp"
#include "geo.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace parkwatch {

// Fixed lat/lng tiling: row 0 / column 0 start at origin, cell edges are
// cell_meters long at reference_latitude.
struct heatmap_params {
    coordinate origin;
    double reference_latitude = 0.0;
    double cell_meters = 200.0;
};

struct heatmap_cell {
    std::int32_t row = 0;
    std::int32_t col = 0;
    std::size_t bay_count = 0;
    std::size_t available = 0;
    std::size_t occupied = 0;
    double occupancy_ratio = 0.0;     // occupied / bay_count
    double availability_ratio = 0.0;  // available / bay_count
    double density = 0.0;             // bay_count relative to the fullest cell
    bounding_box bounds;

    bool operator==(const heatmap_cell&) const = default;
};

// Tiling anchored at the region's south-west corner, scaled at its centre.
heatmap_params heatmap_params_for(const bounding_box& region, double cell_meters);

struct grid_cell_index {
    std::int32_t row;
    std::int32_t col;
    bool operator==(const grid_cell_index&) const = default;
};

// The cell a coordinate falls into. Pure function of its inputs.
grid_cell_index cell_of(const coordinate& c, const heatmap_params& params);

// Non-empty cells ordered by (row, col). Throws invalid_query if the cell
// size is not a positive finite number.
std::vector<heatmap_cell> build_grid(const std::vector<bay>& bays, const heatmap_params& params);

} // namespace parkwatch
