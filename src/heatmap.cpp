#include "heatmap.hpp"
#include "aggregation.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace parkwatch {

namespace {

struct cell_size_deg {
    double lat;
    double lng;
};

cell_size_deg cell_degrees(const heatmap_params& params) {
    return {params.cell_meters / meters_per_degree_lat(),
            params.cell_meters / meters_per_degree_lng(params.reference_latitude)};
}

std::int32_t floor_to_i32(double v) {
    const double f = std::floor(v);
    if (f < static_cast<double>(std::numeric_limits<std::int32_t>::min()) ||
        f > static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
        throw invalid_query("heatmap: cell index overflow, cell size too small");
    }
    return static_cast<std::int32_t>(f);
}

} // anonymous namespace

heatmap_params heatmap_params_for(const bounding_box& region, double cell_meters) {
    return heatmap_params{coordinate{region.south, region.west},
                          region.center().latitude,
                          cell_meters};
}

grid_cell_index cell_of(const coordinate& c, const heatmap_params& params) {
    const auto deg = cell_degrees(params);
    return grid_cell_index{floor_to_i32((c.latitude - params.origin.latitude) / deg.lat),
                           floor_to_i32((c.longitude - params.origin.longitude) / deg.lng)};
}

std::vector<heatmap_cell> build_grid(const std::vector<bay>& bays, const heatmap_params& params) {
    if (!std::isfinite(params.cell_meters) || params.cell_meters <= 0.0) {
        throw invalid_query("heatmap: cell size must be a positive number of meters");
    }
    if (!std::isfinite(params.reference_latitude) || std::abs(params.reference_latitude) >= 89.0) {
        throw invalid_query("heatmap: reference latitude out of range");
    }

    const auto deg = cell_degrees(params);

    auto key_less = [](const grid_cell_index& a, const grid_cell_index& b) {
        return a.row != b.row ? a.row < b.row : a.col < b.col;
    };
    std::map<grid_cell_index, heatmap_cell, decltype(key_less)> cells(key_less);

    for (const auto& b : bays) {
        const auto key = cell_of(b.position, params);
        auto& cell = cells[key];
        cell.row = key.row;
        cell.col = key.col;
        ++cell.bay_count;
        if (b.state == occupancy_state::available) ++cell.available;
        if (b.state == occupancy_state::occupied)  ++cell.occupied;
    }

    std::size_t fullest = 0;
    for (const auto& [key, cell] : cells) fullest = std::max(fullest, cell.bay_count);

    std::vector<heatmap_cell> out;
    out.reserve(cells.size());
    for (auto& [key, cell] : cells) {
        cell.occupancy_ratio = safe_ratio(cell.occupied, cell.bay_count);
        cell.availability_ratio = safe_ratio(cell.available, cell.bay_count);
        cell.density = safe_ratio(cell.bay_count, fullest);
        cell.bounds.south = params.origin.latitude + key.row * deg.lat;
        cell.bounds.north = cell.bounds.south + deg.lat;
        cell.bounds.west = params.origin.longitude + key.col * deg.lng;
        cell.bounds.east = cell.bounds.west + deg.lng;
        out.push_back(cell);
    }
    return out;
}

} // namespace parkwatch
