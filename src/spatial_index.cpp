#include "spatial_index.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace parkwatch {

static std::int32_t cell_count_for(double span_deg, double cell_deg) {
    const double n = std::ceil(span_deg / cell_deg);
    if (n > static_cast<double>(std::numeric_limits<std::int32_t>::max() - 1)) {
        throw engine_error("spatial_index: cell size too small for region");
    }
    return std::max<std::int32_t>(1, static_cast<std::int32_t>(n));
}

spatial_index::spatial_index(const index_params& params) : m_params(params) {
    if (!m_params.region.valid()) {
        throw engine_error("spatial_index: region is not a valid bounding box");
    }
    if (!std::isfinite(m_params.cell_meters) || m_params.cell_meters <= 0.0) {
        throw engine_error("spatial_index: cell_meters must be > 0");
    }

    const auto& r = m_params.region;
    m_cell_lat_deg = m_params.cell_meters / meters_per_degree_lat();
    m_cell_lng_deg = m_params.cell_meters / meters_per_degree_lng(r.center().latitude);
    m_rows = cell_count_for(r.north - r.south, m_cell_lat_deg);
    m_cols = cell_count_for(r.east - r.west, m_cell_lng_deg);
}

spatial_index::cell_key spatial_index::key_for(const coordinate& c) const {
    const auto& r = m_params.region;
    auto row = static_cast<std::int32_t>(std::floor((c.latitude - r.south) / m_cell_lat_deg));
    auto col = static_cast<std::int32_t>(std::floor((c.longitude - r.west) / m_cell_lng_deg));
    // The north and east edges belong to the last row/column.
    return cell_key{std::clamp(row, 0, m_rows - 1), std::clamp(col, 0, m_cols - 1)};
}

spatial_index::cell_range spatial_index::range_for(const bounding_box& box) const {
    const auto& r = m_params.region;
    if (box.north < r.south || box.south > r.north || box.east < r.west || box.west > r.east) {
        return cell_range{0, -1, 0, -1};
    }
    const coordinate sw{std::max(box.south, r.south), std::max(box.west, r.west)};
    const coordinate ne{std::min(box.north, r.north), std::min(box.east, r.east)};
    const cell_key lo = key_for(sw);
    const cell_key hi = key_for(ne);
    return cell_range{lo.row, hi.row, lo.col, hi.col};
}

void spatial_index::insert(std::uint32_t position, const coordinate& c) {
    if (!is_valid_coordinate(c) || !m_params.region.contains(c)) {
        throw invalid_coordinate("coordinate (" + std::to_string(c.latitude) + ", " +
                                 std::to_string(c.longitude) + ") is outside the service region");
    }

    const cell_key key = key_for(c);
    auto [it, inserted] = m_cells.try_emplace(key);
    if (inserted) m_occupied.push_back(key);
    it->second.push_back(entry{c, position});
    ++m_size;
}

void spatial_index::finalize() {
    for (auto& [key, entries] : m_cells) {
        std::sort(entries.begin(), entries.end(),
                  [](const entry& a, const entry& b) { return a.id < b.id; });
    }
    std::sort(m_occupied.begin(), m_occupied.end(), [](const cell_key& a, const cell_key& b) {
        return a.row != b.row ? a.row < b.row : a.col < b.col;
    });
}

template <typename Fn>
bool spatial_index::visit(const cell_range& range, const query_deadline& deadline, Fn&& fn) const {
    if (range.empty() || m_cells.empty()) return true;

    const std::uint64_t nrows = static_cast<std::uint64_t>(range.row1 - range.row0 + 1);
    const std::uint64_t ncols = static_cast<std::uint64_t>(range.col1 - range.col0 + 1);

    // Strategy 1: dense probing (good when the box spans few cells)
    if (nrows * ncols <= m_params.dense_cell_probe_limit) {
        for (std::int32_t row = range.row0; row <= range.row1; ++row) {
            for (std::int32_t col = range.col0; col <= range.col1; ++col) {
                auto it = m_cells.find(cell_key{row, col});
                if (it == m_cells.end()) continue;
                if (deadline_passed(deadline)) return false;
                for (const auto& e : it->second) fn(e);
            }
        }
        return true;
    }

    // Strategy 2: sparse scan over occupied cells (large radii)
    for (const cell_key& key : m_occupied) {
        if (key.row < range.row0 || key.row > range.row1 ||
            key.col < range.col0 || key.col > range.col1) {
            continue;
        }
        if (deadline_passed(deadline)) return false;
        for (const auto& e : m_cells.at(key)) fn(e);
    }
    return true;
}

bool spatial_index::query_radius(const coordinate& center, double radius_m,
                                 std::vector<hit>& out,
                                 const query_deadline& deadline) const {
    if (!(radius_m >= 0.0) || !is_valid_coordinate(center)) return true;

    bounding_box box;
    radius_bounds(center, radius_m, box);

    return visit(range_for(box), deadline, [&](const entry& e) {
        const double d = haversine_m(center, e.position);
        if (d <= radius_m) out.push_back(hit{e.id, d});
    });
}

bool spatial_index::query_box(const bounding_box& box,
                              std::vector<std::uint32_t>& out,
                              const query_deadline& deadline) const {
    return visit(range_for(box), deadline, [&](const entry& e) {
        if (box.contains(e.position)) out.push_back(e.id);
    });
}

bool spatial_index::nearest(const coordinate& center, std::size_t k, double max_radius_m,
                            std::vector<hit>& out,
                            const query_deadline& deadline) const {
    out.clear();
    if (k == 0 || m_size == 0 || !(max_radius_m > 0.0)) return true;

    // Any radius that already holds k bays holds the k nearest, so grow the
    // radius until it does or the cap is reached.
    double radius = std::min(m_params.cell_meters, max_radius_m);
    bool complete = true;
    while (true) {
        out.clear();
        complete = query_radius(center, radius, out, deadline);
        if (!complete || out.size() >= k || radius >= max_radius_m) break;
        radius = std::min(radius * 2.0, max_radius_m);
    }

    auto by_distance = [](const hit& a, const hit& b) {
        return a.distance_m != b.distance_m ? a.distance_m < b.distance_m : a.position < b.position;
    };
    if (out.size() > k) {
        std::partial_sort(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(k), out.end(), by_distance);
        out.resize(k);
    } else {
        std::sort(out.begin(), out.end(), by_distance);
    }
    return complete;
}

index_build_result build_index(std::vector<bay> bays,
                               const index_params& params,
                               const std::shared_ptr<spdlog::logger>& log) {
    index_build_result result{spatial_index(params), {}, {}};
    result.bays.reserve(bays.size());

    for (auto& b : bays) {
        try {
            result.index.insert(static_cast<std::uint32_t>(result.bays.size()), b.position);
            result.bays.push_back(std::move(b));
        } catch (const invalid_coordinate& e) {
            if (log) log->warn("spatial_index: dropping bay '{}': {}", b.id, e.what());
            result.rejected.push_back(std::move(b.id));
        }
    }

    result.index.finalize();
    return result;
}

} // namespace parkwatch
