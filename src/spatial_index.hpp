#pragma once

#include "bay.hpp"
#include "geo.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace parkwatch {

using query_deadline = std::optional<std::chrono::steady_clock::time_point>;

inline bool deadline_passed(const query_deadline& dl) {
    return dl && std::chrono::steady_clock::now() > *dl;
}

struct index_params {
    bounding_box region;
    double cell_meters = 250.0;

    // When a query box spans more than this many cells, scan the occupied
    // cell list instead of probing every cell in the box.
    std::uint64_t dense_cell_probe_limit = 4096;
};

// Uniform lat/lng grid over the service region. Cells are keyed by the
// floored offset from the region's south-west corner; cell edges are
// cell_meters long at the region's centre latitude.
//
// Positions stored in the index are caller-defined (the snapshot uses the
// bay's offset in its bay vector). The index is immutable once finalized and
// safe for concurrent queries.
class spatial_index {
public:
    struct hit {
        std::uint32_t position;
        double distance_m;
    };

    spatial_index() = default;
    explicit spatial_index(const index_params& params);

    // Throws invalid_coordinate if c is not finite or lies outside the region.
    void insert(std::uint32_t position, const coordinate& c);

    // Sort each cell so query output order does not depend on insertion order.
    void finalize();

    std::size_t size() const { return m_size; }
    std::size_t cell_count() const { return m_occupied.size(); }
    const index_params& params() const { return m_params; }

    // Every position whose haversine distance to center is <= radius_m.
    // Output order is unspecified. Returns false if the deadline passed
    // before the scan finished; out then holds the hits found so far.
    bool query_radius(const coordinate& center, double radius_m,
                      std::vector<hit>& out,
                      const query_deadline& deadline = std::nullopt) const;

    // Every position inside box (inclusive). Same deadline contract.
    bool query_box(const bounding_box& box,
                   std::vector<std::uint32_t>& out,
                   const query_deadline& deadline = std::nullopt) const;

    // The k nearest positions within max_radius_m, ascending by distance.
    bool nearest(const coordinate& center, std::size_t k, double max_radius_m,
                 std::vector<hit>& out,
                 const query_deadline& deadline = std::nullopt) const;

private:
    struct cell_key {
        std::int32_t row = 0;
        std::int32_t col = 0;
        bool operator==(const cell_key& o) const noexcept { return row == o.row && col == o.col; }
    };

    struct cell_key_hash {
        std::size_t operator()(const cell_key& k) const noexcept {
            std::uint64_t r = static_cast<std::uint32_t>(k.row);
            std::uint64_t c = static_cast<std::uint32_t>(k.col);
            std::uint64_t h = r * 0x9E3779B185EBCA87ULL;
            h ^= c + 0xC2B2AE3D27D4EB4FULL + (h << 6) + (h >> 2);
            return static_cast<std::size_t>(h);
        }
    };

    struct entry {
        coordinate position;
        std::uint32_t id;
    };

    using cell_map = std::unordered_map<cell_key, std::vector<entry>, cell_key_hash>;

    struct cell_range {
        std::int32_t row0, row1, col0, col1;
        bool empty() const { return row0 > row1 || col0 > col1; }
    };

    cell_key key_for(const coordinate& c) const;
    cell_range range_for(const bounding_box& box) const;

    // Calls fn(entry) for every entry in cells intersecting range.
    template <typename Fn>
    bool visit(const cell_range& range, const query_deadline& deadline, Fn&& fn) const;

    index_params m_params;
    double m_cell_lat_deg = 0.0;
    double m_cell_lng_deg = 0.0;
    std::int32_t m_rows = 0;
    std::int32_t m_cols = 0;

    cell_map m_cells;
    std::vector<cell_key> m_occupied;
    std::size_t m_size = 0;
};

struct index_build_result {
    spatial_index index;

    // Bays accepted into the index; index positions are offsets into this vector.
    std::vector<bay> bays;

    // Ids of bays dropped for lying outside the region.
    std::vector<std::string> rejected;
};

// Build an index over bays. A bay outside the region is dropped and logged;
// it never aborts the build.
index_build_result build_index(std::vector<bay> bays,
                               const index_params& params,
                               const std::shared_ptr<spdlog::logger>& log);

} // namespace parkwatch
