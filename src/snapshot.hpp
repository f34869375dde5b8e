#pragma once

#include "aggregation.hpp"
#include "bay.hpp"
#include "bay_store.hpp"
#include "heatmap.hpp"
#include "spatial_index.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace parkwatch {

// Immutable occupancy snapshot plus everything derived from it.
// Shared by readers via shared_ptr<const snapshot>; never modified after
// publication.
struct snapshot {
    std::uint64_t version = 0;
    timestamp captured_at{};

    // Bays that passed validation and lie inside the region. Spatial index
    // positions are offsets into this vector.
    std::vector<bay> bays;
    std::unordered_map<std::string, std::uint32_t> by_id;

    std::vector<std::string> declared_streets;

    spatial_index index;
    aggregate_result aggregates;

    // Heatmap for the configured default cell size
    heatmap_params heatmap;
    std::vector<heatmap_cell> heatmap_cells;

    ingest_report report;

    const bay* find(const std::string& id) const {
        auto it = by_id.find(id);
        return it == by_id.end() ? nullptr : &bays[it->second];
    }
};

using snapshot_ptr = std::shared_ptr<const snapshot>;

} // namespace parkwatch
