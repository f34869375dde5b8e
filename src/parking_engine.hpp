#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "nearby_search.hpp"
#include "refresh_coordinator.hpp"
#include "snapshot.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parkwatch {

struct status_query {
    // Only bays inside this box
    std::optional<bounding_box> bounds;

    // 0 = all bays
    std::size_t limit = 0;
};

struct status_response {
    query_status status = query_status::ok;
    std::string message;
    snapshot_ptr source;
    std::vector<const bay*> bays;
};

struct heatmap_response {
    query_status status = query_status::ok;
    std::string message;
    snapshot_ptr source;
    heatmap_params params;
    std::vector<heatmap_cell> cells;
};

struct streets_response {
    snapshot_ptr source;
    std::vector<street_summary> streets;
};

// Facade over the coordinator and the query components. Every call loads
// the published snapshot exactly once, so a single response never mixes
// data from two snapshots. Query calls never throw for bad parameters;
// they report query_status::invalid_query instead.
class parking_engine {
public:
    parking_engine(const engine_options& options, std::shared_ptr<spdlog::logger> log);

    status_response get_current_status(const status_query& query = {}) const;

    overview_stats get_overview_stats() const;

    // limit defaults to the configured street_list_limit; 0 = every street.
    streets_response get_streets_list(std::optional<std::size_t> limit = std::nullopt) const;

    // radius_m defaults to the configured nearby_default_radius_meters.
    nearby_response find_nearby_parking(double lat, double lng,
                                        std::optional<double> radius_m = std::nullopt,
                                        bool available_only = false,
                                        std::size_t limit = 0) const;

    // cell_meters defaults to the configured heatmap_cell_meters, which is
    // served from the snapshot's cached grid.
    heatmap_response get_heatmap(std::optional<double> cell_meters = std::nullopt) const;

    // Synchronous refresh. Throws ingest_error; the prior snapshot stays live.
    refresh_result trigger_refresh(raw_batch batch);
    refresh_result trigger_refresh(payload_format format, std::span<const char> payload);

    // Asynchronous, coalesced refresh through the coordinator's builder.
    void submit_refresh(payload_format format, std::vector<char> payload);

    snapshot_ptr current() const { return m_coordinator.current(); }

    refresh_coordinator& coordinator() { return m_coordinator; }
    const engine_options& options() const { return m_options; }

private:
    query_deadline make_deadline() const;

    engine_options m_options;
    std::shared_ptr<spdlog::logger> m_log;
    refresh_coordinator m_coordinator;
};

} // namespace parkwatch
