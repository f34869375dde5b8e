#include "parking_engine.hpp"
#include <algorithm>
#include <cmath>

namespace parkwatch {

parking_engine::parking_engine(const engine_options& options,
                               std::shared_ptr<spdlog::logger> log)
    : m_options(options), m_log(std::move(log)),
      m_coordinator(m_options, m_log)
{}

query_deadline parking_engine::make_deadline() const {
    if (m_options.query_timeout_ms == 0) return std::nullopt;
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(m_options.query_timeout_ms);
}

status_response parking_engine::get_current_status(const status_query& query) const {
    status_response resp;
    resp.source = m_coordinator.current();
    const auto& snap = *resp.source;

    if (!query.bounds) {
        std::size_t n = snap.bays.size();
        if (query.limit > 0) n = std::min(n, query.limit);
        resp.bays.reserve(n);
        for (std::size_t i = 0; i < n; ++i) resp.bays.push_back(&snap.bays[i]);
        return resp;
    }

    // Corners may arrive in either order.
    const auto& in = *query.bounds;
    bounding_box box{std::min(in.south, in.north), std::min(in.west, in.east),
                     std::max(in.south, in.north), std::max(in.west, in.east)};
    if (!std::isfinite(box.south) || !std::isfinite(box.west) ||
        !std::isfinite(box.north) || !std::isfinite(box.east)) {
        resp.status = query_status::invalid_query;
        resp.message = "bounds must be finite";
        return resp;
    }

    std::vector<std::uint32_t> positions;
    if (!snap.index.query_box(box, positions, make_deadline())) {
        resp.status = query_status::timeout;
        resp.message = "query deadline exceeded";
    }

    // Keep snapshot order so limited results are stable across calls.
    std::sort(positions.begin(), positions.end());
    if (query.limit > 0 && positions.size() > query.limit) positions.resize(query.limit);

    resp.bays.reserve(positions.size());
    for (auto p : positions) resp.bays.push_back(&snap.bays[p]);
    return resp;
}

overview_stats parking_engine::get_overview_stats() const {
    return m_coordinator.current()->aggregates.overview;
}

streets_response parking_engine::get_streets_list(std::optional<std::size_t> limit) const {
    streets_response resp;
    resp.source = m_coordinator.current();
    resp.streets = streets_list(resp.source->aggregates.streets,
                                limit.value_or(m_options.street_list_limit));
    return resp;
}

nearby_response parking_engine::find_nearby_parking(double lat, double lng,
                                                    std::optional<double> radius_m,
                                                    bool available_only,
                                                    std::size_t limit) const {
    nearby_query query;
    query.center = coordinate{lat, lng};
    query.radius_m = radius_m.value_or(m_options.nearby_default_radius_meters);
    query.available_only = available_only;
    query.limit = limit;
    query.deadline = make_deadline();

    auto resp = find_nearby(m_coordinator.current(), query,
                            nearby_limits{m_options.nearby_max_radius_meters,
                                          m_options.nearby_result_cap});
    if (resp.status == query_status::invalid_query) {
        m_log->debug("Rejected nearby query ({}, {}, r={}): {}", lat, lng, query.radius_m, resp.message);
    }
    return resp;
}

heatmap_response parking_engine::get_heatmap(std::optional<double> cell_meters) const {
    heatmap_response resp;
    resp.source = m_coordinator.current();
    const auto& snap = *resp.source;

    const double size = cell_meters.value_or(m_options.heatmap_cell_meters);
    if (!std::isfinite(size) || size < m_options.heatmap_min_cell_meters) {
        resp.status = query_status::invalid_query;
        resp.message = "cell size must be at least " +
                       std::to_string(m_options.heatmap_min_cell_meters) + " m";
        return resp;
    }

    if (size == snap.heatmap.cell_meters) {
        resp.params = snap.heatmap;
        resp.cells = snap.heatmap_cells;
        return resp;
    }

    resp.params = heatmap_params_for(m_options.region, size);
    try {
        resp.cells = build_grid(snap.bays, resp.params);
    } catch (const invalid_query& e) {
        resp.status = query_status::invalid_query;
        resp.message = e.what();
        resp.cells.clear();
    }
    return resp;
}

refresh_result parking_engine::trigger_refresh(raw_batch batch) {
    return m_coordinator.refresh(std::move(batch));
}

refresh_result parking_engine::trigger_refresh(payload_format format, std::span<const char> payload) {
    return m_coordinator.refresh(format, payload);
}

void parking_engine::submit_refresh(payload_format format, std::vector<char> payload) {
    m_coordinator.submit(format, std::move(payload));
}

} // namespace parkwatch
