#include "nearby_search.hpp"
#include <algorithm>
#include <cmath>

namespace parkwatch {

void validate(const nearby_query& query, const nearby_limits& limits) {
    if (!std::isfinite(query.center.latitude) || !std::isfinite(query.center.longitude)) {
        throw invalid_query("latitude and longitude must be finite");
    }
    if (!is_valid_coordinate(query.center)) {
        throw invalid_query("latitude must be in [-90, 90] and longitude in [-180, 180]");
    }
    if (!std::isfinite(query.radius_m) || query.radius_m <= 0.0) {
        throw invalid_query("radius must be a positive number of meters");
    }
    if (query.radius_m > limits.max_radius_m) {
        throw invalid_query("radius exceeds the maximum of " +
                            std::to_string(static_cast<long long>(limits.max_radius_m)) + " m");
    }
}

nearby_response find_nearby(const snapshot_ptr& snap,
                            const nearby_query& query,
                            const nearby_limits& limits) {
    nearby_response resp;
    resp.center = query.center;
    resp.radius_m = query.radius_m;
    resp.source = snap;

    try {
        validate(query, limits);
    } catch (const invalid_query& e) {
        resp.status = query_status::invalid_query;
        resp.message = e.what();
        return resp;
    }

    if (!snap) return resp;

    std::vector<spatial_index::hit> hits;
    const bool complete = snap->index.query_radius(query.center, query.radius_m, hits, query.deadline);
    if (!complete) {
        resp.status = query_status::timeout;
        resp.message = "query deadline exceeded";
    }

    resp.results.reserve(hits.size());
    for (const auto& h : hits) {
        const bay* b = &snap->bays[h.position];
        if (query.available_only && b->state != occupancy_state::available) continue;
        resp.results.push_back(nearby_result{b, h.distance_m});
    }

    auto closer = [](const nearby_result& a, const nearby_result& b) {
        if (a.distance_m != b.distance_m) return a.distance_m < b.distance_m;
        return a.bay_ref->id < b.bay_ref->id;
    };

    std::size_t cap = limits.result_cap;
    if (query.limit > 0) cap = std::min(cap, query.limit);

    if (resp.results.size() > cap) {
        std::partial_sort(resp.results.begin(),
                          resp.results.begin() + static_cast<std::ptrdiff_t>(cap),
                          resp.results.end(), closer);
        resp.results.resize(cap);
        resp.truncated = true;
    } else {
        std::sort(resp.results.begin(), resp.results.end(), closer);
    }

    return resp;
}

} // namespace parkwatch
