#pragma once

#include "errors.hpp"
#include "snapshot.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace parkwatch {

struct nearby_query {
    coordinate center;
    double radius_m = 500.0;

    // Drop everything but available bays before ranking.
    bool available_only = false;

    // Per-call cap, 0 = use the configured cap. Never exceeds it.
    std::size_t limit = 0;

    query_deadline deadline;
};

struct nearby_limits {
    double max_radius_m = 5000.0;
    std::size_t result_cap = 20;
};

struct nearby_result {
    const bay* bay_ref = nullptr;
    double distance_m = 0.0;
};

// Result envelope. Holds the snapshot the results point into, so every
// bay_ref stays valid for the envelope's lifetime and all results come
// from one snapshot.
struct nearby_response {
    query_status status = query_status::ok;
    std::string message;
    bool truncated = false;
    coordinate center;
    double radius_m = 0.0;
    snapshot_ptr source;
    std::vector<nearby_result> results;
};

// Throws invalid_query if the query cannot be answered.
void validate(const nearby_query& query, const nearby_limits& limits);

// Bays within radius of the query centre, ascending by distance, ties
// broken by bay id. Ordering ignores occupancy.
// Never throws for bad input: reports invalid_query with no results.
nearby_response find_nearby(const snapshot_ptr& snap,
                            const nearby_query& query,
                            const nearby_limits& limits);

} // namespace parkwatch
