#include "aggregation.hpp"
#include "snapshot.hpp"
#include <algorithm>

namespace parkwatch {

double safe_ratio(std::size_t part, std::size_t total) {
    if (total == 0) return 0.0;
    return static_cast<double>(part) / static_cast<double>(total);
}

static void count_state(occupancy_state state, std::size_t& available,
                        std::size_t& occupied, std::size_t& unknown) {
    switch (state) {
        case occupancy_state::available: ++available; break;
        case occupancy_state::occupied:  ++occupied;  break;
        case occupancy_state::unknown:   ++unknown;   break;
    }
}

aggregate_result aggregate(const std::vector<bay>& bays,
                           const std::vector<std::string>& declared_streets,
                           std::uint64_t version,
                           timestamp captured_at) {
    aggregate_result result;
    auto& ov = result.overview;
    ov.version = version;
    ov.captured_at = captured_at;

    for (const auto& name : declared_streets) {
        if (name.empty()) continue;
        result.streets[name].street = name;
    }

    for (const auto& b : bays) {
        ++ov.total;
        count_state(b.state, ov.available, ov.occupied, ov.unknown);

        if (b.street.empty()) continue;
        auto& s = result.streets[b.street];
        if (s.street.empty()) s.street = b.street;
        ++s.total;
        count_state(b.state, s.available, s.occupied, s.unknown);
    }

    ov.availability_ratio = safe_ratio(ov.available, ov.total);
    ov.occupancy_ratio = safe_ratio(ov.occupied, ov.total);

    for (auto& [name, s] : result.streets) {
        s.availability_ratio = safe_ratio(s.available, s.total);
        s.occupancy_ratio = safe_ratio(s.occupied, s.total);
    }

    return result;
}

aggregate_result aggregate(const snapshot& snap) {
    return aggregate(snap.bays, snap.declared_streets, snap.version, snap.captured_at);
}

std::vector<street_summary> streets_list(const std::map<std::string, street_summary>& streets,
                                         std::size_t limit) {
    std::vector<street_summary> out;
    out.reserve(streets.size());
    for (const auto& [name, s] : streets) out.push_back(s);

    // The map is already ordered by name, so a stable sort on total keeps
    // names ascending within equal totals.
    std::stable_sort(out.begin(), out.end(), [](const street_summary& a, const street_summary& b) {
        return a.total > b.total;
    });

    if (limit > 0 && out.size() > limit) out.resize(limit);
    return out;
}

} // namespace parkwatch
