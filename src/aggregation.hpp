#pragma once

#include "bay.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace parkwatch {

struct snapshot;

struct street_summary {
    std::string street;
    std::size_t total = 0;
    std::size_t available = 0;
    std::size_t occupied = 0;
    std::size_t unknown = 0;
    double availability_ratio = 0.0;  // available / total
    double occupancy_ratio = 0.0;     // occupied / total

    bool operator==(const street_summary&) const = default;
};

struct overview_stats {
    std::size_t total = 0;
    std::size_t available = 0;
    std::size_t occupied = 0;
    std::size_t unknown = 0;
    double availability_ratio = 0.0;
    double occupancy_ratio = 0.0;
    std::uint64_t version = 0;
    timestamp captured_at{};

    bool operator==(const overview_stats&) const = default;
};

struct aggregate_result {
    overview_stats overview;
    std::map<std::string, street_summary> streets;

    bool operator==(const aggregate_result&) const = default;
};

// part / total, or exactly 0 when total is 0.
double safe_ratio(std::size_t part, std::size_t total);

// Single pass over bays. Every declared street gets an entry even when no
// bay references it; bays with an empty street count in the overview only.
aggregate_result aggregate(const std::vector<bay>& bays,
                           const std::vector<std::string>& declared_streets,
                           std::uint64_t version,
                           timestamp captured_at);

aggregate_result aggregate(const snapshot& snap);

// Summaries ordered by total bays descending, then street name.
// limit 0 means no limit.
std::vector<street_summary> streets_list(const std::map<std::string, street_summary>& streets,
                                         std::size_t limit);

} // namespace parkwatch
