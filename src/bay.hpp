#pragma once

#include "geo.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace parkwatch {

using clock_type = std::chrono::system_clock;
using timestamp = clock_type::time_point;

enum class occupancy_state {
    available,
    occupied,
    unknown
};

struct bay {
    std::string id;
    coordinate position;
    std::string street;
    occupancy_state state = occupancy_state::unknown;
    // Unset when the feed did not report one.
    std::optional<timestamp> last_updated;
    std::string zone;
};

// Maps a sensor feed status description onto an occupancy state.
// "Unoccupied" -> available, "Present" -> occupied, anything unrecognised
// (including "Out of Service") -> unknown. Case-insensitive.
occupancy_state parse_occupancy(std::string_view status);

const char* to_string(occupancy_state s);

// Seconds since the Unix epoch. from_epoch_seconds expects a value the
// clock can hold; feed values go through checked_epoch_seconds, which
// returns nullopt for anything outside the clock's range (epoch
// milliseconds included) or for a non-finite double.
std::int64_t to_epoch_seconds(timestamp t);
timestamp from_epoch_seconds(std::int64_t s);
std::optional<timestamp> checked_epoch_seconds(std::int64_t s);
std::optional<timestamp> checked_epoch_seconds(double s);

// Parse "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and a
// trailing "Z" or "+00:00". Other offsets are rejected.
std::optional<timestamp> parse_iso8601(std::string_view text);

} // namespace parkwatch
