#pragma once

#include "bay.hpp"
#include "raw_record.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace parkwatch {

// Per-refresh accounting of what happened to each incoming record.
struct ingest_report {
    std::size_t received = 0;
    std::size_t accepted = 0;
    std::size_t malformed = 0;          // record was not a map
    std::size_t missing_id = 0;
    std::size_t invalid_coordinate = 0; // missing, non-finite, or outside the region
    std::size_t duplicate_id = 0;

    std::size_t dropped() const {
        return malformed + missing_id + invalid_coordinate + duplicate_id;
    }
};

// Validated bays of one batch, before indexing.
struct normalized_batch {
    std::vector<bay> bays;

    // Streets the feed declared, sorted and unique. Streets of the bays
    // themselves are picked up by aggregation.
    std::vector<std::string> streets;

    timestamp captured_at{};
};

// Validate raw records into bays. Bad records are dropped and counted,
// never fatal. When an id repeats, the record with the newest last_updated
// wins (first seen on ties). The batch capture time defaults to `now`.
normalized_batch normalize_batch(raw_batch batch,
                                 timestamp now,
                                 ingest_report& report,
                                 const std::shared_ptr<spdlog::logger>& log);

} // namespace parkwatch
