#pragma once

#include "bay.hpp"
#include <optional>
#include <string>
#include <vector>

namespace parkwatch {

// One record as delivered by the sensor feed, before validation.
// Fields the feed omitted or sent with the wrong type stay empty.
struct raw_record {
    std::optional<std::string> id;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::string street;
    std::string status;
    std::string zone;
    std::optional<timestamp> last_updated;

    // The record was not a map at all.
    bool malformed = false;
};

// A full occupancy snapshot as received, ready for normalization.
struct raw_batch {
    std::vector<raw_record> records;

    // Streets known to the feed even if none of their bays are reported.
    std::vector<std::string> streets;

    std::optional<timestamp> captured_at;
};

} // namespace parkwatch
