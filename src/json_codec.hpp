#pragma once

#include "parking_engine.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace parkwatch {

// Reply bodies. Field names follow the dashboard's existing API
// (kerbside_id, road_segment, zone_number, ...).
nlohmann::json bay_json(const bay& b);
nlohmann::json encode(const status_response& resp);
nlohmann::json encode(const overview_stats& stats);
nlohmann::json encode(const streets_response& resp);
nlohmann::json encode(const nearby_response& resp);
nlohmann::json encode(const heatmap_response& resp);
nlohmann::json encode(const refresh_result& result);

nlohmann::json error_json(const std::string& message);

// Serialize a reply. Feed strings decoded from binary formats are not
// UTF-8 checked, so invalid sequences are replaced with U+FFFD here.
std::string dump_reply(const nlohmann::json& reply, int indent = -1);

// Request bodies. An empty body means "all defaults".
// Throw invalid_query on missing or mistyped fields.
struct nearby_request {
    double lat = 0.0;
    double lng = 0.0;
    std::optional<double> radius_m;
    bool available_only = false;
    std::size_t limit = 0;
};

status_query parse_status_request(std::string_view body);
std::optional<std::size_t> parse_streets_request(std::string_view body);
nearby_request parse_nearby_request(std::string_view body);
std::optional<double> parse_heatmap_request(std::string_view body);

// "lat1,lng1,lat2,lng2", corners in either order.
std::optional<bounding_box> parse_bounds(std::string_view text);

} // namespace parkwatch
