#include "json_codec.hpp"
#include "record_decoder.hpp"
#include <algorithm>
#include <cmath>

namespace parkwatch {

namespace {

nlohmann::json parse_body(std::string_view body) {
    if (body.empty()) return nlohmann::json::object();
    nlohmann::json req;
    try {
        req = nlohmann::json::parse(body.begin(), body.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw invalid_query(std::string("request is not valid JSON: ") + e.what());
    }
    if (req.is_null()) return nlohmann::json::object();
    if (!req.is_object()) throw invalid_query("request must be a JSON object");
    return req;
}

std::optional<double> number_field(const nlohmann::json& req, const char* key) {
    auto it = req.find(key);
    if (it == req.end() || it->is_null()) return std::nullopt;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        if (auto v = parse_double(it->get_ref<const std::string&>())) return v;
    }
    throw invalid_query(std::string("'") + key + "' must be a number");
}

std::optional<std::size_t> count_field(const nlohmann::json& req, const char* key) {
    auto it = req.find(key);
    if (it == req.end() || it->is_null()) return std::nullopt;
    if (it->is_number_unsigned()) return it->get<std::size_t>();
    if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
        return static_cast<std::size_t>(it->get<std::int64_t>());
    }
    throw invalid_query(std::string("'") + key + "' must be a non-negative integer");
}

nlohmann::json time_json(const std::optional<timestamp>& t) {
    if (!t) return nullptr;
    return to_epoch_seconds(*t);
}

nlohmann::json bounds_json(const bounding_box& b) {
    return {{"south", b.south}, {"west", b.west}, {"north", b.north}, {"east", b.east}};
}

std::uint64_t version_of(const snapshot_ptr& snap) {
    return snap ? snap->version : 0;
}

} // anonymous namespace

nlohmann::json bay_json(const bay& b) {
    return {
        {"kerbside_id", b.id},
        {"latitude", b.position.latitude},
        {"longitude", b.position.longitude},
        {"status", to_string(b.state)},
        {"road_segment", b.street},
        {"zone_number", b.zone},
        {"last_updated", time_json(b.last_updated)}
    };
}

nlohmann::json encode(const status_response& resp) {
    if (resp.status == query_status::invalid_query) return error_json(resp.message);

    auto data = nlohmann::json::array();
    for (const bay* b : resp.bays) data.push_back(bay_json(*b));

    return {
        {"success", true},
        {"status", to_string(resp.status)},
        {"version", version_of(resp.source)},
        {"count", resp.bays.size()},
        {"data", std::move(data)}
    };
}

nlohmann::json encode(const overview_stats& stats) {
    return {
        {"total_bays", stats.total},
        {"available_bays", stats.available},
        {"occupied_bays", stats.occupied},
        {"unknown_bays", stats.unknown},
        {"availability_ratio", stats.availability_ratio},
        {"occupancy_ratio", stats.occupancy_ratio},
        {"version", stats.version},
        {"captured_at", to_epoch_seconds(stats.captured_at)}
    };
}

nlohmann::json encode(const streets_response& resp) {
    auto data = nlohmann::json::array();
    for (const auto& s : resp.streets) {
        data.push_back({
            {"street_name", s.street},
            {"total_bays", s.total},
            {"available_bays", s.available},
            {"occupied_bays", s.occupied},
            {"unknown_bays", s.unknown},
            {"availability_ratio", s.availability_ratio},
            {"occupancy_ratio", s.occupancy_ratio}
        });
    }
    return {
        {"success", true},
        {"version", version_of(resp.source)},
        {"data", std::move(data)}
    };
}

nlohmann::json encode(const nearby_response& resp) {
    if (resp.status == query_status::invalid_query) return error_json(resp.message);

    auto data = nlohmann::json::array();
    for (const auto& r : resp.results) {
        auto item = bay_json(*r.bay_ref);
        item["distance"] = r.distance_m;
        data.push_back(std::move(item));
    }
    return {
        {"success", true},
        {"status", to_string(resp.status)},
        {"version", version_of(resp.source)},
        {"truncated", resp.truncated},
        {"search_center", {{"lat", resp.center.latitude}, {"lng", resp.center.longitude}}},
        {"search_radius", resp.radius_m},
        {"data", std::move(data)}
    };
}

nlohmann::json encode(const heatmap_response& resp) {
    if (resp.status == query_status::invalid_query) return error_json(resp.message);

    auto cells = nlohmann::json::array();
    for (const auto& c : resp.cells) {
        cells.push_back({
            {"row", c.row},
            {"col", c.col},
            {"bay_count", c.bay_count},
            {"available", c.available},
            {"occupied", c.occupied},
            {"occupancy_ratio", c.occupancy_ratio},
            {"availability_ratio", c.availability_ratio},
            {"density", c.density},
            {"bounds", bounds_json(c.bounds)}
        });
    }
    return {
        {"success", true},
        {"version", version_of(resp.source)},
        {"cell_meters", resp.params.cell_meters},
        {"origin", {{"lat", resp.params.origin.latitude}, {"lng", resp.params.origin.longitude}}},
        {"cells", std::move(cells)}
    };
}

nlohmann::json encode(const refresh_result& result) {
    return {
        {"version", result.version},
        {"bays", result.bays},
        {"received", result.report.received},
        {"accepted", result.report.accepted},
        {"dropped", {
            {"malformed", result.report.malformed},
            {"missing_id", result.report.missing_id},
            {"invalid_coordinate", result.report.invalid_coordinate},
            {"duplicate_id", result.report.duplicate_id}
        }}
    };
}

nlohmann::json error_json(const std::string& message) {
    return {{"success", false}, {"error", message}};
}

std::string dump_reply(const nlohmann::json& reply, int indent) {
    return reply.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<bounding_box> parse_bounds(std::string_view text) {
    double v[4];
    std::size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        auto comma = text.find(',', start);
        if ((i < 3) != (comma != std::string_view::npos)) return std::nullopt;
        auto part = text.substr(start, i < 3 ? comma - start : std::string_view::npos);
        auto parsed = parse_double(part);
        if (!parsed || !std::isfinite(*parsed)) return std::nullopt;
        v[i] = *parsed;
        start = comma + 1;
    }
    return bounding_box{std::min(v[0], v[2]), std::min(v[1], v[3]),
                        std::max(v[0], v[2]), std::max(v[1], v[3])};
}

status_query parse_status_request(std::string_view body) {
    auto req = parse_body(body);
    status_query q;
    if (auto limit = count_field(req, "limit")) q.limit = *limit;

    auto it = req.find("bounds");
    if (it != req.end() && !it->is_null()) {
        if (it->is_string()) {
            q.bounds = parse_bounds(it->get_ref<const std::string&>());
            if (!q.bounds) throw invalid_query("'bounds' must be \"lat1,lng1,lat2,lng2\"");
        } else if (it->is_array() && it->size() == 4) {
            for (const auto& v : *it) {
                if (!v.is_number()) throw invalid_query("'bounds' entries must be numbers");
            }
            double lat1 = (*it)[0].get<double>(), lng1 = (*it)[1].get<double>();
            double lat2 = (*it)[2].get<double>(), lng2 = (*it)[3].get<double>();
            q.bounds = bounding_box{std::min(lat1, lat2), std::min(lng1, lng2),
                                    std::max(lat1, lat2), std::max(lng1, lng2)};
        } else {
            throw invalid_query("'bounds' must be a string or a 4-element array");
        }
    }
    return q;
}

std::optional<std::size_t> parse_streets_request(std::string_view body) {
    return count_field(parse_body(body), "limit");
}

nearby_request parse_nearby_request(std::string_view body) {
    auto req = parse_body(body);
    nearby_request out;

    auto lat = number_field(req, "lat");
    auto lng = number_field(req, "lng");
    if (!lng) lng = number_field(req, "lon");
    if (!lat || !lng) throw invalid_query("'lat' and 'lng' are required");
    out.lat = *lat;
    out.lng = *lng;
    out.radius_m = number_field(req, "radius");

    if (auto it = req.find("available_only"); it != req.end() && !it->is_null()) {
        if (!it->is_boolean()) throw invalid_query("'available_only' must be a boolean");
        out.available_only = it->get<bool>();
    }
    if (auto limit = count_field(req, "limit")) out.limit = *limit;
    return out;
}

std::optional<double> parse_heatmap_request(std::string_view body) {
    return number_field(parse_body(body), "cell_meters");
}

} // namespace parkwatch
