#include "request_handler.hpp"
#include "json_codec.hpp"

namespace parkwatch {

const char* to_string(request_kind k) {
    switch (k) {
        case request_kind::status:   return "status";
        case request_kind::overview: return "overview";
        case request_kind::streets:  return "streets";
        case request_kind::nearby:   return "nearby";
        case request_kind::heatmap:  return "heatmap";
    }
    return "unknown";
}

std::optional<request_kind> parse_request_subject(std::string_view subject,
                                                  std::string_view prefix) {
    if (subject.size() <= prefix.size() + 1 ||
        subject.substr(0, prefix.size()) != prefix ||
        subject[prefix.size()] != '.') {
        return std::nullopt;
    }
    auto kind = subject.substr(prefix.size() + 1);
    if (kind == "status")   return request_kind::status;
    if (kind == "overview") return request_kind::overview;
    if (kind == "streets")  return request_kind::streets;
    if (kind == "nearby")   return request_kind::nearby;
    if (kind == "heatmap")  return request_kind::heatmap;
    return std::nullopt;
}

std::string request_subject(std::string_view prefix, request_kind kind) {
    return std::string(prefix) + "." + to_string(kind);
}

std::string handle_request(const parking_engine& engine,
                           request_kind kind,
                           std::string_view body,
                           const std::shared_ptr<spdlog::logger>& log) {
    try {
        switch (kind) {
            case request_kind::status:
                return dump_reply(encode(engine.get_current_status(parse_status_request(body))));

            case request_kind::overview:
                return dump_reply(encode(engine.get_overview_stats()));

            case request_kind::streets:
                return dump_reply(encode(engine.get_streets_list(parse_streets_request(body))));

            case request_kind::nearby: {
                auto req = parse_nearby_request(body);
                return dump_reply(encode(engine.find_nearby_parking(req.lat, req.lng, req.radius_m,
                                                                    req.available_only, req.limit)));
            }

            case request_kind::heatmap:
                return dump_reply(encode(engine.get_heatmap(parse_heatmap_request(body))));
        }
    } catch (const invalid_query& e) {
        if (log) log->debug("Bad {} request: {}", to_string(kind), e.what());
        return dump_reply(error_json(std::string("Bad request: ") + e.what()));
    } catch (const std::exception& e) {
        if (log) log->warn("Failed to handle {} request: {}", to_string(kind), e.what());
        return dump_reply(error_json(std::string("Internal error: ") + e.what()));
    }
    return dump_reply(error_json("Unknown request"));
}

} // namespace parkwatch
