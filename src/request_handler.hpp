#pragma once

#include "parking_engine.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace parkwatch {

enum class request_kind {
    status,
    overview,
    streets,
    nearby,
    heatmap
};

const char* to_string(request_kind k);

// Maps "<prefix>.<kind>" back to its kind.
std::optional<request_kind> parse_request_subject(std::string_view subject,
                                                  std::string_view prefix);

std::string request_subject(std::string_view prefix, request_kind kind);

// Run one query against the engine and render the JSON reply.
// Never throws: bad requests produce {"success": false, "error": ...}.
std::string handle_request(const parking_engine& engine,
                           request_kind kind,
                           std::string_view body,
                           const std::shared_ptr<spdlog::logger>& log);

} // namespace parkwatch
