#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <stdexcept>

namespace parkwatch {

namespace {

double positive_meters(const YAML::Node& n, const char* key) {
    double v = n.as<double>();
    if (!std::isfinite(v) || v <= 0.0) {
        throw std::runtime_error(std::string("config: '") + key + "' must be > 0");
    }
    return v;
}

config from_node(const YAML::Node& root) {
    config cfg;

    // NATS connection
    if (auto n = root["nats_address"]) cfg.nats_address = n.as<std::string>();
    if (auto n = root["nats_port"])    cfg.nats_port = n.as<uint16_t>();
    if (auto n = root["tls_cert"])     cfg.tls_cert = n.as<std::string>();
    if (auto n = root["tls_key"])      cfg.tls_key  = n.as<std::string>();
    if (auto n = root["tls_ca"])       cfg.tls_ca   = n.as<std::string>();

    // Ingest
    if (auto n = root["ingest_subject"]) {
        cfg.ingest_subject = n.as<std::string>();
    } else {
        throw std::runtime_error("config: 'ingest_subject' is required");
    }

    if (auto n = root["format"]) {
        auto fmt = parse_format(n.as<std::string>());
        if (!fmt) throw std::runtime_error("config: invalid 'format': " + n.as<std::string>());
        cfg.format = *fmt;
    }

    if (auto n = root["ingest_queue_group"]) cfg.ingest_queue_group = n.as<std::string>();
    if (auto n = root["request_prefix"])     cfg.request_prefix = n.as<std::string>();
    if (cfg.request_prefix.empty()) {
        throw std::runtime_error("config: 'request_prefix' must not be empty");
    }

    // Region (required)
    if (auto region = root["region"]) {
        if (!region.IsMap()) throw std::runtime_error("config: 'region' must be a map");
        auto& box = cfg.engine.region;
        box.south = region["south"].as<double>();
        box.west  = region["west"].as<double>();
        box.north = region["north"].as<double>();
        box.east  = region["east"].as<double>();
        if (!box.valid()) {
            throw std::runtime_error("config: 'region' must satisfy south < north and west < east");
        }
    } else {
        throw std::runtime_error("config: 'region' is required");
    }

    // Engine
    auto& eng = cfg.engine;
    if (auto n = root["index_cell_meters"]) eng.index_cell_meters = positive_meters(n, "index_cell_meters");
    if (auto n = root["nearby_default_radius_meters"]) {
        eng.nearby_default_radius_meters = positive_meters(n, "nearby_default_radius_meters");
    }
    if (auto n = root["nearby_max_radius_meters"]) {
        eng.nearby_max_radius_meters = positive_meters(n, "nearby_max_radius_meters");
    }
    if (auto n = root["nearby_result_cap"]) eng.nearby_result_cap = n.as<std::size_t>();
    if (auto n = root["heatmap_cell_meters"]) eng.heatmap_cell_meters = positive_meters(n, "heatmap_cell_meters");
    if (auto n = root["heatmap_min_cell_meters"]) {
        eng.heatmap_min_cell_meters = positive_meters(n, "heatmap_min_cell_meters");
    }
    if (auto n = root["street_list_limit"]) eng.street_list_limit = n.as<std::size_t>();
    if (auto n = root["query_timeout_ms"])  eng.query_timeout_ms = n.as<unsigned int>();

    if (eng.nearby_result_cap == 0) {
        throw std::runtime_error("config: 'nearby_result_cap' must be > 0");
    }
    if (eng.nearby_default_radius_meters > eng.nearby_max_radius_meters) {
        throw std::runtime_error("config: 'nearby_default_radius_meters' exceeds 'nearby_max_radius_meters'");
    }
    if (eng.heatmap_cell_meters < eng.heatmap_min_cell_meters) {
        throw std::runtime_error("config: 'heatmap_cell_meters' is below 'heatmap_min_cell_meters'");
    }

    if (auto n = root["seed_file"]) cfg.seed_file = n.as<std::string>();

    // Operational
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();
    if (auto n = root["worker_threads"])         cfg.worker_threads = n.as<unsigned int>();

    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be > 0");
    }

    return cfg;
}

} // anonymous namespace

std::optional<payload_format> parse_format(const std::string& s) {
    if (s == "msgpack")     return payload_format::msgpack;
    if (s == "cbor")        return payload_format::cbor;
    if (s == "flexbuffers") return payload_format::flexbuffers;
    if (s == "zera")        return payload_format::zera;
    if (s == "json")        return payload_format::json;
    return std::nullopt;
}

const char* to_string(payload_format f) {
    switch (f) {
        case payload_format::msgpack:     return "msgpack";
        case payload_format::cbor:        return "cbor";
        case payload_format::flexbuffers: return "flexbuffers";
        case payload_format::zera:        return "zera";
        case payload_format::json:        return "json";
    }
    return "unknown";
}

config load_config(const std::string& path) {
    return from_node(YAML::LoadFile(path));
}

config parse_config(const std::string& yaml) {
    return from_node(YAML::Load(yaml));
}

} // namespace parkwatch
