#pragma once

#include "geo.hpp"
#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace parkwatch {

// Encodings accepted for raw ingest payloads
enum class payload_format {
    msgpack,
    cbor,
    flexbuffers,
    zera,
    json
};

// Knobs of the engine core, independent of any transport.
struct engine_options {
    // Service region; bays outside it are dropped at ingest.
    bounding_box region;

    // Spatial index grid cell edge
    double index_cell_meters = 250.0;

    double nearby_default_radius_meters = 500.0;
    double nearby_max_radius_meters = 5000.0;
    std::size_t nearby_result_cap = 20;

    // Heatmap grid cached per snapshot; requests may ask for other sizes
    double heatmap_cell_meters = 200.0;
    double heatmap_min_cell_meters = 10.0;

    // 0 = unlimited
    std::size_t street_list_limit = 50;

    // Per-query deadline, 0 = none
    unsigned int query_timeout_ms = 0;
};

struct config {
    // NATS connection
    std::string nats_address = "127.0.0.1";
    uint16_t nats_port = 4222;
    std::string tls_cert;
    std::string tls_key;
    std::string tls_ca;

    // Ingest stream - full occupancy snapshots from the feed poller
    std::string ingest_subject;
    payload_format format = payload_format::msgpack;
    std::string ingest_queue_group;

    // Query requests arrive on <request_prefix>.status, .overview, .streets,
    // .nearby and .heatmap
    std::string request_prefix = "parking";

    engine_options engine;

    // Optional payload file loaded as the first snapshot at startup
    std::string seed_file;

    // Operational
    int stats_interval_seconds = 30;
    std::string log_level = "info";

    // Worker threads for query processing (0 = hardware_concurrency)
    unsigned int worker_threads = 0;
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Same as load_config, from YAML text.
config parse_config(const std::string& yaml);

// Parse payload_format from string. Returns nullopt if invalid.
std::optional<payload_format> parse_format(const std::string& s);

const char* to_string(payload_format f);

} // namespace parkwatch
