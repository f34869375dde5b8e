#include "config.hpp"
#include "parking_engine.hpp"
#include "payload_file.hpp"
#include "service.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <thread>

int main(int argc, char* argv[]) {
    cxxopts::Options options("parkwatch",
        "Live parking bay availability engine for NATS");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("a,address", "NATS server address (overrides config)", cxxopts::value<std::string>())
        ("p,port", "NATS server port (overrides config)", cxxopts::value<uint16_t>())
        ("s,seed", "Payload file loaded as the first snapshot (overrides config)", cxxopts::value<std::string>())
        ("f,format", "Payload format: msgpack, cbor, flexbuffers, zera, json (overrides config)",
            cxxopts::value<std::string>())
        ("i,inspect", "Decode a payload file, print its ingest report and exit", cxxopts::value<std::string>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 1;
    }

    if (result.count("help") || !result.count("config")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("parkwatch");

    // Load config
    parkwatch::config cfg;
    try {
        cfg = parkwatch::load_config(result["config"].as<std::string>());
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // CLI overrides
    if (result.count("address")) cfg.nats_address = result["address"].as<std::string>();
    if (result.count("port"))    cfg.nats_port = result["port"].as<uint16_t>();
    if (result.count("seed"))    cfg.seed_file = result["seed"].as<std::string>();
    if (result.count("verbose")) cfg.log_level = "debug";
    if (result.count("format")) {
        auto fmt = parkwatch::parse_format(result["format"].as<std::string>());
        if (!fmt) {
            console->error("Invalid format: {}", result["format"].as<std::string>());
            return 1;
        }
        cfg.format = *fmt;
    }

    // Set log level
    if (cfg.log_level == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (cfg.log_level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (cfg.log_level == "error") spdlog::set_level(spdlog::level::err);
    else                               spdlog::set_level(spdlog::level::info);

    // Files carry their own format unless -f says otherwise
    auto file_format = [&](const std::string& path) {
        if (result.count("format")) return cfg.format;
        return parkwatch::format_for_path(path).value_or(cfg.format);
    };

    if (result.count("inspect")) {
        try {
            const auto path = result["inspect"].as<std::string>();
            parkwatch::inspect_payload(path, file_format(path), cfg.engine, console);
            return 0;
        } catch (const std::exception& e) {
            console->error("Inspect failed: {}", e.what());
            return 1;
        }
    }

    // Resolve effective worker thread count for logging
    unsigned int effective_workers = cfg.worker_threads > 0
        ? cfg.worker_threads
        : std::thread::hardware_concurrency();
    if (effective_workers == 0) effective_workers = 1;

    const auto& region = cfg.engine.region;
    console->info("parkwatch starting");
    console->info("  server: {}:{}", cfg.nats_address, cfg.nats_port);
    console->info("  ingest: {} (format={})", cfg.ingest_subject, parkwatch::to_string(cfg.format));
    console->info("  requests: {}.<status|overview|streets|nearby|heatmap>", cfg.request_prefix);
    console->info("  region: [{}, {}] - [{}, {}]", region.south, region.west, region.north, region.east);
    console->info("  index cell: {} m, heatmap cell: {} m", cfg.engine.index_cell_meters,
                  cfg.engine.heatmap_cell_meters);
    console->info("  worker threads: {}", effective_workers);

    std::unique_ptr<parkwatch::parking_engine> engine;
    try {
        engine = std::make_unique<parkwatch::parking_engine>(cfg.engine, console);
    } catch (const std::exception& e) {
        console->error("Failed to initialise engine: {}", e.what());
        return 1;
    }

    // Seed snapshot; a bad seed leaves the empty snapshot serving
    if (!cfg.seed_file.empty()) {
        try {
            auto payload = parkwatch::read_payload_file(cfg.seed_file);
            const auto seed_format = file_format(cfg.seed_file);
            auto seeded = engine->trigger_refresh(seed_format, payload);
            console->info("Seeded snapshot {} from '{}' ({})", seeded.version, cfg.seed_file,
                          parkwatch::to_string(seed_format));
        } catch (const std::exception& e) {
            console->error("Failed to load seed file '{}': {}", cfg.seed_file, e.what());
        }
    }

    // Single-threaded io_context (NATS I/O + reply coroutines)
    asio::io_context ioc(1);

    // Graceful shutdown
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        ioc.stop();
    });

    auto service = std::make_shared<parkwatch::parking_service>(ioc, cfg, *engine, console);

    // Build NATS connect config
    nats_asio::connect_config nats_cfg;
    nats_cfg.address = cfg.nats_address;
    nats_cfg.port = cfg.nats_port;

    // SSL config
    std::optional<nats_asio::ssl_config> ssl_conf;
    if (!cfg.tls_cert.empty()) {
        nats_asio::ssl_config sc;
        sc.cert = cfg.tls_cert;
        sc.key  = cfg.tls_key;
        sc.ca   = cfg.tls_ca;
        sc.verify = true;
        ssl_conf = sc;
    }

    // Callbacks
    auto on_connected = [console](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        console->info("Connected to NATS");
        co_return;
    };

    auto on_disconnected = [console](nats_asio::iconnection& /*c*/) -> asio::awaitable<void> {
        console->warn("Disconnected from NATS");
        co_return;
    };

    auto on_error = [console](nats_asio::iconnection& /*c*/, std::string_view err) -> asio::awaitable<void> {
        console->error("NATS connection error: {}", err);
        co_return;
    };

    auto conn = nats_asio::create_connection(
        ioc, on_connected, on_disconnected, on_error, ssl_conf);

    conn->start(nats_cfg);

    // Start the service once connected
    asio::co_spawn(ioc,
        [service, c = conn]() mutable -> asio::awaitable<void> {
            asio::steady_timer timer(co_await asio::this_coro::executor);
            while (!c->is_connected()) {
                timer.expires_after(std::chrono::milliseconds(100));
                co_await timer.async_wait(asio::use_awaitable);
            }
            co_await service->start(c);
        },
        asio::detached
    );

    // Run the event loop (single thread)
    ioc.run();

    // Shutdown ordering:
    // 1. Stop worker threads and the refresh builder (drain queue + join)
    service->stop_workers();

    // 2. Flush any remaining co_spawn'd reply coroutines
    ioc.restart();
    ioc.run();

    console->info("parkwatch stopped");
    return 0;
}
