#pragma once

#include "config.hpp"
#include "parking_engine.hpp"
#include "request_handler.hpp"
#include "worker_pool.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <string>

namespace parkwatch {

// NATS shell around the engine: snapshots arrive on the ingest subject,
// queries arrive as request/reply on <request_prefix>.<kind>.
class parking_service {
public:
    parking_service(asio::io_context& ioc, const config& cfg,
                    parking_engine& engine,
                    std::shared_ptr<spdlog::logger> log);

    // Called once the NATS connection is established.
    // Sets up subscriptions (ingest + queries) and starts the workers.
    asio::awaitable<void> start(nats_asio::iconnection_sptr conn);

    // Stop the worker pool and the refresh builder. Called during shutdown
    // before ioc cleanup.
    void stop_workers();

private:
    // Callback: raw snapshot payload on the ingest subject
    asio::awaitable<void> on_ingest_message(
        std::string_view subject,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    // Callback: query request (request/reply pattern)
    asio::awaitable<void> on_query_request(
        request_kind kind,
        std::optional<std::string_view> reply_to,
        std::span<const char> payload);

    // Periodic stats logging
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    parking_engine& m_engine;
    std::shared_ptr<spdlog::logger> m_log;

    nats_asio::iconnection_sptr m_conn;
    std::unique_ptr<worker_pool> m_worker_pool;

    std::atomic<uint64_t> m_ingest_received{0};
    std::atomic<uint64_t> m_queries_received{0};
};

} // namespace parkwatch
