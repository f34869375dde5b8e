#include "service.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>
#include <array>

namespace parkwatch {

parking_service::parking_service(asio::io_context& ioc, const config& cfg,
                                 parking_engine& engine,
                                 std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_cfg(cfg), m_engine(engine), m_log(std::move(log))
{}

asio::awaitable<void> parking_service::start(nats_asio::iconnection_sptr conn) {
    m_conn = std::move(conn);

    // Workers must exist before the first query can arrive
    m_worker_pool = std::make_unique<worker_pool>(
        m_ioc, m_cfg.worker_threads, m_engine, m_conn, m_log);
    m_worker_pool->start();
    m_engine.coordinator().start();

    // Subscribe to the ingest subject
    nats_asio::subscribe_options ingest_opts;
    if (!m_cfg.ingest_queue_group.empty()) {
        ingest_opts.queue_group = m_cfg.ingest_queue_group;
    }

    auto [ingest_sub, ingest_status] = co_await m_conn->subscribe(
        m_cfg.ingest_subject,
        [this](auto subject, auto reply_to, auto payload) {
            return on_ingest_message(subject, reply_to, payload);
        },
        ingest_opts
    );

    if (ingest_status.failed()) {
        m_log->error("Failed to subscribe to ingest subject '{}': {}",
                    m_cfg.ingest_subject, ingest_status.error());
        m_ioc.stop();
        co_return;
    }
    m_log->info("Subscribed to ingest subject '{}'", m_cfg.ingest_subject);

    // One request/reply subject per query kind
    constexpr std::array kinds = {
        request_kind::status, request_kind::overview, request_kind::streets,
        request_kind::nearby, request_kind::heatmap
    };

    for (auto kind : kinds) {
        auto subject = request_subject(m_cfg.request_prefix, kind);
        auto [sub, status] = co_await m_conn->subscribe(
            subject,
            [this, kind](auto /*subject*/, auto reply_to, auto payload) {
                return on_query_request(kind, reply_to, payload);
            }
        );

        if (status.failed()) {
            m_log->error("Failed to subscribe to request subject '{}': {}", subject, status.error());
            m_ioc.stop();
            co_return;
        }
        m_log->info("Listening for {} requests on '{}'", to_string(kind), subject);
    }

    // Start stats reporting
    asio::co_spawn(m_ioc, stats_loop(), asio::detached);

    m_log->info("Parking service started (format={}, region=[{}, {}, {}, {}], snapshot={})",
               to_string(m_cfg.format),
               m_cfg.engine.region.south, m_cfg.engine.region.west,
               m_cfg.engine.region.north, m_cfg.engine.region.east,
               m_engine.current()->version);
}

void parking_service::stop_workers() {
    if (m_worker_pool) {
        m_worker_pool->stop();
    }
    m_engine.coordinator().stop();
}

asio::awaitable<void> parking_service::on_ingest_message(
    std::string_view /*subject*/,
    std::optional<std::string_view> /*reply_to*/,
    std::span<const char> payload)
{
    m_ingest_received++;

    if (payload.empty()) {
        m_log->warn("Empty ingest payload - ignoring");
        co_return;
    }

    // Copy payload and hand it to the refresh builder
    m_engine.submit_refresh(m_cfg.format, std::vector<char>(payload.begin(), payload.end()));
}

asio::awaitable<void> parking_service::on_query_request(
    request_kind kind,
    std::optional<std::string_view> reply_to,
    std::span<const char> payload)
{
    m_queries_received++;

    if (!reply_to) {
        m_log->warn("{} request without reply_to - ignoring", to_string(kind));
        co_return;
    }

    worker_pool::job j;
    j.kind = kind;
    j.reply_to = std::string(*reply_to);
    j.body.assign(payload.begin(), payload.end());
    m_worker_pool->enqueue(std::move(j));
}

asio::awaitable<void> parking_service::stats_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (true) {
        timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        co_await timer.async_wait(asio::use_awaitable);

        auto ws = m_worker_pool ? m_worker_pool->get_stats() : worker_pool::stats{};
        auto rs = m_engine.coordinator().get_stats();
        auto snap = m_engine.current();

        m_log->info("stats: snapshot={} bays={} ingest={} refreshes ok={} failed={} coalesced={} "
                    "queries={} processed={} replied={} reply_failures={} queue_depth={}",
                   snap->version,
                   snap->bays.size(),
                   m_ingest_received.load(),
                   rs.succeeded,
                   rs.failed,
                   rs.coalesced,
                   m_queries_received.load(),
                   ws.processed,
                   ws.replied,
                   ws.reply_failures,
                   ws.queue_depth);
    }
}

} // namespace parkwatch
