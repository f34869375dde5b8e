#include "worker_pool.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <chrono>

namespace parkwatch {

worker_pool::worker_pool(asio::io_context& ioc, unsigned int threads,
                         const parking_engine& engine,
                         nats_asio::iconnection_sptr conn,
                         std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_engine(engine), m_conn(std::move(conn)), m_log(std::move(log)),
      m_thread_count(threads > 0 ? threads : std::thread::hardware_concurrency())
{
    if (m_thread_count == 0) m_thread_count = 1;
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::start() {
    if (m_running.exchange(true)) return; // already started

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&worker_pool::worker_loop, this, i);
    }
    m_log->info("Worker pool started with {} threads", m_thread_count);
}

void worker_pool::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Poison pills, one per thread
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        job pill;
        pill.poison = true;
        m_queue.enqueue(std::move(pill));
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_log->info("Worker pool stopped");
}

void worker_pool::enqueue(job j) {
    m_queue.enqueue(std::move(j));
}

std::size_t worker_pool::queue_depth() const {
    return m_queue.size_approx();
}

worker_pool::stats worker_pool::get_stats() const {
    return {
        m_processed.load(std::memory_order_relaxed),
        m_replied.load(std::memory_order_relaxed),
        m_reply_failures.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

void worker_pool::worker_loop(unsigned int worker_id) {
    m_log->debug("Worker {} started", worker_id);

    job j;
    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running for graceful shutdown
        bool got = m_queue.wait_dequeue_timed(j, std::chrono::milliseconds(100));
        if (!got) continue;
        if (j.poison) break;

        std::string reply = handle_request(
            m_engine, j.kind, std::string_view(j.body.data(), j.body.size()), m_log);
        m_processed.fetch_add(1, std::memory_order_relaxed);

        // Post the reply to the ASIO I/O thread
        asio::co_spawn(m_ioc,
            [reply = std::move(reply),
             subject = std::move(j.reply_to),
             conn = m_conn,
             log = m_log,
             &replied = m_replied,
             &failures = m_reply_failures]() mutable -> asio::awaitable<void> {
                auto s = co_await conn->publish(
                    subject, std::span<const char>(reply.data(), reply.size()), std::nullopt);
                if (s.failed()) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                    log->warn("Failed to reply on '{}': {}", subject, s.error());
                } else {
                    replied.fetch_add(1, std::memory_order_relaxed);
                }
            },
            asio::detached
        );

        j = job{};
    }

    m_log->debug("Worker {} stopped", worker_id);
}

} // namespace parkwatch
