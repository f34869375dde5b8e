#pragma once

#include "parking_engine.hpp"
#include "request_handler.hpp"
#include <nats_asio/nats_asio.hpp>
#include <asio/io_context.hpp>
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace parkwatch {

// Runs query requests off the I/O thread. Workers read the engine's
// published snapshot directly and hand replies back to the I/O thread.
class worker_pool {
public:
    struct stats {
        uint64_t processed = 0;
        uint64_t replied = 0;
        uint64_t reply_failures = 0;
        std::size_t queue_depth = 0;
    };

    struct job {
        request_kind kind = request_kind::overview;
        std::string reply_to;
        std::vector<char> body;
        bool poison = false;
    };

    worker_pool(asio::io_context& ioc, unsigned int threads,
                const parking_engine& engine,
                nats_asio::iconnection_sptr conn,
                std::shared_ptr<spdlog::logger> log);
    ~worker_pool();

    // Spawn N worker threads. Must be called once.
    void start();

    // Signal workers to stop, drain the queue, and join threads.
    void stop();

    // Enqueue a request for worker processing (move semantics).
    void enqueue(job j);

    // Approximate queue depth.
    std::size_t queue_depth() const;

    stats get_stats() const;

private:
    void worker_loop(unsigned int worker_id);

    asio::io_context& m_ioc;
    const parking_engine& m_engine;
    nats_asio::iconnection_sptr m_conn;
    std::shared_ptr<spdlog::logger> m_log;

    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    moodycamel::BlockingConcurrentQueue<job> m_queue;
    std::vector<std::thread> m_threads;

    // Aggregate stats (relaxed atomics)
    std::atomic<uint64_t> m_processed{0};
    std::atomic<uint64_t> m_replied{0};
    std::atomic<uint64_t> m_reply_failures{0};
};

} // namespace parkwatch
