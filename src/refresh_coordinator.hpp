#pragma once

#include "bay_store.hpp"
#include "config.hpp"
#include "raw_record.hpp"
#include "snapshot.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

namespace parkwatch {

struct refresh_result {
    std::uint64_t version = 0;
    std::size_t bays = 0;
    ingest_report report;
};

// Owns the published snapshot. Uses RCU-style snapshot swapping: readers
// get a lock-free shared_ptr<const snapshot>, builds serialize on a mutex and
// publish the finished snapshot with one atomic store.
//
// Refreshes arrive either synchronously through refresh(), or through
// submit(), which queues raw payloads for a single builder thread. The
// builder drains everything queued and builds only the newest payload, so a
// burst of refreshes costs one build. If that payload is rejected, the next
// newest payload of the same burst is tried.
class refresh_coordinator {
public:
    struct stats {
        uint64_t submitted = 0;
        uint64_t coalesced = 0;
        uint64_t succeeded = 0;
        uint64_t failed = 0;
        std::size_t queue_depth = 0;
    };

    refresh_coordinator(const engine_options& options,
                        std::shared_ptr<spdlog::logger> log);
    ~refresh_coordinator();

    refresh_coordinator(const refresh_coordinator&) = delete;
    refresh_coordinator& operator=(const refresh_coordinator&) = delete;

    // Build and publish a snapshot from a decoded batch.
    // Throws ingest_error; the published snapshot is then left untouched.
    refresh_result refresh(raw_batch batch);

    // Decode then refresh. Throws ingest_error on undecodable payloads.
    refresh_result refresh(payload_format format, std::span<const char> payload);

    // Spawn the builder thread. Payloads submitted earlier wait in the queue.
    void start();

    // Signal the builder to stop and join it. Queued payloads are discarded.
    void stop();

    // Queue a raw payload for the builder thread (move semantics).
    void submit(payload_format format, std::vector<char> payload);

    // Current published snapshot. Never null.
    snapshot_ptr current() const;

    std::uint64_t version() const;

    stats get_stats() const;

private:
    struct pending_refresh {
        payload_format format = payload_format::msgpack;
        std::vector<char> payload;  // empty = poison pill
    };

    std::shared_ptr<snapshot> build(raw_batch batch, ingest_report& report) const;
    void publish(std::shared_ptr<const snapshot> snap);
    void builder_loop();

    engine_options m_options;
    std::shared_ptr<spdlog::logger> m_log;

    // Serializes builds and version assignment.
    std::mutex m_build_mutex;
    std::uint64_t m_next_version = 1;

    // Current snapshot, atomic load/store for lock-free reader access.
    std::shared_ptr<const snapshot> m_snapshot;

    moodycamel::BlockingConcurrentQueue<pending_refresh> m_queue;
    std::thread m_builder;
    std::atomic<bool> m_running{false};

    std::atomic<uint64_t> m_submitted{0};
    std::atomic<uint64_t> m_coalesced{0};
    std::atomic<uint64_t> m_succeeded{0};
    std::atomic<uint64_t> m_failed{0};
};

} // namespace parkwatch
