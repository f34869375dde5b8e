#include "refresh_coordinator.hpp"
#include "aggregation.hpp"
#include "record_decoder.hpp"
#include <chrono>

namespace parkwatch {

refresh_coordinator::refresh_coordinator(const engine_options& options,
                                         std::shared_ptr<spdlog::logger> log)
    : m_options(options), m_log(std::move(log))
{
    // Validates the region and cell size up front; throws engine_error.
    spatial_index probe(index_params{m_options.region, m_options.index_cell_meters});

    // Publish an initial empty snapshot so readers never see null.
    auto snap = std::make_shared<snapshot>();
    snap->captured_at = clock_type::now();
    snap->index = std::move(probe);
    snap->index.finalize();
    snap->heatmap = heatmap_params_for(m_options.region, m_options.heatmap_cell_meters);
    snap->aggregates = aggregate(*snap);
    publish(std::move(snap));
}

refresh_coordinator::~refresh_coordinator() {
    stop();
}

std::shared_ptr<snapshot> refresh_coordinator::build(raw_batch batch, ingest_report& report) const {
    auto normalized = normalize_batch(std::move(batch), clock_type::now(), report, m_log);

    auto built = build_index(std::move(normalized.bays),
                             index_params{m_options.region, m_options.index_cell_meters},
                             m_log);
    report.invalid_coordinate += built.rejected.size();
    report.accepted = built.bays.size();

    auto snap = std::make_shared<snapshot>();
    snap->captured_at = normalized.captured_at;
    snap->bays = std::move(built.bays);
    snap->index = std::move(built.index);
    snap->declared_streets = std::move(normalized.streets);
    snap->report = report;

    snap->by_id.reserve(snap->bays.size());
    for (std::uint32_t i = 0; i < snap->bays.size(); ++i) {
        snap->by_id.emplace(snap->bays[i].id, i);
    }

    snap->heatmap = heatmap_params_for(m_options.region, m_options.heatmap_cell_meters);
    snap->heatmap_cells = build_grid(snap->bays, snap->heatmap);
    return snap;
}

void refresh_coordinator::publish(std::shared_ptr<const snapshot> snap) {
    std::atomic_store(&m_snapshot, std::move(snap));
}

refresh_result refresh_coordinator::refresh(raw_batch batch) {
    std::lock_guard<std::mutex> lock(m_build_mutex);

    const auto started = std::chrono::steady_clock::now();
    ingest_report report;
    std::shared_ptr<snapshot> snap;
    try {
        snap = build(std::move(batch), report);
    } catch (const ingest_error&) {
        throw;
    } catch (const std::exception& e) {
        // Anything else escaping the build is bad input as far as the
        // caller is concerned; the old snapshot keeps serving.
        throw ingest_error(std::string("snapshot build failed: ") + e.what());
    }

    // Version is assigned only once the build succeeded, so failed refreshes
    // leave no gaps.
    snap->version = m_next_version++;
    snap->aggregates = aggregate(*snap);

    refresh_result result{snap->version, snap->bays.size(), report};
    publish(std::move(snap));

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    m_log->info("Published snapshot {} ({} bays, {} received, {} dropped) in {} ms",
                result.version, result.bays, report.received, report.dropped(), elapsed.count());
    if (report.dropped() > 0) {
        m_log->warn("Snapshot {} dropped records: malformed={} missing_id={} invalid_coordinate={} duplicate_id={}",
                    result.version, report.malformed, report.missing_id,
                    report.invalid_coordinate, report.duplicate_id);
    }
    return result;
}

refresh_result refresh_coordinator::refresh(payload_format format, std::span<const char> payload) {
    return refresh(decode_payload(format, payload, m_log));
}

void refresh_coordinator::start() {
    if (m_running.exchange(true)) return; // already started
    m_builder = std::thread(&refresh_coordinator::builder_loop, this);
    m_log->debug("Refresh builder started");
}

void refresh_coordinator::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    m_queue.enqueue(pending_refresh{});
    if (m_builder.joinable()) m_builder.join();
    m_log->debug("Refresh builder stopped");
}

void refresh_coordinator::submit(payload_format format, std::vector<char> payload) {
    if (payload.empty()) {
        m_log->warn("Ignoring empty refresh payload");
        return;
    }
    m_submitted.fetch_add(1, std::memory_order_relaxed);
    m_queue.enqueue(pending_refresh{format, std::move(payload)});
}

snapshot_ptr refresh_coordinator::current() const {
    return std::atomic_load(&m_snapshot);
}

std::uint64_t refresh_coordinator::version() const {
    return current()->version;
}

refresh_coordinator::stats refresh_coordinator::get_stats() const {
    return {
        m_submitted.load(std::memory_order_relaxed),
        m_coalesced.load(std::memory_order_relaxed),
        m_succeeded.load(std::memory_order_relaxed),
        m_failed.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

void refresh_coordinator::builder_loop() {
    pending_refresh item;
    std::vector<pending_refresh> burst;

    while (m_running.load(std::memory_order_relaxed)) {
        // Block with timeout to allow checking m_running for graceful shutdown
        if (!m_queue.wait_dequeue_timed(item, std::chrono::milliseconds(100))) continue;
        if (item.payload.empty()) break;

        // Coalesce everything already queued; the newest payload is built first.
        burst.clear();
        burst.push_back(std::move(item));
        bool stopping = false;
        while (m_queue.try_dequeue(item)) {
            if (item.payload.empty()) {
                stopping = true;
                break;
            }
            burst.push_back(std::move(item));
        }
        if (stopping) break;

        // A rejected payload falls back to the next newest one in the burst.
        for (auto it = burst.rbegin(); it != burst.rend(); ++it) {
            try {
                refresh(it->format, it->payload);
                m_succeeded.fetch_add(1, std::memory_order_relaxed);
                m_coalesced.fetch_add(static_cast<uint64_t>(burst.rend() - it - 1),
                                      std::memory_order_relaxed);
                break;
            } catch (const ingest_error& e) {
                m_failed.fetch_add(1, std::memory_order_relaxed);
                m_log->error("Refresh rejected, keeping snapshot {}: {}", version(), e.what());
            }
        }
    }
}

} // namespace parkwatch
