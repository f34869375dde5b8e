#include "refresh_coordinator.hpp"
#include "parking_engine.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <atomic>
#include <chrono>
#include <thread>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

parkwatch::engine_options make_options() {
    parkwatch::engine_options opts;
    opts.region = {-37.85, 144.90, -37.78, 145.00};
    return opts;
}

// n bays laid out along a line, all with the given status
parkwatch::raw_batch make_batch(int n, const std::string& status, const std::string& prefix = "bay-") {
    parkwatch::raw_batch batch;
    for (int i = 0; i < n; ++i) {
        parkwatch::raw_record rec;
        rec.id = prefix + std::to_string(i);
        rec.latitude = -37.8136 + i * 0.0001;
        rec.longitude = 144.9631;
        rec.status = status;
        rec.street = "Collins St";
        batch.records.push_back(rec);
    }
    return batch;
}

std::vector<char> json_payload(int n, const std::string& status) {
    auto records = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        records.push_back({
            {"kerbside_id", "bay-" + std::to_string(i)},
            {"latitude", -37.8136 + i * 0.0001},
            {"longitude", 144.9631},
            {"status_description", status}
        });
    }
    auto text = records.dump();
    return std::vector<char>(text.begin(), text.end());
}

// Poll until pred holds or the timeout expires
template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

TEST(refresh_coordinator, snapshot_empty_on_construction) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());

    auto snap = coord.current();
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap->version, 0u);
    EXPECT_TRUE(snap->bays.empty());
    EXPECT_EQ(snap->index.size(), 0u);
    EXPECT_EQ(snap->aggregates.overview.total, 0u);
    EXPECT_TRUE(snap->heatmap_cells.empty());
}

TEST(refresh_coordinator, invalid_region_throws) {
    auto opts = make_options();
    opts.region = {-37.78, 144.90, -37.85, 145.00};
    EXPECT_THROW({ parkwatch::refresh_coordinator coord(opts, make_log()); }, parkwatch::engine_error);
}

TEST(refresh_coordinator, refresh_publishes_new_version) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());

    auto r1 = coord.refresh(make_batch(10, "Unoccupied"));
    EXPECT_EQ(r1.version, 1u);
    EXPECT_EQ(r1.bays, 10u);
    EXPECT_EQ(r1.report.accepted, 10u);

    auto snap = coord.current();
    EXPECT_EQ(snap->version, 1u);
    EXPECT_EQ(snap->bays.size(), 10u);
    EXPECT_EQ(snap->index.size(), 10u);
    EXPECT_EQ(snap->aggregates.overview.available, 10u);
    EXPECT_EQ(snap->aggregates.overview.version, 1u);
    ASSERT_NE(snap->find("bay-3"), nullptr);
    EXPECT_EQ(snap->find("bay-3")->id, "bay-3");
    EXPECT_EQ(snap->find("missing"), nullptr);

    auto r2 = coord.refresh(make_batch(4, "Present"));
    EXPECT_EQ(r2.version, 2u);
    EXPECT_EQ(coord.version(), 2u);
}

TEST(refresh_coordinator, failed_refresh_keeps_prior_snapshot) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());
    coord.refresh(make_batch(5, "Unoccupied"));
    auto before = coord.current();

    auto garbage = std::string("[{\"kerbside_id\": ");
    std::vector<char> bytes(garbage.begin(), garbage.end());
    EXPECT_THROW(coord.refresh(parkwatch::payload_format::json, bytes), parkwatch::ingest_error);

    auto after = coord.current();
    EXPECT_EQ(after, before);
    EXPECT_EQ(after->version, 1u);

    // The next good refresh continues the version sequence without a gap
    auto r = coord.refresh(make_batch(2, "Present"));
    EXPECT_EQ(r.version, 2u);
}

TEST(refresh_coordinator, old_snapshot_remains_valid_after_new_publish) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());

    coord.refresh(make_batch(3, "Unoccupied", "old-"));
    auto old_snap = coord.current();

    coord.refresh(make_batch(7, "Present", "new-"));
    auto new_snap = coord.current();

    ASSERT_TRUE(old_snap);
    EXPECT_EQ(old_snap->version, 1u);
    EXPECT_EQ(old_snap->bays.size(), 3u);
    EXPECT_NE(old_snap->find("old-0"), nullptr);
    EXPECT_EQ(old_snap->find("new-0"), nullptr);
    EXPECT_EQ(old_snap->aggregates.overview.available, 3u);

    ASSERT_TRUE(new_snap);
    EXPECT_EQ(new_snap->version, 2u);
    EXPECT_EQ(new_snap->bays.size(), 7u);
    EXPECT_EQ(new_snap->find("old-0"), nullptr);
    EXPECT_EQ(new_snap->aggregates.overview.occupied, 7u);
}

TEST(refresh_coordinator, same_input_gives_same_content) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());

    auto batch = make_batch(25, "Unoccupied");
    batch.captured_at = parkwatch::from_epoch_seconds(1700000000);

    coord.refresh(batch);
    auto first = coord.current();
    coord.refresh(batch);
    auto second = coord.current();

    EXPECT_EQ(second->version, first->version + 1);
    EXPECT_EQ(second->captured_at, first->captured_at);
    EXPECT_EQ(second->aggregates.streets, first->aggregates.streets);
    EXPECT_EQ(second->heatmap_cells, first->heatmap_cells);
    ASSERT_EQ(second->bays.size(), first->bays.size());
    for (std::size_t i = 0; i < first->bays.size(); ++i) {
        EXPECT_EQ(second->bays[i].id, first->bays[i].id);
        EXPECT_EQ(second->bays[i].position, first->bays[i].position);
    }
}

TEST(refresh_coordinator, report_counts_out_of_region_bays) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());

    auto batch = make_batch(2, "Present");
    parkwatch::raw_record far_away;
    far_away.id = "sydney";
    far_away.latitude = -33.8688;
    far_away.longitude = 151.2093;
    batch.records.push_back(far_away);

    auto r = coord.refresh(std::move(batch));
    EXPECT_EQ(r.bays, 2u);
    EXPECT_EQ(r.report.received, 3u);
    EXPECT_EQ(r.report.invalid_coordinate, 1u);
    EXPECT_EQ(r.report.accepted, 2u);
    EXPECT_EQ(coord.current()->report.invalid_coordinate, 1u);
}

TEST(refresh_coordinator, submitted_payload_is_built_by_builder) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());
    coord.start();

    coord.submit(parkwatch::payload_format::json, json_payload(6, "Unoccupied"));
    ASSERT_TRUE(wait_for([&] { return coord.get_stats().succeeded == 1u; }));

    auto snap = coord.current();
    EXPECT_EQ(snap->version, 1u);
    EXPECT_EQ(snap->bays.size(), 6u);

    coord.stop();
}

TEST(refresh_coordinator, burst_of_submits_ends_on_newest_payload) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());
    coord.start();

    for (int n = 1; n <= 20; ++n) {
        coord.submit(parkwatch::payload_format::json, json_payload(n, "Present"));
    }
    ASSERT_TRUE(wait_for([&] {
        auto s = coord.get_stats();
        return s.succeeded + s.coalesced + s.failed == 20u;
    }));

    auto stats = coord.get_stats();
    EXPECT_EQ(stats.submitted, 20u);
    EXPECT_EQ(coord.current()->bays.size(), 20u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(coord.version(), stats.succeeded);

    coord.stop();
}

TEST(refresh_coordinator, rejected_submit_keeps_snapshot) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());
    coord.refresh(make_batch(3, "Present"));
    coord.start();

    std::string bad = "not json at all";
    coord.submit(parkwatch::payload_format::json, std::vector<char>(bad.begin(), bad.end()));
    ASSERT_TRUE(wait_for([&] { return coord.get_stats().failed == 1u; }));

    EXPECT_EQ(coord.version(), 1u);
    EXPECT_EQ(coord.current()->bays.size(), 3u);

    coord.stop();
}

TEST(refresh_coordinator, rejected_newest_payload_falls_back_to_older_one) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());

    // Both queued before the builder runs, so they land in one burst
    std::string bad = "[{\"kerbside_id\": ";
    coord.submit(parkwatch::payload_format::json, json_payload(2, "Present"));
    coord.submit(parkwatch::payload_format::json, json_payload(5, "Unoccupied"));
    coord.submit(parkwatch::payload_format::json, std::vector<char>(bad.begin(), bad.end()));
    coord.start();

    ASSERT_TRUE(wait_for([&] {
        auto s = coord.get_stats();
        return s.succeeded + s.coalesced + s.failed == 3u;
    }));

    auto stats = coord.get_stats();
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.succeeded, 1u);
    EXPECT_EQ(stats.coalesced, 1u);
    EXPECT_EQ(coord.version(), 1u);
    EXPECT_EQ(coord.current()->bays.size(), 5u);
    EXPECT_EQ(coord.current()->aggregates.overview.available, 5u);

    coord.stop();
}

TEST(refresh_coordinator, empty_submit_is_ignored) {
    parkwatch::refresh_coordinator coord(make_options(), make_log());
    coord.start();
    coord.submit(parkwatch::payload_format::json, {});
    EXPECT_EQ(coord.get_stats().submitted, 0u);
    coord.stop();
}

// Readers racing refreshes always see one consistent snapshot per call
TEST(refresh_coordinator, concurrent_readers_see_consistent_snapshots) {
    parkwatch::parking_engine engine(make_options(), make_log());
    engine.trigger_refresh(make_batch(50, "Unoccupied"));

    std::atomic<bool> done{false};
    std::atomic<int> inconsistencies{0};
    std::atomic<int> queries{0};

    auto reader = [&] {
        while (!done.load()) {
            auto resp = engine.find_nearby_parking(-37.8136, 144.9631, 2000.0);
            if (resp.status != parkwatch::query_status::ok) {
                inconsistencies.fetch_add(1);
                continue;
            }
            // Every refresh is single-status, so one response must be too
            for (const auto& r : resp.results) {
                if (r.bay_ref->state != resp.results.front().bay_ref->state) {
                    inconsistencies.fetch_add(1);
                    break;
                }
            }
            auto ov = resp.source->aggregates.overview;
            if (ov.total != resp.source->bays.size()) inconsistencies.fetch_add(1);
            queries.fetch_add(1);
        }
    };

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) readers.emplace_back(reader);

    for (int round = 0; round < 50; ++round) {
        engine.trigger_refresh(make_batch(30 + round, round % 2 ? "Unoccupied" : "Present"));
    }

    done.store(true);
    for (auto& t : readers) t.join();

    EXPECT_EQ(inconsistencies.load(), 0);
    EXPECT_GT(queries.load(), 0);
    EXPECT_EQ(engine.current()->version, 51u);
}
