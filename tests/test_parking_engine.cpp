#include "json_codec.hpp"
#include "parking_engine.hpp"
#include "request_handler.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

parkwatch::engine_options make_options() {
    parkwatch::engine_options opts;
    opts.region = {-37.85, 144.90, -37.78, 145.00};
    opts.street_list_limit = 2;
    return opts;
}

parkwatch::raw_record make_record(const std::string& id, double lat, double lng,
                                  const std::string& status, const std::string& street) {
    parkwatch::raw_record rec;
    rec.id = id;
    rec.latitude = lat;
    rec.longitude = lng;
    rec.status = status;
    rec.street = street;
    rec.zone = "7412";
    rec.last_updated = parkwatch::from_epoch_seconds(1709285291);
    return rec;
}

nlohmann::json reply(const parkwatch::parking_engine& engine, parkwatch::request_kind kind,
                     const std::string& body) {
    return nlohmann::json::parse(parkwatch::handle_request(engine, kind, body, make_log()));
}

} // namespace

class parking_engine_test : public ::testing::Test {
protected:
    parking_engine_test() : engine(make_options(), make_log()) {
        parkwatch::raw_batch batch;
        batch.streets = {"Swanston St"};
        batch.captured_at = parkwatch::from_epoch_seconds(1709285400);
        batch.records.push_back(make_record("100", -37.8136, 144.9631, "Unoccupied", "Collins St"));
        batch.records.push_back(make_record("101", -37.8140, 144.9635, "Present", "Collins St"));
        batch.records.push_back(make_record("102", -37.8145, 144.9640, "Present", "Collins St"));
        batch.records.push_back(make_record("200", -37.8100, 144.9700, "Unoccupied", "Bourke St"));
        batch.records.push_back(make_record("300", -37.8300, 144.9300, "Out of Service", "Flinders Ln"));
        engine.trigger_refresh(std::move(batch));
    }

    parkwatch::parking_engine engine;
};

TEST_F(parking_engine_test, current_status_returns_every_bay) {
    auto resp = engine.get_current_status();
    ASSERT_EQ(resp.status, parkwatch::query_status::ok);
    ASSERT_EQ(resp.bays.size(), 5u);
    EXPECT_EQ(resp.source->version, 1u);

    parkwatch::status_query limited;
    limited.limit = 2;
    EXPECT_EQ(engine.get_current_status(limited).bays.size(), 2u);
}

TEST_F(parking_engine_test, current_status_filters_by_bounds) {
    parkwatch::status_query q;
    // Corners given north-east first are normalized
    q.bounds = parkwatch::bounding_box{-37.8130, 144.9650, -37.8150, 144.9620};

    auto resp = engine.get_current_status(q);
    ASSERT_EQ(resp.status, parkwatch::query_status::ok);
    ASSERT_EQ(resp.bays.size(), 3u);
    EXPECT_EQ(resp.bays[0]->id, "100");
    EXPECT_EQ(resp.bays[1]->id, "101");
    EXPECT_EQ(resp.bays[2]->id, "102");
}

TEST_F(parking_engine_test, overview_reflects_snapshot) {
    auto ov = engine.get_overview_stats();
    EXPECT_EQ(ov.total, 5u);
    EXPECT_EQ(ov.available, 2u);
    EXPECT_EQ(ov.occupied, 2u);
    EXPECT_EQ(ov.unknown, 1u);
    EXPECT_DOUBLE_EQ(ov.availability_ratio, 0.4);
    EXPECT_EQ(parkwatch::to_epoch_seconds(ov.captured_at), 1709285400);
}

TEST_F(parking_engine_test, streets_list_uses_configured_limit) {
    auto resp = engine.get_streets_list();
    ASSERT_EQ(resp.streets.size(), 2u);
    EXPECT_EQ(resp.streets[0].street, "Collins St");
    EXPECT_EQ(resp.streets[0].total, 3u);

    auto all = engine.get_streets_list(0);
    ASSERT_EQ(all.streets.size(), 4u);
    EXPECT_EQ(all.streets.back().street, "Swanston St");
    EXPECT_EQ(all.streets.back().total, 0u);
}

TEST_F(parking_engine_test, failed_refresh_keeps_serving_prior_snapshot) {
    std::string bad = "{\"records\": 5}";
    EXPECT_THROW(engine.trigger_refresh(parkwatch::payload_format::json,
                                        std::span<const char>(bad.data(), bad.size())),
                 parkwatch::ingest_error);

    EXPECT_EQ(engine.current()->version, 1u);
    EXPECT_EQ(engine.get_current_status().bays.size(), 5u);
}

TEST_F(parking_engine_test, status_request_round_trip) {
    auto body = reply(engine, parkwatch::request_kind::status, R"({"bounds": "-37.8130,144.9650,-37.8150,144.9620"})");
    ASSERT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["count"], 3);
    EXPECT_EQ(body["version"], 1);

    const auto& first = body["data"][0];
    EXPECT_EQ(first["kerbside_id"], "100");
    EXPECT_EQ(first["status"], "available");
    EXPECT_EQ(first["road_segment"], "Collins St");
    EXPECT_EQ(first["zone_number"], "7412");
    EXPECT_EQ(first["last_updated"], 1709285291);

    auto all = reply(engine, parkwatch::request_kind::status, "");
    EXPECT_EQ(all["count"], 5);

    auto array_bounds = reply(engine, parkwatch::request_kind::status,
                              R"({"bounds": [-37.8130, 144.9650, -37.8150, 144.9620], "limit": 1})");
    EXPECT_EQ(array_bounds["count"], 1);
}

TEST_F(parking_engine_test, overview_and_streets_requests) {
    auto ov = reply(engine, parkwatch::request_kind::overview, "");
    EXPECT_EQ(ov["total_bays"], 5);
    EXPECT_EQ(ov["available_bays"], 2);
    EXPECT_EQ(ov["unknown_bays"], 1);

    auto streets = reply(engine, parkwatch::request_kind::streets, R"({"limit": 0})");
    ASSERT_TRUE(streets["success"].get<bool>());
    ASSERT_EQ(streets["data"].size(), 4u);
    EXPECT_EQ(streets["data"][0]["street_name"], "Collins St");
    EXPECT_EQ(streets["data"][0]["total_bays"], 3);
    EXPECT_EQ(streets["data"][3]["street_name"], "Swanston St");
    EXPECT_EQ(streets["data"][3]["availability_ratio"], 0.0);
}

TEST_F(parking_engine_test, nearby_request) {
    auto body = reply(engine, parkwatch::request_kind::nearby,
                      R"({"lat": -37.8136, "lng": 144.9631, "radius": 150})");
    ASSERT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["search_radius"], 150.0);
    EXPECT_FALSE(body["truncated"].get<bool>());
    ASSERT_EQ(body["data"].size(), 3u);
    EXPECT_EQ(body["data"][0]["kerbside_id"], "100");
    EXPECT_EQ(body["data"][0]["distance"], 0.0);

    // String coordinates and the "lon" spelling are accepted
    auto lon = reply(engine, parkwatch::request_kind::nearby,
                     R"({"lat": "-37.8136", "lon": "144.9631", "radius": 150, "available_only": true})");
    ASSERT_EQ(lon["data"].size(), 1u);
    EXPECT_EQ(lon["data"][0]["kerbside_id"], "100");
}

TEST_F(parking_engine_test, heatmap_request) {
    auto body = reply(engine, parkwatch::request_kind::heatmap, "");
    ASSERT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["cell_meters"], 200.0);
    EXPECT_FALSE(body["cells"].empty());

    std::size_t bays = 0;
    for (const auto& c : body["cells"]) bays += c["bay_count"].get<std::size_t>();
    EXPECT_EQ(bays, 5u);

    auto too_small = reply(engine, parkwatch::request_kind::heatmap, R"({"cell_meters": 1})");
    EXPECT_FALSE(too_small["success"].get<bool>());
}

TEST_F(parking_engine_test, bad_requests_get_error_replies) {
    auto not_json = reply(engine, parkwatch::request_kind::nearby, "{lat:");
    EXPECT_FALSE(not_json["success"].get<bool>());
    EXPECT_NE(not_json["error"].get<std::string>().find("Bad request"), std::string::npos);

    auto missing = reply(engine, parkwatch::request_kind::nearby, R"({"lat": -37.81})");
    EXPECT_FALSE(missing["success"].get<bool>());

    auto wrong_type = reply(engine, parkwatch::request_kind::nearby,
                            R"({"lat": -37.81, "lng": 144.96, "radius": "far"})");
    EXPECT_FALSE(wrong_type["success"].get<bool>());

    auto too_far = reply(engine, parkwatch::request_kind::nearby,
                         R"({"lat": -37.81, "lng": 144.96, "radius": 100000})");
    EXPECT_FALSE(too_far["success"].get<bool>());

    auto bad_bounds = reply(engine, parkwatch::request_kind::status, R"({"bounds": "1,2,3"})");
    EXPECT_FALSE(bad_bounds["success"].get<bool>());

    auto negative_limit = reply(engine, parkwatch::request_kind::streets, R"({"limit": -1})");
    EXPECT_FALSE(negative_limit["success"].get<bool>());

    auto array_body = reply(engine, parkwatch::request_kind::streets, "[]");
    EXPECT_FALSE(array_body["success"].get<bool>());
}

TEST(request_replies, invalid_utf8_from_binary_feed_is_replaced) {
    parkwatch::parking_engine engine(make_options(), make_log());

    // Latin-1 street name; msgpack strings are not UTF-8 checked on decode
    nlohmann::json feed = nlohmann::json::array({
        {
            {"kerbside_id", "500"},
            {"latitude", -37.8136},
            {"longitude", 144.9631},
            {"status_description", "Unoccupied"},
            {"road_segment_description", std::string("Caf\xE9 St")}
        }
    });
    auto packed = nlohmann::json::to_msgpack(feed);
    std::vector<char> bytes(packed.begin(), packed.end());
    ASSERT_EQ(engine.trigger_refresh(parkwatch::payload_format::msgpack, bytes).bays, 1u);

    auto status = reply(engine, parkwatch::request_kind::status, "");
    ASSERT_TRUE(status["success"].get<bool>());
    EXPECT_EQ(status["data"][0]["road_segment"], "Caf\xEF\xBF\xBD St");

    auto streets = reply(engine, parkwatch::request_kind::streets, "");
    ASSERT_TRUE(streets["success"].get<bool>());
    EXPECT_EQ(streets["data"][0]["street_name"], "Caf\xEF\xBF\xBD St");

    auto nearby = reply(engine, parkwatch::request_kind::nearby,
                        R"({"lat": -37.8136, "lng": 144.9631})");
    ASSERT_TRUE(nearby["success"].get<bool>());
    EXPECT_EQ(nearby["data"].size(), 1u);
}

TEST(request_subjects, build_and_parse) {
    EXPECT_EQ(parkwatch::request_subject("parking", parkwatch::request_kind::nearby), "parking.nearby");

    EXPECT_EQ(parkwatch::parse_request_subject("parking.status", "parking"), parkwatch::request_kind::status);
    EXPECT_EQ(parkwatch::parse_request_subject("melb.parking.heatmap", "melb.parking"),
              parkwatch::request_kind::heatmap);
    EXPECT_FALSE(parkwatch::parse_request_subject("parking.unknown", "parking").has_value());
    EXPECT_FALSE(parkwatch::parse_request_subject("parking", "parking").has_value());
    EXPECT_FALSE(parkwatch::parse_request_subject("parkingXstatus", "parking").has_value());
    EXPECT_FALSE(parkwatch::parse_request_subject("other.status", "parking").has_value());
}

TEST(json_codec, parse_bounds) {
    auto b = parkwatch::parse_bounds("-37.82,144.95,-37.80,144.97");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, (parkwatch::bounding_box{-37.82, 144.95, -37.80, 144.97}));

    auto swapped = parkwatch::parse_bounds("-37.80,144.97,-37.82,144.95");
    ASSERT_TRUE(swapped.has_value());
    EXPECT_EQ(*swapped, *b);

    EXPECT_FALSE(parkwatch::parse_bounds("").has_value());
    EXPECT_FALSE(parkwatch::parse_bounds("1,2,3").has_value());
    EXPECT_FALSE(parkwatch::parse_bounds("1,2,3,4,5").has_value());
    EXPECT_FALSE(parkwatch::parse_bounds("a,b,c,d").has_value());
}

TEST(json_codec, nearby_request_defaults) {
    auto req = parkwatch::parse_nearby_request(R"({"lat": -37.81, "lng": 144.96})");
    EXPECT_DOUBLE_EQ(req.lat, -37.81);
    EXPECT_DOUBLE_EQ(req.lng, 144.96);
    EXPECT_FALSE(req.radius_m.has_value());
    EXPECT_FALSE(req.available_only);
    EXPECT_EQ(req.limit, 0u);

    EXPECT_THROW(parkwatch::parse_nearby_request(""), parkwatch::invalid_query);
    EXPECT_THROW(parkwatch::parse_nearby_request(R"({"lat": 1, "lng": 2, "available_only": "yes"})"),
                 parkwatch::invalid_query);
}

TEST(json_codec, empty_bodies_mean_defaults) {
    EXPECT_FALSE(parkwatch::parse_streets_request("").has_value());
    EXPECT_FALSE(parkwatch::parse_heatmap_request("").has_value());
    EXPECT_FALSE(parkwatch::parse_status_request("").bounds.has_value());
    EXPECT_EQ(parkwatch::parse_heatmap_request(R"({"cell_meters": 50})"), 50.0);
}
