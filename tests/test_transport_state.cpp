/*
 * File: tests/test_transport_state.cpp
 * Project: Drum HUD Transport Hub
 * Purpose: Transport record clamping, field coercion and snapshot JSON
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include "common/transport.hpp"

using nlohmann::json;


TEST_CASE("clamp lifts position and meter to one"){
TransportState s; s.bar = 0; s.beat = -4; s.ts_num = 0; s.ts_den = -1;
s.clamp();
REQUIRE(s.bar == 1); REQUIRE(s.beat == 1); REQUIRE(s.ts_num == 1); REQUIRE(s.ts_den == 1);
}

TEST_CASE("clamp resets non-positive tempo to 120"){
for (double bad : {0.0, -30.0, std::nan("")}) {
    TransportState s; s.bpm = bad; s.clamp();
    REQUIRE(s.bpm == 120.0);
}
TransportState s; s.bpm = 87.5; s.clamp();
REQUIRE(s.bpm == 87.5);
}

TEST_CASE("clamp keeps ppq non-negative"){
TransportState s; s.ppq = -12.0; s.clamp(); REQUIRE(s.ppq == 0.0);
s.ppq = 1920.5; s.clamp(); REQUIRE(s.ppq == 1920.5);
}

TEST_CASE("only recognised fields are written"){
TransportState s;
auto n = apply_transport_fields(s, json{{"bar", 5}, {"playing", true}, {"color", "red"}, {"t_host", 99.0}});
REQUIRE(n == 2);
REQUIRE(s.bar == 5); REQUIRE(s.playing);
REQUIRE(s.beat == 1); REQUIRE(s.bpm == 120.0); REQUIRE(s.t_host == 0.0);
}

TEST_CASE("non-object updates change nothing"){
TransportState s;
REQUIRE(apply_transport_fields(s, json::array({1, 2})) == 0);
REQUIRE(apply_transport_fields(s, json("bar=5")) == 0);
REQUIRE(s.bar == 1);
}

TEST_CASE("loosely typed values are coerced"){
TransportState s;
apply_transport_fields(s, json{{"bar", "7"}, {"beat", 2.9}, {"bpm", "98.5"}, {"playing", "TRUE"}, {"ts_num", nullptr}});
REQUIRE(s.bar == 7);
REQUIRE(s.beat == 2);
REQUIRE(s.bpm == 98.5);
REQUIRE(s.playing);
REQUIRE(s.ts_num == 0); // lifted to 1 by the next clamp
s.clamp();
REQUIRE(s.ts_num == 1);

apply_transport_fields(s, json{{"bar", "seven"}, {"playing", 0}, {"bpm", 1e300}});
REQUIRE(s.bar == 0);
REQUIRE_FALSE(s.playing);
REQUIRE(s.bpm == 1e300);
}

TEST_CASE("huge positions saturate instead of overflowing"){
TransportState s;
apply_transport_fields(s, json{{"bar", 1e12}, {"beat", -1e12}});
REQUIRE(s.bar == std::numeric_limits<int>::max());
s.clamp();
REQUIRE(s.beat == 1);
}

TEST_CASE("snapshot json carries every field"){
Snapshot snap; snap.transport.bar = 3; snap.transport.t_host = 1700000000.25; snap.active_project_id = "waltz";
auto j = snapshot_to_json(snap);
for (const char *k : {"playing", "bar", "beat", "bpm", "ppq", "ts_num", "ts_den", "t_host", "activeProjectId"})
    REQUIRE(j.contains(k));
REQUIRE(j.size() == 9);
REQUIRE(j["bar"] == 3);
REQUIRE(j["activeProjectId"] == "waltz");
REQUIRE(*serialize_snapshot(snap) == j.dump());
}
