#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <string>
#include <vector>

#include <lapseg/opponents.hpp>

using Catch::Approx;
using namespace lapseg;

static TelemetrySample remote(const std::string& name, int lap, double dist, double last_lap = 0.0) {
  TelemetrySample s;
  s.driver_name = name;
  s.control = ControlType::Remote;
  s.lap = lap;
  s.lap_distance_m = dist;
  s.speed_kmh = 180.0;
  s.last_lap_time_s = last_lap;
  return s;
}

// Drives one opponent through laps 1..times.size()+1; the frame that starts
// lap n+1 reports times[n-1] as its last lap.
static std::vector<OpponentLap> drive(OpponentTracker& tr, const std::string& name,
                                      const std::vector<double>& times) {
  std::vector<OpponentLap> out;
  double t = 0.0;
  for (int lap = 1; lap <= static_cast<int>(times.size()) + 1; ++lap) {
    const double last = lap > 1 ? times[lap - 2] : 0.0;
    for (double d : {5.0, 1500.0, 3000.0}) {
      auto laps = tr.update_opponent(remote(name, lap, d, last), t);
      out.insert(out.end(), laps.begin(), laps.end());
      t += 1.0;
    }
  }
  return out;
}

TEST_CASE("OpponentTracker: only new personal bests are emitted") {
  OpponentTracker tr;
  auto laps = drive(tr, "Rival", {95.2, 101.0, 88.4, 140.0, 80.0});
  REQUIRE(laps.size() == 3);
  REQUIRE(laps[0].lap_time_s == Approx(95.2));
  REQUIRE(laps[0].lap == 1);
  REQUIRE(laps[1].lap_time_s == Approx(88.4));
  REQUIRE(laps[1].lap == 3);
  REQUIRE(laps[2].lap_time_s == Approx(80.0));
  REQUIRE(laps[2].lap == 5);
  for (const auto& l : laps) {
    REQUIRE(l.is_fastest);
    REQUIRE(l.driver_name == "Rival");
    REQUIRE(l.samples.size() == 3);
  }

  auto st = tr.opponent_status("Rival");
  REQUIRE(st.has_value());
  REQUIRE(st->fastest_lap_time_s == Approx(80.0));
  REQUIRE(st->current_lap == 6);
}

TEST_CASE("OpponentTracker: lap without a valid time is discarded") {
  OpponentTracker tr;
  auto laps = drive(tr, "Outlap", {0.0, 92.0});
  REQUIRE(laps.size() == 1);
  REQUIRE(laps[0].lap == 2);
  REQUIRE(laps[0].lap_time_s == Approx(92.0));
  REQUIRE(laps[0].samples.size() == 3);
}

TEST_CASE("OpponentTracker: discarded out-lap leaves only the new lap's frames") {
  OpponentTracker tr;
  tr.update_opponent(remote("Outlap", 1, 5.0), 0.0);
  tr.update_opponent(remote("Outlap", 1, 1500.0), 1.0);
  tr.update_opponent(remote("Outlap", 1, 3000.0), 2.0);
  REQUIRE(tr.opponent_status("Outlap")->samples.size() == 3);

  auto laps = tr.update_opponent(remote("Outlap", 2, 4.0, 0.0), 3.0);
  REQUIRE(laps.empty());
  auto st = tr.opponent_status("Outlap");
  REQUIRE(st.has_value());
  REQUIRE(st->current_lap == 2);
  REQUIRE(st->samples.size() == 1);
  REQUIRE(st->lap_start_ts == 3.0);
  REQUIRE(st->fastest_lap_time_s == std::numeric_limits<double>::infinity());
}

TEST_CASE("OpponentTracker: emitted lap carries sorted samples and closing-frame metadata") {
  OpponentTracker tr;
  tr.set_track_length(3000.0);
  tr.update_opponent(remote("Meta", 1, 2000.0), 0.0);
  tr.update_opponent(remote("Meta", 1, 400.0), 1.0);

  TelemetrySample closing = remote("Meta", 2, 3.0, 101.5);
  closing.position = 4;
  closing.vehicle.car_class = std::string("Hypercar");
  closing.vehicle.team_name = std::string("Team Blue");
  auto laps = tr.update_opponent(closing, 2.0);

  REQUIRE(laps.size() == 1);
  const OpponentLap& l = laps[0];
  REQUIRE(l.position == 4);
  REQUIRE(l.vehicle.car_class == std::string("Hypercar"));
  REQUIRE(l.vehicle.team_name == std::string("Team Blue"));
  REQUIRE(l.samples.size() == 2);
  REQUIRE(l.samples[0].lap_distance_m == Approx(400.0));
  REQUIRE(l.samples[1].lap_distance_m == Approx(2000.0));
  // No split data: equal thirds over the known length.
  REQUIRE(l.sectors.count == 3);
  REQUIRE(l.sectors.boundaries_m.size() == 3);
  REQUIRE(l.sectors.boundaries_m.back() == Approx(3000.0));
}

TEST_CASE("OpponentTracker: control filtering") {
  SECTION("defaults track remote entries only") {
    OpponentTracker tr;
    REQUIRE(tr.should_track(ControlType::Remote));
    REQUIRE_FALSE(tr.should_track(ControlType::AI));
    REQUIRE_FALSE(tr.should_track(ControlType::LocalPlayer));
    REQUIRE_FALSE(tr.should_track(ControlType::Replay));
    REQUIRE_FALSE(tr.should_track(ControlType::Nobody));
  }
  SECTION("AI opt-in") {
    OpponentTracker tr(OpponentParams{true, true});
    REQUIRE(tr.should_track(ControlType::AI));
    REQUIRE_FALSE(tr.should_track(ControlType::LocalPlayer));
  }
  SECTION("remote-only off admits AI") {
    OpponentTracker tr(OpponentParams{false, false});
    REQUIRE(tr.should_track(ControlType::AI));
  }
  SECTION("filtered frames create no state") {
    OpponentTracker tr;
    TelemetrySample ai = remote("Bot", 1, 10.0);
    ai.control = ControlType::AI;
    REQUIRE(tr.update_opponent(ai, 0.0).empty());
    TelemetrySample anon = remote("", 1, 10.0);
    REQUIRE(tr.update_opponent(anon, 0.0).empty());
    REQUIRE(tr.opponent_count() == 0);
  }
}

TEST_CASE("OpponentTracker: drivers are independent; reset forgets them") {
  OpponentTracker tr;
  tr.update_opponent(remote("A", 1, 10.0), 0.0);
  tr.update_opponent(remote("B", 3, 10.0), 0.0);
  REQUIRE(tr.opponent_count() == 2);

  auto a = tr.update_opponent(remote("A", 2, 5.0, 90.0), 1.0);
  REQUIRE(a.size() == 1);
  REQUIRE(a[0].driver_name == "A");
  REQUIRE(tr.opponent_status("B")->current_lap == 3);
  REQUIRE_FALSE(tr.opponent_status("C").has_value());

  tr.reset();
  REQUIRE(tr.opponent_count() == 0);
  REQUIRE_FALSE(tr.opponent_status("A").has_value());
}
