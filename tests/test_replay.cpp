#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>
#include <variant>

#include <lapseg/poller.hpp>
#include <lapseg/replay.hpp>

using Catch::Approx;
using namespace lapseg;

static std::string rec_mixed = R"(# two vehicles, shared memory names
t,lap,lap_distance,lap_time,last_lap_time,speed,control,driver_name
0.00,1,10,0.00,0,150,0,Me
0.00,1,40,0.00,0,160,2,Rival
0.01,1,12,0.01,0,150,0,Me
bad,1,13,0.02,0,150,0,Me
0.02,1,14,0.02,0,150,0,Me
0.02,2,2,0.01,95.5,160,2,Rival
)";

static std::string rec_export = R"(t,Lap [int],LapDistance [m],LapTime [s],Speed [km/h]
0.0,1,0,0.0,100
0.5,1,20,0.5,110
)";

TEST_CASE("replay_frames_from_csv_stream groups rows by timestamp") {
  std::istringstream ss(rec_mixed);
  auto frames = replay_frames_from_csv_stream(ss);
  REQUIRE(frames.size() == 3);

  REQUIRE(frames[0].t == Approx(0.0));
  REQUIRE(frames[0].player.has_value());
  REQUIRE(frames[0].player->lap_distance_m.value() == Approx(10.0));
  REQUIRE(frames[0].opponents.size() == 1);
  REQUIRE(frames[0].opponents[0].driver_name == "Rival");

  REQUIRE(frames[1].opponents.empty());
  REQUIRE(frames[2].player->lap_distance_m.value() == Approx(14.0));
  REQUIRE(frames[2].opponents[0].last_lap_time_s.value() == Approx(95.5));
}

TEST_CASE("replay_frames_from_csv_stream: export headers without control are all player rows") {
  std::istringstream ss(rec_export);
  auto frames = replay_frames_from_csv_stream(ss);
  REQUIRE(frames.size() == 2);
  REQUIRE(frames[1].player.has_value());
  REQUIRE(frames[1].player->lap_distance_m.value() == Approx(20.0));
  REQUIRE(frames[1].player->speed_kmh.value() == Approx(110.0));
}

TEST_CASE("replay_frames_from_csv_stream: header without t is rejected") {
  std::istringstream ss("lap,lap_distance\n1,10\n");
  REQUIRE(replay_frames_from_csv_stream(ss).empty());
}

TEST_CASE("load_replay_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_replay_csv("this_file_does_not_exist.csv").has_value());
}

TEST_CASE("ReplaySource: stepping and pacing") {
  std::istringstream ss(rec_mixed);
  ReplaySource src(replay_frames_from_csv_stream(ss));
  REQUIRE(src.frame_count() == 3);
  REQUIRE(src.is_running());
  REQUIRE_FALSE(src.is_available());

  SECTION("next_frame walks every frame then stops") {
    REQUIRE(src.next_frame());
    REQUIRE(src.is_available());
    REQUIRE(src.read()->driver_name == "Me");
    REQUIRE(src.read_opponents().size() == 1);
    REQUIRE(src.next_frame());
    REQUIRE(src.next_frame());
    REQUIRE(src.frame_time() == Approx(0.02));
    REQUIRE_FALSE(src.next_frame());
    REQUIRE(src.exhausted());
    REQUIRE_FALSE(src.is_running());
    REQUIRE_FALSE(src.read().has_value());
  }
  SECTION("advance_to jumps to the last frame not after the target") {
    REQUIRE(src.advance_to(0.015) == Approx(0.01));
    REQUIRE(src.cursor() == 1);
    REQUIRE(src.advance_to(0.02) == Approx(0.02));
    REQUIRE_FALSE(src.exhausted());
    src.advance_to(1.0);
    REQUIRE(src.exhausted());
  }
}

TEST_CASE("ReplaySource drives the orchestrator end to end") {
  std::istringstream ss(rec_mixed);
  ReplaySource src(replay_frames_from_csv_stream(ss));
  PollOrchestrator orch(src, src);
  orch.start();

  int opponent_laps = 0;
  while (src.next_frame()) {
    auto st = orch.run_once(src.frame_time());
    REQUIRE(st.has_value());
    REQUIRE(st->state == SessionState::Logging);
    for (const auto& ev : orch.drain_events()) {
      if (std::holds_alternative<OpponentLap>(ev)) ++opponent_laps;
    }
  }
  REQUIRE(opponent_laps == 1);
  REQUIRE(orch.session().lap_buffer().size() == 3);

  auto st = orch.run_once(src.frame_time());
  REQUIRE(st->state == SessionState::Idle);
}
