#include <cstdio>
#include <string>
#include <type_traits>
#include <variant>
#include <lapseg/config.hpp>
#include <lapseg/log.hpp>
#include <lapseg/poller.hpp>
#include <lapseg/replay.hpp>

using namespace lapseg;

namespace {

struct Totals {
  int player_complete = 0;
  int player_incomplete = 0;
  int opponent_laps = 0;
};

void report(const LapEvent& ev, Totals& totals) {
  std::visit([&](const auto& lap) {
    using T = std::decay_t<decltype(lap)>;
    if constexpr (std::is_same_v<T, PlayerLap>) {
      const auto& s = lap.summary;
      if (s.completed) {
        ++totals.player_complete;
        LAPSEG_LOGI("replay", "player lap %d  %.3fs  %zu samples  %d sectors",
                    s.lap, s.lap_time_s, s.sample_count, lap.sectors.count);
      } else {
        ++totals.player_incomplete;
        LAPSEG_LOGI("replay", "player lap %d incomplete (%s)  %zu samples",
                    s.lap, s.stop_reason ? stop_reason_name(*s.stop_reason) : "?", s.sample_count);
      }
    } else {
      ++totals.opponent_laps;
      LAPSEG_LOGI("replay", "%s lap %d  %.3fs  P%d  %s",
                  lap.driver_name.c_str(), lap.lap, lap.lap_time_s, lap.position.value_or(0),
                  lap.vehicle.car_name.value_or("unknown car").c_str());
    }
  }, ev);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <recording.csv> [config.csv]\n", argv[0]);
    return 2;
  }

  LoggerConfig cfg;
  if (argc >= 3) {
    auto loaded = load_logger_config(argv[2]);
    if (!loaded) {
      std::fprintf(stderr, "cannot open config %s\n", argv[2]);
      return 1;
    }
    cfg = *loaded;
  }
  Logger::instance().set_level(cfg.log_level);

  auto frames = load_replay_csv(argv[1]);
  if (!frames) {
    LAPSEG_LOGE("replay", "cannot open recording %s", argv[1]);
    return 1;
  }
  LAPSEG_LOGI("replay", "%zu frames from %s", frames->size(), argv[1]);

  ReplaySource src(std::move(*frames));
  PollOrchestrator orch(src, src, cfg);
  orch.start();

  Totals totals;
  double last_t = 0.0;
  while (src.next_frame()) {
    last_t = src.frame_time();
    orch.run_once(last_t);
    for (const auto& ev : orch.drain_events()) report(ev, totals);
  }
  const std::size_t opponents_seen = orch.opponents().opponent_count();
  // One more tick with the recording exhausted: process gone -> idle.
  if (auto st = orch.run_once(last_t)) {
    LAPSEG_LOGI("replay", "final state %s", session_state_name(st->state));
  }
  for (const auto& ev : orch.drain_events()) report(ev, totals);
  orch.stop();

  LAPSEG_LOGI("replay", "player laps: %d complete, %d incomplete; opponent laps: %d; opponents: %zu",
              totals.player_complete, totals.player_incomplete, totals.opponent_laps,
              opponents_seen);
  return 0;
}
