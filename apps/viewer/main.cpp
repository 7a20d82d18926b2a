#include <cstdio>
#include <lapseg/config.hpp>
#include <lapseg/log.hpp>
#include <lapseg/poll_runner.hpp>
#include <lapseg/poller.hpp>
#include <lapseg/replay.hpp>
#include <lapseg/viewer/app.hpp>

using namespace lapseg;

int main(int argc, char** argv) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <recording.csv> [config.csv]\n", argv[0]);
    return 2;
  }

  LoggerConfig cfg;
  if (argc >= 3) {
    if (auto loaded = load_logger_config(argv[2])) cfg = *loaded;
    else LAPSEG_LOGW("viewer", "cannot open config %s, using defaults", argv[2]);
  }
  Logger::instance().set_level(cfg.log_level);

  auto frames = load_replay_csv(argv[1]);
  if (!frames) {
    LAPSEG_LOGE("viewer", "cannot open recording %s", argv[1]);
    return 1;
  }

  ReplaySource src(std::move(*frames));
  PollOrchestrator orch(src, src, cfg);
  PollRunner runner(orch, cfg.poll_interval_s);
  ViewerApp app(runner);

  runner.set_time_source([&src](double wall_s){ return src.advance_to(wall_s); });
  runner.set_lap_sink([&app](const LapEvent& ev){ app.on_lap(ev); });
  runner.start();

  const int code = app.run();

  runner.stop();
  return code;
}
