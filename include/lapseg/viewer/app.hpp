#pragma once
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <lapseg/lap.hpp>
#include <lapseg/poller.hpp>

namespace lapseg {

class PollRunner;

// Presentation thread: renders the latest status copy and recent laps.
class ViewerApp {
public:
  explicit ViewerApp(PollRunner& runner);
  int run(); // returns 0 on normal exit

  // Lap sink; called from the polling thread.
  void on_lap(const LapEvent& ev);

private:
  struct LapLine {
    std::string text;
    bool player = false;
    bool completed = true;
  };

  void process_input_();
  void pump_status_();
  void render_frame_();
  void draw_status_();
  void draw_laps_();

  PollRunner& runner_;
  PollStatus status_{};
  std::uint64_t cursor_{0};

  static constexpr std::size_t kMaxLapLines = 16;
  std::mutex laps_m_;
  std::deque<LapLine> laps_;
};

} // namespace lapseg
