#include <raylib.h>
#include <cmath>
#include <cstdio>
#include <type_traits>
#include <variant>

#include <lapseg/viewer/app.hpp>
#include <lapseg/poll_runner.hpp>

namespace lapseg {

namespace {

static void fmt_time(double s, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (s <= 0.0 || !std::isfinite(s)) { std::snprintf(out, (size_t)cap, "%s", "--"); return; }
  int minutes = (int)(s / 60.0);
  double rem  = s - minutes * 60.0;
  int secs    = (int)rem;
  int ms      = (int)((rem - secs) * 1000.0 + 0.5);
  if (ms >= 1000) { ms -= 1000; ++secs; }
  if (minutes > 0) std::snprintf(out, (size_t)cap, "%d:%02d.%03d", minutes, secs, ms);
  else             std::snprintf(out, (size_t)cap, "%d.%03d", secs, ms);
}

static Color stateColor(SessionState s) {
  switch (s) {
    case SessionState::Idle:     return Color{150,150,160,255};
    case SessionState::Detected: return Color{241,196, 15,255};
    case SessionState::Logging:  return Color{ 46,204,113,255};
    case SessionState::Paused:   return Color{ 52,152,219,255};
    case SessionState::Error:    return Color{231, 76, 60,255};
  }
  return Color{150,150,160,255};
}

static constexpr int kWinW = 900;
static constexpr int kWinH = 560;
static constexpr int kPad  = 20;

} // namespace

ViewerApp::ViewerApp(PollRunner& runner) : runner_(runner) {}

void ViewerApp::on_lap(const LapEvent& ev) {
  LapLine line;
  char t[32];
  char buf[256];
  std::visit([&](const auto& lap) {
    using T = std::decay_t<decltype(lap)>;
    if constexpr (std::is_same_v<T, PlayerLap>) {
      fmt_time(lap.summary.lap_time_s, t, sizeof(t));
      line.player = true;
      line.completed = lap.summary.completed;
      if (lap.summary.completed) {
        std::snprintf(buf, sizeof(buf), "YOU   lap %-3d %10s  %5zu samples  %d sectors",
                      lap.summary.lap, t, lap.summary.sample_count, lap.sectors.count);
      } else {
        std::snprintf(buf, sizeof(buf), "YOU   lap %-3d %10s  incomplete: %s",
                      lap.summary.lap, t,
                      lap.summary.stop_reason ? stop_reason_name(*lap.summary.stop_reason) : "?");
      }
    } else {
      fmt_time(lap.lap_time_s, t, sizeof(t));
      std::snprintf(buf, sizeof(buf), "%-5.5s lap %-3d %10s  fastest  %s",
                    lap.driver_name.c_str(), lap.lap, t,
                    lap.vehicle.car_class.value_or("").c_str());
    }
  }, ev);
  line.text = buf;

  std::lock_guard<std::mutex> lk(laps_m_);
  laps_.push_front(std::move(line));
  while (laps_.size() > kMaxLapLines) laps_.pop_back();
}

int ViewerApp::run() {
  SetConfigFlags(FLAG_MSAA_4X_HINT | FLAG_WINDOW_RESIZABLE);
  InitWindow(kWinW, kWinH, "lapseg - live lap segmentation");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_status_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_SPACE)) {
    if (runner_.paused()) runner_.resume();
    else runner_.pause();
  }
}

void ViewerApp::pump_status_() {
  PollStatus st;
  if (runner_.status().try_consume_latest(cursor_, st)) status_ = st;
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(Color{18,18,22,255});
  draw_status_();
  draw_laps_();
  EndDrawing();
}

void ViewerApp::draw_status_() {
  const PollStatus& s = status_;
  DrawRectangle(kPad - 6, kPad - 6, kWinW - 2*kPad + 12, 118, Color{24,24,28,220});

  DrawText(TextFormat("%s%s", session_state_name(s.state), s.suspended ? " (suspended)" : ""),
           kPad, kPad, 28, stateColor(s.state));

  DrawText(TextFormat("process=%s  telemetry=%s  t=%.2fs  ticks=%llu",
                      s.process_detected ? "yes" : "no",
                      s.telemetry_available ? "yes" : "no",
                      s.timestamp,
                      (unsigned long long)runner_.ticks()),
           kPad, kPad + 36, 18, Color{220,235,220,255});

  DrawText(TextFormat("lap=%d  buffered=%zu  opponents=%zu  laps delivered=%llu",
                      s.lap, s.samples_buffered, s.opponents_tracked,
                      (unsigned long long)runner_.laps_delivered()),
           kPad, kPad + 60, 18, Color{220,235,220,255});

  const char* extra = "";
  if (!s.error.empty()) extra = TextFormat("error: %s", s.error.c_str());
  else if (!s.session_id.empty()) extra = TextFormat("session %s", s.session_id.c_str());
  DrawText(extra, kPad, kPad + 84, 16, s.error.empty() ? Color{190,205,190,255} : Color{231,76,60,255});

  DrawText("Space: Pause/Resume | Esc: Quit", kPad, kWinH - 24, 14, Color{190,205,190,255});
}

void ViewerApp::draw_laps_() {
  const int y0 = kPad + 130;
  const int row_h = 20;
  DrawText("Recent laps", kPad, y0, 20, Color{220,220,230,255});

  std::lock_guard<std::mutex> lk(laps_m_);
  int y = y0 + 28;
  for (const auto& l : laps_) {
    Color c = Color{200,200,210,255};
    if (l.player) c = l.completed ? Color{80,220,120,255} : Color{230,126,34,255};
    else          c = Color{180,90,255,255};
    DrawText(l.text.c_str(), kPad, y, 16, c);
    y += row_h;
  }
}

} // namespace lapseg
