#pragma once
#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <lapseg/config.hpp>
#include <lapseg/lap.hpp>
#include <lapseg/opponents.hpp>
#include <lapseg/session.hpp>
#include <lapseg/source.hpp>

namespace lapseg {

enum class SessionState { Idle, Detected, Logging, Paused, Error };

const char* session_state_name(SessionState s);

// Per-tick observability record. Plain value, safe to copy across threads.
struct PollStatus {
  double timestamp = 0.0;
  SessionState state = SessionState::Idle;
  bool process_detected = false;
  bool telemetry_available = false;
  int lap = 0;
  std::size_t samples_buffered = 0;
  bool lap_completed = false;
  bool session_stopped = false;
  std::optional<StopReason> stop_reason;
  bool suspended = false;
  std::size_t opponents_tracked = 0;
  std::string session_id;
  std::string error;
};

// Outer state machine: one run_once() per poll tick, all on one thread.
// start/stop/pause/resume only flip atomics and may be called from any thread.
class PollOrchestrator {
public:
  PollOrchestrator(ProcessProbe& probe, TelemetrySource& source, const LoggerConfig& cfg = {});

  void start() { running_.store(true); pause_requested_.store(false); }
  void stop() { running_.store(false); }
  void pause() { pause_requested_.store(true); }
  void resume() { pause_requested_.store(false); }
  bool is_running() const { return running_.load(); }
  bool is_paused() const { return pause_requested_.load(); }

  // Advance one tick at time `now` (seconds). nullopt when not running.
  std::optional<PollStatus> run_once(double now);

  // Laps finished since the last drain, in finishing order.
  std::vector<LapEvent> drain_events();

  // Polling thread only.
  SessionState state() const { return state_; }
  bool suspended() const { return suspended_; }
  const SessionManager& session() const { return session_; }
  const OpponentTracker& opponents() const { return opponents_; }

private:
  void enter_(SessionState s);
  void apply_pause_flag_(double now);
  void feed_opponents_(double now);
  void flush_lap_(std::optional<StopReason> reason);
  void fill_status_(PollStatus& st) const;
  bool sample_indicates_active_(const TelemetrySample& s) const;

  ProcessProbe& probe_;
  TelemetrySource& source_;
  LoggerConfig cfg_;
  SessionManager session_;
  OpponentTracker opponents_;

  std::atomic<bool> running_{false};
  std::atomic<bool> pause_requested_{false};

  SessionState state_{SessionState::Idle};
  SessionState resume_state_{SessionState::Logging};
  double paused_at_{0.0};
  bool suspended_{false};
  std::string last_error_;
  std::vector<LapEvent> pending_;
};

} // namespace lapseg
