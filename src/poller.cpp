#include <lapseg/poller.hpp>
#include <exception>
#include <utility>
#include <lapseg/log.hpp>
#include <lapseg/normalizer.hpp>

namespace lapseg {

const char* session_state_name(SessionState s) {
  switch (s) {
    case SessionState::Idle:     return "idle";
    case SessionState::Detected: return "detected";
    case SessionState::Logging:  return "logging";
    case SessionState::Paused:   return "paused";
    case SessionState::Error:    return "error";
  }
  return "idle";
}

PollOrchestrator::PollOrchestrator(ProcessProbe& probe, TelemetrySource& source, const LoggerConfig& cfg)
  : probe_(probe),
    source_(source),
    cfg_(cfg),
    session_(session_params(cfg)),
    opponents_(opponent_params(cfg)) {}

void PollOrchestrator::enter_(SessionState s) {
  if (s == state_) return;
  LAPSEG_LOGI("poller", "state %s -> %s", session_state_name(state_), session_state_name(s));
  state_ = s;
}

void PollOrchestrator::apply_pause_flag_(double now) {
  const bool want_pause = pause_requested_.load();
  switch (state_) {
    case SessionState::Detected:
    case SessionState::Logging:
      if (want_pause) {
        resume_state_ = state_;
        paused_at_ = now;
        enter_(SessionState::Paused);
      }
      break;
    case SessionState::Paused:
      if (!want_pause) {
        session_.shift_lap_start(now - paused_at_);
        enter_(resume_state_);
      }
      break;
    case SessionState::Idle:
    case SessionState::Error:
      break;
  }
}

bool PollOrchestrator::sample_indicates_active_(const TelemetrySample& s) const {
  return s.speed_kmh && *s.speed_kmh >= session_.params().min_speed_kmh;
}

void PollOrchestrator::fill_status_(PollStatus& st) const {
  st.state = state_;
  st.lap = session_.current_lap();
  st.samples_buffered = session_.lap_buffer().size();
  st.suspended = suspended_;
  st.opponents_tracked = opponents_.opponent_count();
  st.session_id = session_.session_id();
  if (state_ == SessionState::Error) st.error = last_error_;
}

void PollOrchestrator::feed_opponents_(double now) {
  opponents_.set_track_length(session_.track_length());
  for (const auto& s : source_.read_opponents()) {
    for (auto& lap : opponents_.update_opponent(s, now)) {
      pending_.emplace_back(std::move(lap));
    }
  }
}

void PollOrchestrator::flush_lap_(std::optional<StopReason> reason) {
  auto summary = session_.lap_summary();
  if (!summary) {
    session_.clear_lap_buffer();
    return;
  }
  summary->completed = !reason.has_value();
  summary->stop_reason = reason;

  PlayerLap lap;
  lap.session_id = session_.session_id();
  lap.summary = *summary;
  lap.samples = sorted_for_export(session_.lap_buffer());
  lap.track_length_m = session_.track_length();
  lap.sectors = detect_sector_boundaries(session_.split_observations(), lap.track_length_m);

  if (reason) {
    LAPSEG_LOGI("poller", "lap %d incomplete (%s) %.3fs, %zu samples",
                summary->lap, stop_reason_name(*reason), summary->lap_time_s, summary->sample_count);
  } else {
    LAPSEG_LOGI("poller", "lap %d complete %.3fs, %zu samples",
                summary->lap, summary->lap_time_s, summary->sample_count);
  }

  pending_.emplace_back(std::move(lap));
  session_.clear_lap_buffer();
}

std::optional<PollStatus> PollOrchestrator::run_once(double now) {
  if (!running_.load()) return std::nullopt;

  PollStatus st;
  st.timestamp = now;
  fill_status_(st);

  st.process_detected = probe_.is_running();
  if (!st.process_detected) {
    if (state_ != SessionState::Idle) {
      enter_(SessionState::Idle);
      session_.reset();
      opponents_.reset();
      last_error_.clear();
    }
    session_.clear_lap_buffer();
    suspended_ = false;
    fill_status_(st);
    return st;
  }

  if (state_ == SessionState::Idle) enter_(SessionState::Detected);
  apply_pause_flag_(now);

  // Error holds until the process goes away and the cycle restarts.
  if (state_ == SessionState::Error) {
    fill_status_(st);
    return st;
  }

  try {
    st.telemetry_available = source_.is_available();

    // Opponents progress regardless of local pause or suspension.
    if (st.telemetry_available && cfg_.track_opponents) feed_opponents_(now);

    if (state_ == SessionState::Paused) {
      fill_status_(st);
      return st;
    }

    if (!st.telemetry_available) {
      suspended_ = false;
      fill_status_(st);
      return st;
    }

    const std::optional<TelemetrySample> sample = source_.read();
    if (!sample) {
      fill_status_(st);
      return st;
    }

    const SessionEvents ev = session_.update(*sample, now);

    if (ev.lap_completed) {
      st.lap_completed = true;
      flush_lap_(std::nullopt);
    }

    if (ev.stop) {
      flush_lap_(ev.stop);
      st.session_stopped = true;
      st.stop_reason = ev.stop;
      suspended_ = true;
      if (state_ == SessionState::Logging) enter_(SessionState::Detected);
    }

    if (suspended_) {
      if (!ev.stop && sample_indicates_active_(*sample)) {
        suspended_ = false;
        LAPSEG_LOGI("poller", "activity resumed on lap %d", session_.current_lap());
      } else {
        fill_status_(st);
        return st;
      }
    }

    if (state_ == SessionState::Detected) {
      session_.set_session_id(generate_session_id());
      enter_(SessionState::Logging);
      LAPSEG_LOGI("poller", "session %s", session_.session_id().c_str());
    }

    session_.add_sample(*sample, now);
  } catch (const std::exception& e) {
    last_error_ = e.what();
    enter_(SessionState::Error);
    LAPSEG_LOGE("poller", "telemetry read failed: %s", e.what());
  } catch (...) {
    last_error_ = "unknown telemetry read failure";
    enter_(SessionState::Error);
    LAPSEG_LOGE("poller", "%s", last_error_.c_str());
  }

  fill_status_(st);
  return st;
}

std::vector<LapEvent> PollOrchestrator::drain_events() {
  std::vector<LapEvent> out;
  out.swap(pending_);
  return out;
}

} // namespace lapseg
