#include <lapseg/session.hpp>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <lapseg/normalizer.hpp>

namespace lapseg {

const char* stop_reason_name(StopReason r) {
  switch (r) {
    case StopReason::LapDistanceReset: return "lap_distance_reset";
    case StopReason::IdleTimeout:      return "idle_timeout";
  }
  return "unknown";
}

SessionManager::SessionManager(const SessionParams& p) {
  params_.idle_timeout_s        = std::max(0.0, p.idle_timeout_s);
  params_.min_speed_kmh         = std::max(0.0, p.min_speed_kmh);
  params_.lap_reset_tolerance_m = std::max(0.0, p.lap_reset_tolerance_m);
}

SessionEvents SessionManager::update(const TelemetrySample& s, std::optional<double> timestamp) {
  SessionEvents ev;

  const int new_lap = s.lap.value_or(0);
  const bool lap_advanced = new_lap > current_lap_;
  if (lap_advanced && current_lap_ > 0) ev.lap_completed = true;
  current_lap_ = new_lap;

  if (s.track_length_m && *s.track_length_m > track_length_m_) track_length_m_ = *s.track_length_m;
  if (s.lap_distance_m && *s.lap_distance_m > track_length_m_) track_length_m_ = *s.lap_distance_m;

  ev.stop = detect_stop_conditions_(s, timestamp, lap_advanced);
  return ev;
}

std::optional<StopReason> SessionManager::detect_stop_conditions_(const TelemetrySample& s,
                                                                  std::optional<double> timestamp,
                                                                  bool lap_advanced) {
  std::optional<StopReason> stop;
  const auto& dist = s.lap_distance_m;
  const auto& speed = s.speed_kmh;

  if (timestamp && !last_progress_ts_) last_progress_ts_ = timestamp;

  // Teleport to pits, session restart: distance jumps backwards.
  // Crossing the line on a lap increase is the expected wrap, not a reset.
  if (!lap_advanced && dist && last_lap_distance_m_ &&
      *dist + params_.lap_reset_tolerance_m < *last_lap_distance_m_) {
    stop = StopReason::LapDistanceReset;
  }

  if (dist) {
    if (timestamp && (!last_lap_distance_m_ || *dist > *last_lap_distance_m_ + kProgressEpsilonM)) {
      last_progress_ts_ = timestamp;
    }
    last_lap_distance_m_ = dist;
  }

  if (speed && *speed >= params_.min_speed_kmh && timestamp) last_progress_ts_ = timestamp;

  if (!stop && params_.idle_timeout_s > 0.0 && timestamp && last_progress_ts_ &&
      (*timestamp - *last_progress_ts_) >= params_.idle_timeout_s) {
    stop = StopReason::IdleTimeout;
  }

  // Do not fire again on the very next sample.
  if (stop && timestamp) last_progress_ts_ = timestamp;
  return stop;
}

double SessionManager::assign_lap_time_(double reported, std::optional<double> timestamp) const {
  double t = reported;
  if (timestamp && lap_start_ts_) {
    const double elapsed = *timestamp - *lap_start_ts_;
    if (elapsed > reported + kLapTimeSlackS) t = elapsed;
    else t = std::max(reported, elapsed);
  }
  // Never run backwards within a lap.
  return std::max(t, last_assigned_lap_time_);
}

bool SessionManager::add_sample(const TelemetrySample& s, std::optional<double> timestamp) {
  if (buffer_.empty() && timestamp && !lap_start_ts_) lap_start_ts_ = timestamp;

  NormalizedSample n = normalize(s);
  n.lap_time_s = assign_lap_time_(n.lap_time_s, timestamp);

  if (!buffer_.empty() && buffer_.back() == n) return false;

  buffer_.push_back(n);
  splits_.push_back(split_observation(s));
  buffer_lap_ = s.lap.value_or(current_lap_);
  last_assigned_lap_time_ = n.lap_time_s;
  return true;
}

std::optional<LapSummary> SessionManager::lap_summary() const {
  if (buffer_.empty()) return std::nullopt;
  const auto& last = buffer_.back();
  LapSummary sum;
  sum.lap = buffer_lap_;
  sum.lap_time_s = last.lap_time_s;
  sum.sample_count = buffer_.size();
  sum.lap_distance_m = last.lap_distance_m;
  return sum;
}

void SessionManager::clear_lap_buffer() {
  buffer_.clear();
  splits_.clear();
  buffer_lap_ = 0;
  lap_start_ts_.reset();
  last_assigned_lap_time_ = 0.0;
}

void SessionManager::shift_lap_start(double dt) {
  if (dt <= 0.0) return;
  if (lap_start_ts_) *lap_start_ts_ += dt;
  if (last_progress_ts_) *last_progress_ts_ += dt;
}

void SessionManager::reset() {
  clear_lap_buffer();
  current_lap_ = 0;
  session_id_.clear();
  last_lap_distance_m_.reset();
  last_progress_ts_.reset();
  track_length_m_ = 0.0;
}

std::string generate_session_id() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const std::time_t t = clock::to_time_t(now);
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                    now.time_since_epoch()).count() % 1000000;
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &tm);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s%06lld", stamp, static_cast<long long>(us));
  return std::string(buf);
}

} // namespace lapseg
