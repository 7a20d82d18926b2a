#pragma once
#include <optional>
#include <string>
#include <vector>
#include <lapseg/lap.hpp>
#include <lapseg/sample.hpp>
#include <lapseg/sectors.hpp>

namespace lapseg {

// Source under-reports lap time at lap-boundary instants; prefer the wall
// clock when it runs ahead of the reported time by more than this.
inline constexpr double kLapTimeSlackS = 0.02;
// Minimum distance increase that counts as forward progress.
inline constexpr double kProgressEpsilonM = 0.1;

struct SessionParams {
  double idle_timeout_s = 5.0;        // <= 0 disables idle detection
  double min_speed_kmh = 1.0;
  double lap_reset_tolerance_m = 5.0;
};

struct SessionEvents {
  bool lap_completed = false;
  std::optional<StopReason> stop;
};

// Local driver lap state: lap changes, stop conditions, buffer.
class SessionManager {
public:
  SessionManager() = default;
  explicit SessionManager(const SessionParams& p);

  // Inspect one sample: lap change, stop conditions, track length.
  SessionEvents update(const TelemetrySample& s, std::optional<double> timestamp = std::nullopt);

  // Normalize and buffer one sample with a reconstructed, monotonic lap time.
  // Returns false when the record duplicates the last buffered one.
  bool add_sample(const TelemetrySample& s, std::optional<double> timestamp = std::nullopt);

  std::optional<LapSummary> lap_summary() const;
  void clear_lap_buffer();

  // Time spent paused does not count toward lap time or idle time.
  void shift_lap_start(double dt);
  // Forget everything learned from the stream (process restart, new track).
  void reset();

  const LapBuffer& lap_buffer() const { return buffer_; }
  const std::vector<SplitObservation>& split_observations() const { return splits_; }
  int current_lap() const { return current_lap_; }
  double track_length() const { return track_length_m_; }
  std::optional<double> last_lap_distance() const { return last_lap_distance_m_; }
  const SessionParams& params() const { return params_; }

  const std::string& session_id() const { return session_id_; }
  void set_session_id(std::string id) { session_id_ = std::move(id); }

private:
  std::optional<StopReason> detect_stop_conditions_(const TelemetrySample& s,
                                                    std::optional<double> timestamp,
                                                    bool lap_advanced);
  double assign_lap_time_(double reported, std::optional<double> timestamp) const;

  SessionParams params_{};
  int current_lap_{0};
  std::string session_id_;

  LapBuffer buffer_;
  std::vector<SplitObservation> splits_;
  int buffer_lap_{0};
  std::optional<double> lap_start_ts_;
  double last_assigned_lap_time_{0.0};

  // Stop-condition tracking
  std::optional<double> last_lap_distance_m_;
  std::optional<double> last_progress_ts_;

  double track_length_m_{0.0};        // running max, never decreases
};

// Local-time stamp "YYYYMMDDHHMMSSffffff" (20 digits).
std::string generate_session_id();

} // namespace lapseg
