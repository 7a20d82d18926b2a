#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <lapseg/lap.hpp>
#include <lapseg/sample.hpp>

namespace lapseg {

struct OpponentParams {
  bool track_remote_only = true;
  bool track_ai = false;
};

struct OpponentState {
  std::string driver_name;
  int current_lap = 0;
  std::vector<TelemetrySample> samples;   // raw frames of the lap in progress
  double fastest_lap_time_s = std::numeric_limits<double>::infinity();
  std::optional<double> lap_start_ts;
};

// Per-driver lap segmentation for remote entries, fastest-lap-only emission.
class OpponentTracker {
public:
  using Handle = std::size_t;

  OpponentTracker() = default;
  explicit OpponentTracker(const OpponentParams& p) : params_(p) {}

  // Feed one opponent frame; returns the laps that should be exported.
  std::vector<OpponentLap> update_opponent(const TelemetrySample& s,
                                           std::optional<double> timestamp = std::nullopt);

  bool should_track(ControlType c) const;

  std::size_t opponent_count() const { return states_.size(); }
  std::optional<OpponentState> opponent_status(const std::string& driver_name) const;
  void reset();

  void set_track_length(double m) { track_length_m_ = m; }

private:
  Handle handle_for_(const std::string& driver_name, std::optional<double> timestamp);
  OpponentLap make_lap_(const OpponentState& st, const TelemetrySample& s, double lap_time) const;

  OpponentParams params_{};
  std::vector<OpponentState> states_;
  std::unordered_map<std::string, Handle> index_;
  double track_length_m_{0.0};
};

} // namespace lapseg
