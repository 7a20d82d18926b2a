#pragma once
#include <optional>
#include <string>
#include <variant>
#include <lapseg/sample.hpp>
#include <lapseg/sectors.hpp>

namespace lapseg {

// Why lap buffering ended early.
enum class StopReason {
  LapDistanceReset,   // backward jump beyond tolerance (teleport to pits, restart)
  IdleTimeout         // no progress below min speed for the idle timeout
};

const char* stop_reason_name(StopReason r);

struct LapSummary {
  int    lap = 0;
  double lap_time_s = 0.0;       // assigned lap time of the last buffered sample
  std::size_t sample_count = 0;
  double lap_distance_m = 0.0;   // distance of the last buffered sample
  bool   completed = false;
  std::optional<StopReason> stop_reason;
};

// Local driver lap handed to the export collaborator.
struct PlayerLap {
  std::string session_id;
  LapSummary summary;
  LapBuffer samples;             // export order (by lap distance)
  SectorLayout sectors;
  double track_length_m = 0.0;
};

// Opponent lap that passed the fastest-lap-only filter.
struct OpponentLap {
  std::string driver_name;
  int lap = 0;
  double lap_time_s = 0.0;
  bool is_fastest = true;
  LapBuffer samples;             // export order (by lap distance)
  SectorLayout sectors;
  std::optional<int> position;
  VehicleInfo vehicle;
};

using LapEvent = std::variant<PlayerLap, OpponentLap>;

} // namespace lapseg
