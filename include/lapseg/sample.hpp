#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lapseg {

// Control classification reported by the source for each vehicle.
enum class ControlType : int {
  Nobody = -1,
  LocalPlayer = 0,
  AI = 1,
  Remote = 2,
  Replay = 3
};

struct VehicleInfo {
  std::optional<std::string> car_name;      // entry name, e.g. "Team #311:LM"
  std::optional<std::string> car_model;
  std::optional<std::string> car_class;
  std::optional<std::string> team_name;
  std::optional<std::string> manufacturer;

  bool operator==(const VehicleInfo&) const = default;
};

// One raw frame from the acquisition layer, already typed.
// Every source field is optional; the normalizer decides the defaults.
struct TelemetrySample {
  std::optional<int>    lap;
  std::optional<double> lap_distance_m;
  std::optional<double> lap_time_s;        // time into the current lap
  std::optional<double> last_lap_time_s;   // duration of the previous completed lap
  std::optional<double> speed_kmh;
  std::optional<double> engine_rpm;
  std::optional<double> throttle;          // fraction or percent
  std::optional<double> brake;             // fraction or percent
  std::optional<double> steer;             // ratio or percent
  std::optional<double> gear;
  std::optional<double> pos_x_m;
  std::optional<double> pos_z_m;
  std::optional<int>    sector;            // explicit sector, 1-based from the source
  std::vector<double>   sector_splits_s;   // cumulative split per sector, 0 until done
  std::vector<double>   sector_boundaries_m;
  std::optional<double> track_length_m;

  // Identity (opponents)
  std::string driver_name;
  ControlType control = ControlType::Nobody;
  std::optional<int> position;
  VehicleInfo vehicle;
};

// Canonical per-instant record stored in lap buffers.
struct NormalizedSample {
  double lap_distance_m = 0.0;
  double lap_time_s = 0.0;
  int    sector = 0;              // zero-based
  double speed_kmh = 0.0;
  double engine_rpm = 0.0;
  double throttle_pct = 0.0;      // [0, 100]
  double brake_pct = 0.0;         // [0, 100]
  double steer_pct = 0.0;         // [-100, 100]
  int    gear = 0;
  std::optional<double> x_m;
  std::optional<double> z_m;

  bool operator==(const NormalizedSample&) const = default;
};

using LapBuffer = std::vector<NormalizedSample>;

// Flat key/value view of one row delivered by a source.
using FieldMap = std::unordered_map<std::string, std::string>;

// Known source schemas; one adapter each.
enum class SourceSchema {
  SharedMemory,   // snake_case keys: lap_distance, throttle, sector1_time, ...
  ExportColumns   // export headers: "LapDistance [m]", "ThrottlePercentage [%]", ...
};

// Translate one row of named fields into a typed sample.
// Unparseable or non-finite numbers become nullopt.
TelemetrySample adapt_sample(const FieldMap& fields, SourceSchema schema);

// Pick the schema from a recording's column names (ExportColumns if any
// bracketed export header is present, SharedMemory otherwise).
SourceSchema schema_for_header(const std::vector<std::string>& columns);

ControlType control_from_int(int v);
const char* control_name(ControlType c);

} // namespace lapseg
