#include <lapseg/sample.hpp>
#include <lapseg/csv.hpp>
#include <algorithm>

namespace lapseg {

namespace {

constexpr int kMaxSplitSectors = 8;

// Field names for one source schema.
struct SchemaKeys {
  const char* lap;
  const char* lap_distance;
  const char* lap_time;
  const char* last_lap_time;
  const char* speed;
  const char* rpm;
  const char* throttle;
  const char* brake;
  const char* steer;
  const char* gear;
  const char* pos_x;
  const char* pos_z;
  const char* sector;
  const char* split_prefix;   // split key = prefix + (k+1) + suffix
  const char* split_suffix;
  const char* boundaries;
  const char* track_length;
  const char* driver;
  const char* control;
  const char* position;
  const char* car_name;
  const char* car_model;
  const char* car_class;
  const char* team;
  const char* manufacturer;
};

constexpr SchemaKeys kSharedMemoryKeys{
  "lap", "lap_distance", "lap_time", "last_lap_time", "speed", "rpm",
  "throttle", "brake", "steering", "gear", "position_x", "position_z",
  "sector", "sector", "_time", "sector_boundaries", "track_length",
  "driver_name", "control", "position",
  "car_name", "car_model", "car_class", "team_name", "manufacturer",
};

constexpr SchemaKeys kExportKeys{
  "Lap [int]", "LapDistance [m]", "LapTime [s]", "LastLapTime [s]", "Speed [km/h]",
  "EngineRevs [rpm]", "ThrottlePercentage [%]", "BrakePercentage [%]", "Steer [%]",
  "Gear [int]", "X [m]", "Z [m]",
  "Sector [int]", "Sector", "Time [s]", "SectorBoundaries [m]", "TrackLen [m]",
  "Driver", "Control [int]", "Position [int]",
  "CarName", "CarModel", "CarClass", "Team", "Manufacturer",
};

const SchemaKeys& keys_for(SourceSchema schema) {
  switch (schema) {
    case SourceSchema::SharedMemory:  return kSharedMemoryKeys;
    case SourceSchema::ExportColumns: return kExportKeys;
  }
  return kSharedMemoryKeys;
}

const std::string* find_field(const FieldMap& fields, const char* key) {
  auto it = fields.find(key);
  if (it == fields.end()) return nullptr;
  return &it->second;
}

std::optional<double> number(const FieldMap& fields, const char* key) {
  const std::string* v = find_field(fields, key);
  return v ? parse_double(*v) : std::nullopt;
}

std::optional<int> integer(const FieldMap& fields, const char* key) {
  const std::string* v = find_field(fields, key);
  return v ? parse_int(*v) : std::nullopt;
}

std::optional<std::string> text(const FieldMap& fields, const char* key) {
  const std::string* v = find_field(fields, key);
  if (!v) return std::nullopt;
  std::string t = trim(*v);
  if (t.empty()) return std::nullopt;
  return t;
}

// "1800;3600;5400" -> {1800, 3600, 5400}; unparseable entries are dropped.
std::vector<double> boundary_list(const std::string& s) {
  std::vector<double> out;
  std::string cur;
  auto flush = [&]{
    if (auto v = parse_double(cur); v && *v > 0.0) out.push_back(*v);
    cur.clear();
  };
  for (char c : s) {
    if (c == ';' || c == ' ') flush();
    else cur.push_back(c);
  }
  flush();
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

ControlType control_from_int(int v) {
  switch (v) {
    case 0: return ControlType::LocalPlayer;
    case 1: return ControlType::AI;
    case 2: return ControlType::Remote;
    case 3: return ControlType::Replay;
    default: return ControlType::Nobody;
  }
}

const char* control_name(ControlType c) {
  switch (c) {
    case ControlType::Nobody:      return "nobody";
    case ControlType::LocalPlayer: return "player";
    case ControlType::AI:          return "ai";
    case ControlType::Remote:      return "remote";
    case ControlType::Replay:      return "replay";
  }
  return "nobody";
}

TelemetrySample adapt_sample(const FieldMap& fields, SourceSchema schema) {
  const SchemaKeys& k = keys_for(schema);
  TelemetrySample s;
  s.lap             = integer(fields, k.lap);
  s.lap_distance_m  = number(fields, k.lap_distance);
  s.lap_time_s      = number(fields, k.lap_time);
  s.last_lap_time_s = number(fields, k.last_lap_time);
  s.speed_kmh       = number(fields, k.speed);
  s.engine_rpm      = number(fields, k.rpm);
  s.throttle        = number(fields, k.throttle);
  s.brake           = number(fields, k.brake);
  s.steer           = number(fields, k.steer);
  s.gear            = number(fields, k.gear);
  s.pos_x_m         = number(fields, k.pos_x);
  s.pos_z_m         = number(fields, k.pos_z);
  s.sector          = integer(fields, k.sector);
  s.track_length_m  = number(fields, k.track_length);

  // Splits are contiguous from sector 1; stop at the first missing one.
  for (int i = 1; i <= kMaxSplitSectors; ++i) {
    const std::string key = std::string(k.split_prefix) + std::to_string(i) + k.split_suffix;
    const std::string* raw = find_field(fields, key.c_str());
    if (!raw) break;
    s.sector_splits_s.push_back(parse_double(*raw).value_or(0.0));
  }

  if (const std::string* b = find_field(fields, k.boundaries)) {
    s.sector_boundaries_m = boundary_list(*b);
  }

  s.driver_name = text(fields, k.driver).value_or(std::string{});
  if (auto c = integer(fields, k.control)) s.control = control_from_int(*c);
  s.position = integer(fields, k.position);

  s.vehicle.car_name     = text(fields, k.car_name);
  s.vehicle.car_model    = text(fields, k.car_model);
  s.vehicle.car_class    = text(fields, k.car_class);
  s.vehicle.team_name    = text(fields, k.team);
  s.vehicle.manufacturer = text(fields, k.manufacturer);
  return s;
}

SourceSchema schema_for_header(const std::vector<std::string>& columns) {
  for (const auto& c : columns) {
    if (c == kExportKeys.lap_distance || c == kExportKeys.lap) return SourceSchema::ExportColumns;
  }
  return SourceSchema::SharedMemory;
}

} // namespace lapseg
