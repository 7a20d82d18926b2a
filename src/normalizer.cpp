#include <lapseg/normalizer.hpp>
#include <algorithm>
#include <cmath>
#include <lapseg/sectors.hpp>

namespace lapseg {

static inline double clamp_range(double x, double lo, double hi) {
  return x < lo ? lo : (x > hi ? hi : x);
}

double pedal_percent(const std::optional<double>& v) {
  if (!v) return 0.0;
  double x = *v;
  if (x >= -kPedalFractionLimit && x <= kPedalFractionLimit) x *= 100.0;
  return clamp_range(x, 0.0, 100.0);
}

double steer_percent(const std::optional<double>& v) {
  if (!v) return 0.0;
  double x = *v;
  if (x >= -kSteerFractionLimit && x <= kSteerFractionLimit) x *= 100.0;
  return clamp_range(x, -100.0, 100.0);
}

int resolve_sample_sector(const TelemetrySample& raw, double lap_distance_m) {
  if (raw.sector) {
    int s = *raw.sector;
    if (s > 0) s -= 1;
    return std::max(0, s);
  }
  if (!raw.sector_boundaries_m.empty()) {
    return resolve_sector(lap_distance_m, raw.sector_boundaries_m);
  }
  return equal_division_sector(lap_distance_m, raw.track_length_m.value_or(0.0));
}

NormalizedSample normalize(const TelemetrySample& raw) {
  NormalizedSample n;
  n.lap_distance_m = raw.lap_distance_m.value_or(0.0);
  n.lap_time_s     = raw.lap_time_s.value_or(0.0);
  n.sector         = resolve_sample_sector(raw, n.lap_distance_m);
  n.speed_kmh      = raw.speed_kmh.value_or(0.0);
  n.engine_rpm     = raw.engine_rpm.value_or(0.0);
  n.throttle_pct   = pedal_percent(raw.throttle);
  n.brake_pct      = pedal_percent(raw.brake);
  n.steer_pct      = steer_percent(raw.steer);
  n.gear           = raw.gear ? static_cast<int>(std::lround(*raw.gear)) : 0;
  n.x_m            = raw.pos_x_m;
  n.z_m            = raw.pos_z_m;
  return n;
}

LapBuffer sorted_for_export(const LapBuffer& buf) {
  LapBuffer out = buf;
  std::stable_sort(out.begin(), out.end(), [](const NormalizedSample& a, const NormalizedSample& b){
    return a.lap_distance_m < b.lap_distance_m;
  });
  return out;
}

} // namespace lapseg
