#pragma once
#include <lapseg/sample.hpp>

namespace lapseg {

// Fraction windows: inputs inside are ratios and get scaled by 100.
inline constexpr double kPedalFractionLimit = 1.5;
inline constexpr double kSteerFractionLimit = 2.0;

// Raw sample -> canonical record. Total: missing fields take typed defaults.
NormalizedSample normalize(const TelemetrySample& raw);

double pedal_percent(const std::optional<double>& v);
double steer_percent(const std::optional<double>& v);

// Sector resolution order: explicit index, boundary list, equal thirds, 0.
int resolve_sample_sector(const TelemetrySample& raw, double lap_distance_m);

// Stable sort by lap distance; ties keep arrival order.
LapBuffer sorted_for_export(const LapBuffer& buf);

} // namespace lapseg
