#pragma once
#include <cstddef>
#include <vector>
#include <lapseg/sample.hpp>

namespace lapseg {

inline constexpr int kDefaultSectorCount = 3;
// A detected last boundary at or beyond this share of the lap is the finish line.
inline constexpr double kFinishLineShare = 0.95;

// Cumulative split times seen at one lap distance.
struct SplitObservation {
  double lap_distance_m = 0.0;
  std::vector<double> splits_s;
};

struct SectorLayout {
  std::vector<double> boundaries_m;       // ascending sector-end distances
  int count = kDefaultSectorCount;
};

SplitObservation split_observation(const TelemetrySample& s);

// Infer sector-end distances from a completed lap.
// Walks observations in lap-distance order; a sector ends at the first
// observation where its split turns positive after having been zero.
SectorLayout detect_sector_boundaries(const std::vector<SplitObservation>& obs,
                                      double track_length_m);
SectorLayout detect_sector_boundaries(const std::vector<TelemetrySample>& samples,
                                      double track_length_m);

// Index of the first boundary strictly beyond distance, else the last sector.
// Returns 0 for an empty boundary list.
int resolve_sector(double lap_distance_m, const std::vector<double>& boundaries_m);

// Three equal sectors over track_length (0 when the length is unknown).
int equal_division_sector(double lap_distance_m, double track_length_m);

} // namespace lapseg
