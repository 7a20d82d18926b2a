#include <lapseg/sectors.hpp>
#include <algorithm>

namespace lapseg {

SplitObservation split_observation(const TelemetrySample& s) {
  return SplitObservation{s.lap_distance_m.value_or(0.0), s.sector_splits_s};
}

SectorLayout detect_sector_boundaries(const std::vector<SplitObservation>& obs,
                                      double track_length_m) {
  std::vector<const SplitObservation*> ordered;
  ordered.reserve(obs.size());
  for (const auto& o : obs) ordered.push_back(&o);
  std::stable_sort(ordered.begin(), ordered.end(), [](const SplitObservation* a, const SplitObservation* b){
    return a->lap_distance_m < b->lap_distance_m;
  });

  std::size_t n_splits = 0;
  for (const auto* o : ordered) n_splits = std::max(n_splits, o->splits_s.size());

  // Edge-triggered per sector: armed once seen at zero, fires once.
  std::vector<bool> armed(n_splits, false);
  std::vector<bool> fired(n_splits, false);
  std::vector<double> found(n_splits, -1.0);

  for (const auto* o : ordered) {
    for (std::size_t k = 0; k < o->splits_s.size(); ++k) {
      if (fired[k]) continue;
      const double v = o->splits_s[k];
      if (v <= 0.0) { armed[k] = true; continue; }
      if (armed[k]) {
        found[k] = o->lap_distance_m;
        fired[k] = true;
      }
    }
  }

  SectorLayout out;
  for (double d : found) {
    if (d >= 0.0) out.boundaries_m.push_back(d);
  }
  std::sort(out.boundaries_m.begin(), out.boundaries_m.end());

  if (out.boundaries_m.empty()) {
    if (track_length_m > 0.0) {
      out.boundaries_m = {track_length_m / 3.0, 2.0 * track_length_m / 3.0, track_length_m};
    }
  } else if (track_length_m > 0.0) {
    double& last = out.boundaries_m.back();
    if (last < kFinishLineShare * track_length_m) out.boundaries_m.push_back(track_length_m);
    else last = track_length_m;
  }

  out.count = out.boundaries_m.empty() ? kDefaultSectorCount
                                       : static_cast<int>(out.boundaries_m.size());
  return out;
}

SectorLayout detect_sector_boundaries(const std::vector<TelemetrySample>& samples,
                                      double track_length_m) {
  std::vector<SplitObservation> obs;
  obs.reserve(samples.size());
  for (const auto& s : samples) obs.push_back(split_observation(s));
  return detect_sector_boundaries(obs, track_length_m);
}

int resolve_sector(double lap_distance_m, const std::vector<double>& boundaries_m) {
  if (boundaries_m.empty()) return 0;
  for (std::size_t i = 0; i < boundaries_m.size(); ++i) {
    if (boundaries_m[i] > lap_distance_m) return static_cast<int>(i);
  }
  return static_cast<int>(boundaries_m.size()) - 1;
}

int equal_division_sector(double lap_distance_m, double track_length_m) {
  if (track_length_m <= 0.0) return 0;
  const double progress = std::clamp(lap_distance_m / track_length_m, 0.0, 0.9999);
  return static_cast<int>(progress * kDefaultSectorCount);
}

} // namespace lapseg
