#pragma once
#include <optional>
#include <vector>
#include <lapseg/sample.hpp>

namespace lapseg {

// Is the target game process present?
class ProcessProbe {
public:
  virtual ~ProcessProbe() = default;
  virtual bool is_running() = 0;
};

// Acquisition collaborator. read() and read_opponents() may throw;
// the orchestrator turns that into its Error state.
class TelemetrySource {
public:
  virtual ~TelemetrySource() = default;
  virtual bool is_available() = 0;
  // Local driver frame for this tick, nullopt when nothing was produced.
  virtual std::optional<TelemetrySample> read() = 0;
  // Every other visible vehicle for this tick.
  virtual std::vector<TelemetrySample> read_opponents() = 0;
};

} // namespace lapseg
