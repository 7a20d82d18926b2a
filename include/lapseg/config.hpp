#pragma once
#include <istream>
#include <optional>
#include <string>
#include <lapseg/log.hpp>
#include <lapseg/opponents.hpp>
#include <lapseg/session.hpp>

namespace lapseg {

struct LoggerConfig {
  double idle_timeout_s = 5.0;          // <= 0 disables idle stop
  double min_speed_kmh = 1.0;
  double lap_reset_tolerance_m = 5.0;
  bool   track_opponents = true;
  bool   track_opponent_ai = false;
  bool   track_remote_only = true;
  double poll_interval_s = 0.01;        // ~100 Hz
  LogLevel log_level = LogLevel::Info;
};

inline SessionParams session_params(const LoggerConfig& c) {
  return SessionParams{c.idle_timeout_s, c.min_speed_kmh, c.lap_reset_tolerance_m};
}

inline OpponentParams opponent_params(const LoggerConfig& c) {
  return OpponentParams{c.track_remote_only, c.track_opponent_ai};
}

// Stream-based "key,value" loader (no filesystem required).
// Optional "key,value" header; '#' comments and blank lines ignored.
// Unknown keys and unparseable values are skipped with a warning;
// negative durations, speeds and tolerances clamp to zero.
LoggerConfig logger_config_from_stream(std::istream& in, LoggerConfig base = {});

// Filesystem wrapper; nullopt if the file cannot be opened.
std::optional<LoggerConfig> load_logger_config(const std::string& path);

} // namespace lapseg
