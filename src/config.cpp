#include <lapseg/config.hpp>
#include <algorithm>
#include <fstream>
#include <lapseg/csv.hpp>

namespace lapseg {

static bool is_header_row(const std::vector<std::string>& cols) {
  return cols.size() >= 2 && (cols[0] == "key" || cols[0] == "Key");
}

static bool set_number(double& dst, const std::string& v, bool clamp_zero) {
  auto d = parse_double(v);
  if (!d) return false;
  dst = clamp_zero ? std::max(0.0, *d) : *d;
  return true;
}

static bool set_flag(bool& dst, const std::string& v) {
  auto b = parse_bool(v);
  if (!b) return false;
  dst = *b;
  return true;
}

static bool apply_entry(LoggerConfig& c, const std::string& key, const std::string& value, bool& known) {
  known = true;
  if (key == "idle_timeout_seconds")  return set_number(c.idle_timeout_s, value, true);
  if (key == "min_speed_kmh")         return set_number(c.min_speed_kmh, value, true);
  if (key == "lap_reset_tolerance_m") return set_number(c.lap_reset_tolerance_m, value, true);
  if (key == "poll_interval")         return set_number(c.poll_interval_s, value, true);
  if (key == "track_opponents")       return set_flag(c.track_opponents, value);
  if (key == "track_opponent_ai")     return set_flag(c.track_opponent_ai, value);
  if (key == "track_remote_only")     return set_flag(c.track_remote_only, value);
  if (key == "log_level") {
    auto lv = parse_log_level(value);
    if (!lv) return false;
    c.log_level = *lv;
    return true;
  }
  known = false;
  return false;
}

LoggerConfig logger_config_from_stream(std::istream& in, LoggerConfig base) {
  LoggerConfig cfg = base;
  std::string line;
  bool header_consumed = false;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }
    if (cols.size() < 2 || cols[0].empty()) {
      LAPSEG_LOGW("config", "line %d: expected key,value", line_no);
      continue;
    }

    bool known = false;
    if (!apply_entry(cfg, cols[0], cols[1], known)) {
      if (known) LAPSEG_LOGW("config", "line %d: bad value '%s' for %s", line_no, cols[1].c_str(), cols[0].c_str());
      else       LAPSEG_LOGW("config", "line %d: unknown key %s", line_no, cols[0].c_str());
    }
  }
  return cfg;
}

std::optional<LoggerConfig> load_logger_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return logger_config_from_stream(f);
}

} // namespace lapseg
