#include <lapseg/opponents.hpp>
#include <lapseg/log.hpp>
#include <lapseg/normalizer.hpp>
#include <lapseg/sectors.hpp>

namespace lapseg {

bool OpponentTracker::should_track(ControlType c) const {
  switch (c) {
    case ControlType::Remote:      return true;
    case ControlType::AI:          return params_.track_ai || !params_.track_remote_only;
    case ControlType::Nobody:
    case ControlType::LocalPlayer:
    case ControlType::Replay:      return false;
  }
  return false;
}

OpponentTracker::Handle OpponentTracker::handle_for_(const std::string& driver_name,
                                                     std::optional<double> timestamp) {
  auto it = index_.find(driver_name);
  if (it != index_.end()) return it->second;
  OpponentState st;
  st.driver_name = driver_name;
  st.lap_start_ts = timestamp;
  states_.push_back(std::move(st));
  const Handle h = states_.size() - 1;
  index_.emplace(driver_name, h);
  LAPSEG_LOGD("opponents", "tracking %s", driver_name.c_str());
  return h;
}

OpponentLap OpponentTracker::make_lap_(const OpponentState& st, const TelemetrySample& s,
                                       double lap_time) const {
  OpponentLap lap;
  lap.driver_name = st.driver_name;
  lap.lap = st.current_lap;
  lap.lap_time_s = lap_time;
  lap.is_fastest = true;
  LapBuffer buf;
  buf.reserve(st.samples.size());
  for (const auto& raw : st.samples) buf.push_back(normalize(raw));
  lap.samples = sorted_for_export(buf);
  lap.sectors = detect_sector_boundaries(st.samples, track_length_m_);
  // Metadata comes from the frame that closed the lap.
  lap.position = s.position;
  lap.vehicle = s.vehicle;
  return lap;
}

std::vector<OpponentLap> OpponentTracker::update_opponent(const TelemetrySample& s,
                                                          std::optional<double> timestamp) {
  std::vector<OpponentLap> out;
  if (s.driver_name.empty()) return out;
  if (!should_track(s.control)) return out;

  OpponentState& st = states_[handle_for_(s.driver_name, timestamp)];
  const int lap = s.lap.value_or(0);

  if (lap > st.current_lap && st.current_lap > 0) {
    // The in-lap timer already belongs to the new lap; the completed lap's
    // duration is only in the last-lap field.
    const double lap_time = s.last_lap_time_s.value_or(0.0);
    if (lap_time > 0.0) {
      const bool first = (st.fastest_lap_time_s == std::numeric_limits<double>::infinity());
      if (first || lap_time < st.fastest_lap_time_s) {
        st.fastest_lap_time_s = lap_time;
        out.push_back(make_lap_(st, s, lap_time));
        LAPSEG_LOGI("opponents", "%s lap %d %.3fs (fastest)",
                    st.driver_name.c_str(), st.current_lap, lap_time);
      }
    } else {
      LAPSEG_LOGD("opponents", "%s lap %d has no valid time, discarded",
                  st.driver_name.c_str(), st.current_lap);
    }
    st.samples.clear();
    st.lap_start_ts = timestamp;
  }

  st.current_lap = lap;
  if (lap > 0) st.samples.push_back(s);
  return out;
}

std::optional<OpponentState> OpponentTracker::opponent_status(const std::string& driver_name) const {
  auto it = index_.find(driver_name);
  if (it == index_.end()) return std::nullopt;
  return states_[it->second];
}

void OpponentTracker::reset() {
  states_.clear();
  index_.clear();
}

} // namespace lapseg
