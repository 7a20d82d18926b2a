#include <lapseg/replay.hpp>
#include <fstream>
#include <lapseg/csv.hpp>
#include <lapseg/log.hpp>

namespace lapseg {

std::vector<ReplayFrame> replay_frames_from_csv_stream(std::istream& in) {
  std::vector<ReplayFrame> frames;
  std::vector<std::string> header;
  SourceSchema schema = SourceSchema::SharedMemory;
  std::size_t t_col = 0;
  bool has_control = false;
  std::string line;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;
    auto cols = split_csv_line(raw);

    if (header.empty()) {
      header = cols;
      bool found_t = false;
      for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == "t") { t_col = i; found_t = true; }
      }
      if (!found_t) {
        LAPSEG_LOGE("replay", "header has no 't' column");
        return {};
      }
      schema = schema_for_header(header);
      const std::string control_key = (schema == SourceSchema::ExportColumns) ? "Control [int]" : "control";
      for (const auto& h : header) if (h == control_key) has_control = true;
      continue;
    }

    const auto t = (t_col < cols.size()) ? parse_double(cols[t_col]) : std::nullopt;
    if (!t) {
      LAPSEG_LOGW("replay", "line %d: missing timestamp, skipped", line_no);
      continue;
    }

    FieldMap fields;
    for (std::size_t i = 0; i < header.size() && i < cols.size(); ++i) {
      if (i == t_col || cols[i].empty()) continue;
      fields[header[i]] = cols[i];
    }
    TelemetrySample s = adapt_sample(fields, schema);

    if (frames.empty() || frames.back().t != *t) {
      ReplayFrame f;
      f.t = *t;
      frames.push_back(std::move(f));
    }
    ReplayFrame& f = frames.back();
    const bool is_player = !has_control || s.control == ControlType::LocalPlayer;
    if (is_player) f.player = std::move(s);
    else f.opponents.push_back(std::move(s));
  }
  return frames;
}

std::optional<std::vector<ReplayFrame>> load_replay_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return replay_frames_from_csv_stream(f);
}

bool ReplaySource::next_frame() {
  if (exhausted_) return false;
  if (!started_) {
    started_ = true;
    cursor_ = 0;
  } else {
    ++cursor_;
  }
  if (cursor_ >= frames_.size()) {
    exhausted_ = true;
    return false;
  }
  return true;
}

double ReplaySource::advance_to(double playback_s) {
  if (exhausted_ || frames_.empty()) {
    exhausted_ = true;
    return frames_.empty() ? playback_s : frames_.back().t;
  }
  if (!started_) {
    started_ = true;
    cursor_ = 0;
  }
  const double target = frames_.front().t + playback_s;
  if (cursor_ + 1 == frames_.size() && target > frames_.back().t) {
    exhausted_ = true;
    return frames_.back().t;
  }
  while (cursor_ + 1 < frames_.size() && frames_[cursor_ + 1].t <= target) ++cursor_;
  return frames_[cursor_].t;
}

double ReplaySource::frame_time() const {
  if (frames_.empty()) return 0.0;
  return frames_[cursor_ < frames_.size() ? cursor_ : frames_.size() - 1].t;
}

std::optional<TelemetrySample> ReplaySource::read() {
  if (!is_available()) return std::nullopt;
  return frames_[cursor_].player;
}

std::vector<TelemetrySample> ReplaySource::read_opponents() {
  if (!is_available()) return {};
  return frames_[cursor_].opponents;
}

} // namespace lapseg
