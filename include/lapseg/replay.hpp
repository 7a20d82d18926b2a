#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <lapseg/sample.hpp>
#include <lapseg/source.hpp>

namespace lapseg {

// All vehicles recorded at one instant.
struct ReplayFrame {
  double t = 0.0;
  std::optional<TelemetrySample> player;
  std::vector<TelemetrySample> opponents;
};

// Recording loader. First non-comment line is the header; it must contain a
// "t" column (seconds). Rows sharing t form one frame. A row is the local
// driver when its control is 0, or when the recording has no control column.
std::vector<ReplayFrame> replay_frames_from_csv_stream(std::istream& in);
std::optional<std::vector<ReplayFrame>> load_replay_csv(const std::string& path);

// Plays a recording as both the process probe and the telemetry source.
// The process counts as present until the recording is exhausted.
class ReplaySource final : public ProcessProbe, public TelemetrySource {
public:
  explicit ReplaySource(std::vector<ReplayFrame> frames) : frames_(std::move(frames)) {}

  // Step to the next frame; false once past the end.
  bool next_frame();
  // Jump to the last frame at or before first_t + playback_s. Returns its time.
  double advance_to(double playback_s);

  double frame_time() const;
  std::size_t frame_count() const { return frames_.size(); }
  std::size_t cursor() const { return cursor_; }
  bool exhausted() const { return exhausted_; }

  bool is_running() override { return !exhausted_; }
  bool is_available() override { return started_ && cursor_ < frames_.size(); }
  std::optional<TelemetrySample> read() override;
  std::vector<TelemetrySample> read_opponents() override;

private:
  std::vector<ReplayFrame> frames_;
  std::size_t cursor_{0};
  bool started_{false};
  bool exhausted_{false};
};

} // namespace lapseg
