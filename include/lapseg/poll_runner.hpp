#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <thread>
#include <lapseg/lap.hpp>
#include <lapseg/poller.hpp>
#include <lapseg/status_buffer.hpp>

namespace lapseg {

// Owns the polling thread: ticks the orchestrator, hands finished laps to the
// sink and publishes a status copy for the presentation thread.
class PollRunner {
public:
  // Called on the polling thread; a slow sink delays the next tick.
  using LapSink = std::function<void(const LapEvent&)>;
  // Maps wall seconds since start() to the tick timestamp (replay pacing).
  using TimeSource = std::function<double(double wall_s)>;

  explicit PollRunner(PollOrchestrator& orch, double poll_interval_s = 0.01)
    : orch_(orch), poll_interval_s_(poll_interval_s > 0.0 ? poll_interval_s : 0.01) {}
  ~PollRunner() { stop(); }
  PollRunner(const PollRunner&) = delete;
  PollRunner& operator=(const PollRunner&) = delete;

  // Set before start().
  void set_lap_sink(LapSink sink) { sink_ = std::move(sink); }
  void set_time_source(TimeSource ts) { time_source_ = std::move(ts); }

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Control surface, safe from any thread.
  void pause() { orch_.pause(); }
  void resume() { orch_.resume(); }
  bool paused() const { return orch_.is_paused(); }

  const StatusBuffer& status() const { return status_; }
  std::uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
  std::uint64_t laps_delivered() const { return laps_delivered_.load(std::memory_order_relaxed); }

private:
  void thread_main_();

  PollOrchestrator& orch_;
  double poll_interval_s_;
  LapSink sink_;
  TimeSource time_source_;

  std::thread th_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> laps_delivered_{0};
  StatusBuffer status_;
};

} // namespace lapseg
