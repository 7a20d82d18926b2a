#include <lapseg/poll_runner.hpp>
#include <chrono>
#include <exception>
#include <lapseg/log.hpp>

namespace lapseg {

void PollRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  orch_.start();
  th_ = std::thread(&PollRunner::thread_main_, this);
}

void PollRunner::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
  orch_.stop();
}

void PollRunner::thread_main_() {
  using clock = std::chrono::steady_clock;
  const auto tick = std::chrono::nanoseconds(static_cast<long long>(poll_interval_s_ * 1e9));
  const auto t0 = clock::now();
  auto next = t0;

  LAPSEG_LOGI("runner", "polling every %.1f ms", poll_interval_s_ * 1000.0);

  while (running_.load(std::memory_order_relaxed)) {
    const double wall_s = std::chrono::duration<double>(clock::now() - t0).count();
    const double now = time_source_ ? time_source_(wall_s) : wall_s;

    if (auto st = orch_.run_once(now)) status_.publish(*st);
    ticks_.fetch_add(1, std::memory_order_relaxed);

    for (const auto& ev : orch_.drain_events()) {
      laps_delivered_.fetch_add(1, std::memory_order_relaxed);
      if (!sink_) continue;
      try {
        sink_(ev);
      } catch (const std::exception& e) {
        LAPSEG_LOGE("runner", "lap sink failed: %s", e.what());
      }
    }

    next += tick;
    std::this_thread::sleep_until(next);
  }
  LAPSEG_LOGI("runner", "stopped after %llu ticks",
              static_cast<unsigned long long>(ticks_.load()));
}

} // namespace lapseg
