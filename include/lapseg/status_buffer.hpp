#pragma once
#include <cstdint>
#include <mutex>
#include <lapseg/poller.hpp>

namespace lapseg {

// Single-producer latest-only buffer. Readers get copies, never references
// into the producer's state.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    std::lock_guard<std::mutex> lk(m_);
    data_ = v;
    ++seq_;
  }

  // Copy out if the sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    std::lock_guard<std::mutex> lk(m_);
    if (seq_ == cursor) return false;
    out = data_;
    cursor = seq_;
    return true;
  }

  std::uint64_t sequence() const {
    std::lock_guard<std::mutex> lk(m_);
    return seq_;
  }

private:
  mutable std::mutex m_;
  T data_{};
  std::uint64_t seq_{0};
};

using StatusBuffer = LatestBuffer<PollStatus>;

} // namespace lapseg
