#pragma once

#include <chrono>
#include <cstdint>

namespace rack_guard::core {

// Command deadlines and telemetry windows all run on the steady clock.
inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline double monotonic_seconds_now() {
  return static_cast<double>(monotonic_timestamp_now_ns()) / 1e9;
}

template <typename Rep, typename Period>
std::uint64_t to_ns(const std::chrono::duration<Rep, Period> duration) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());
}

}  // namespace rack_guard::core
