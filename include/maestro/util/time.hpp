#pragma once

#include <fmt/format.h>

#include <chrono>
#include <ctime>
#include <string>

namespace maestro {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T12:30:45.123Z
[[nodiscard]] inline auto to_iso_string(TimePoint tp) -> std::string {
  auto secs = std::chrono::floor<std::chrono::seconds>(tp);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
  auto time = Clock::to_time_t(secs);
  std::tm tm{};
  gmtime_r(&time, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return fmt::format("{}.{:03}Z", buf, millis);
}

}  // namespace maestro
