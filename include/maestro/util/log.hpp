#pragma once

#include "maestro/core/line_queue.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace maestro::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m",  // error: red
      "",
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  if (name == "off") return Level::Off;
  return Level::Info;
}

struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() { buffer.reserve(4096); }
};

inline thread_local ThreadBuffer t_buffer;

// Async logger. Producers format into a thread-local buffer and hand the line
// to a writer thread through a bounded MPSC queue. Lines go to stderr so that
// command output on stdout stays machine readable.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  LogLineQueue queue_{kQueueCapacity};
  std::thread writer_;

  static auto write_batch(std::vector<std::string>& batch) -> void {
    for (const auto& msg : batch) {
      std::fputs(msg.c_str(), stderr);
    }
    batch.clear();
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      if (queue_.drain(batch, kBatchSize) == 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
        continue;
      }
      write_batch(batch);
    }

    // accepting_ is already false here, nothing new can arrive
    while (queue_.drain(batch, kBatchSize) > 0) {
      write_batch(batch);
    }
  }

public:
  Logger() = default;
  ~Logger() { stop(); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false))
      return;

    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, fmt::format_string<Args...> pattern, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    auto& buf = t_buffer.buffer;
    buf.clear();
    fmt::format_to(std::back_inserter(buf),
                   "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                   level_color(level), level_name(level), "\033[0m", tid,
                   fmt::format(pattern, std::forward<Args>(args)...));

    // Not started, shutting down, or queue full: write synchronously
    std::string line = buf;
    if (!accepting_.load(std::memory_order_acquire) ||
        !queue_.try_push(line)) {
      std::fputs(line.c_str(), stderr);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(fmt::format_string<Args...> pattern, Args&&... args) -> void {
  logger().log(Level::Trace, pattern, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(fmt::format_string<Args...> pattern, Args&&... args) -> void {
  logger().log(Level::Debug, pattern, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(fmt::format_string<Args...> pattern, Args&&... args) -> void {
  logger().log(Level::Info, pattern, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(fmt::format_string<Args...> pattern, Args&&... args) -> void {
  logger().log(Level::Warn, pattern, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(fmt::format_string<Args...> pattern, Args&&... args) -> void {
  logger().log(Level::Error, pattern, std::forward<Args>(args)...);
}

}  // namespace maestro::log
