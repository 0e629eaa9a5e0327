#pragma once

#include <algorithm>
#include <atomic>
#include <bit>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace maestro {

// Fixed ring of formatted log lines between any number of logging threads
// and the single writer thread. Each cell carries a turn counter: a producer
// may fill cell i when turn == ticket, the writer may take it when
// turn == ticket + 1 (Vyukov's bounded queue).
class LogLineQueue {
public:
  explicit LogLineQueue(std::size_t capacity)
      : size_(std::bit_ceil(std::max<std::size_t>(capacity, 2))),
        cells_(std::make_unique<Cell[]>(size_)) {
    for (std::size_t i = 0; i < size_; ++i) {
      cells_[i].turn.store(i, std::memory_order_relaxed);
    }
  }

  LogLineQueue(const LogLineQueue&) = delete;
  auto operator=(const LogLineQueue&) -> LogLineQueue& = delete;

  // Takes the line only on success; when the ring is full the caller still
  // owns it and can write it out directly.
  [[nodiscard]] auto try_push(std::string& line) noexcept -> bool {
    auto ticket = write_pos_.load(std::memory_order_relaxed);
    while (true) {
      auto& cell = cells_[ticket & (size_ - 1)];
      auto turn = cell.turn.load(std::memory_order_acquire);
      if (turn == ticket) {
        if (write_pos_.compare_exchange_weak(ticket, ticket + 1,
                                             std::memory_order_acq_rel,
                                             std::memory_order_relaxed)) {
          cell.line.swap(line);
          cell.turn.store(ticket + 1, std::memory_order_release);
          return true;
        }
      } else if (turn < ticket) {
        return false;
      } else {
        ticket = write_pos_.load(std::memory_order_relaxed);
      }
    }
  }

  // Writer side. Appends up to max lines to out and returns how many.
  auto drain(std::vector<std::string>& out, std::size_t max) -> std::size_t {
    std::size_t taken = 0;
    while (taken < max) {
      auto& cell = cells_[read_pos_ & (size_ - 1)];
      if (cell.turn.load(std::memory_order_acquire) != read_pos_ + 1) {
        break;
      }
      out.push_back(std::move(cell.line));
      cell.line.clear();
      cell.turn.store(read_pos_ + size_, std::memory_order_release);
      ++read_pos_;
      ++taken;
    }
    return taken;
  }

  // Writer side, like drain().
  [[nodiscard]] auto empty() const noexcept -> bool {
    return write_pos_.load(std::memory_order_acquire) == read_pos_;
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t { return size_; }

private:
  struct Cell {
    std::atomic<std::size_t> turn{0};
    std::string line;
  };

  std::size_t size_;
  std::unique_ptr<Cell[]> cells_;
  alignas(64) std::atomic<std::size_t> write_pos_{0};
  // Only touched by the writer thread.
  alignas(64) std::size_t read_pos_{0};
};

}  // namespace maestro
