#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>

namespace rack_guard::device {

// Bounded lock-free ring. Any number of producers may call try_push from
// delivery callbacks: it never blocks and never allocates. A single worker
// drains it with wait_pop, which blocks until a record arrives or the ring
// is closed.
template <typename T>
class CommandRing {
 public:
  static_assert(std::is_trivially_copyable_v<T>, "ring records must be trivially copyable");

  explicit CommandRing(const std::size_t capacity) : capacity_(round_up_pow2(capacity)), mask_(capacity_ - 1) {
    cells_ = std::make_unique<Cell[]>(capacity_);
    for (std::size_t i = 0; i < capacity_; ++i) {
      cells_[i].sequence.store(i, std::memory_order_relaxed);
    }
  }

  CommandRing(const CommandRing&) = delete;
  CommandRing& operator=(const CommandRing&) = delete;

  bool try_push(const T& value) noexcept {
    if (closed_.load(std::memory_order_acquire)) {
      return false;
    }

    std::size_t pos = enqueue_pos_.load(std::memory_order_relaxed);
    Cell* cell = nullptr;
    while (true) {
      cell = &cells_[pos & mask_];
      const std::size_t seq = cell->sequence.load(std::memory_order_acquire);
      const auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos);
      if (diff == 0) {
        if (enqueue_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          break;
        }
      } else if (diff < 0) {
        return false;
      } else {
        pos = enqueue_pos_.load(std::memory_order_relaxed);
      }
    }

    cell->data = value;
    cell->sequence.store(pos + 1, std::memory_order_release);

    signal_.fetch_add(1, std::memory_order_release);
    signal_.notify_one();
    return true;
  }

  bool try_pop(T& value) noexcept {
    std::size_t pos = dequeue_pos_.load(std::memory_order_relaxed);
    Cell* cell = nullptr;
    while (true) {
      cell = &cells_[pos & mask_];
      const std::size_t seq = cell->sequence.load(std::memory_order_acquire);
      const auto diff = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos + 1);
      if (diff == 0) {
        if (dequeue_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          break;
        }
      } else if (diff < 0) {
        return false;
      } else {
        pos = dequeue_pos_.load(std::memory_order_relaxed);
      }
    }

    value = cell->data;
    cell->sequence.store(pos + mask_ + 1, std::memory_order_release);
    return true;
  }

  // Returns false once the ring is closed and drained.
  bool wait_pop(T& value) noexcept {
    while (true) {
      const std::uint32_t seen = signal_.load(std::memory_order_acquire);
      if (try_pop(value)) {
        return true;
      }
      if (closed_.load(std::memory_order_acquire)) {
        return false;
      }
      signal_.wait(seen, std::memory_order_acquire);
    }
  }

  void close() noexcept {
    closed_.store(true, std::memory_order_release);
    signal_.fetch_add(1, std::memory_order_release);
    signal_.notify_all();
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

  [[nodiscard]] std::size_t size() const noexcept {
    const std::size_t head = dequeue_pos_.load(std::memory_order_acquire);
    const std::size_t tail = enqueue_pos_.load(std::memory_order_acquire);
    return tail >= head ? tail - head : 0;
  }

 private:
  struct Cell {
    std::atomic<std::size_t> sequence{0};
    T data{};
  };

  static std::size_t round_up_pow2(std::size_t value) noexcept {
    std::size_t result = 2;
    while (result < value) {
      result <<= 1U;
    }
    return result;
  }

  std::size_t capacity_;
  std::size_t mask_;
  std::unique_ptr<Cell[]> cells_;
  alignas(64) std::atomic<std::size_t> enqueue_pos_{0};
  alignas(64) std::atomic<std::size_t> dequeue_pos_{0};
  std::atomic<std::uint32_t> signal_{0};
  std::atomic<bool> closed_{false};
};

}  // namespace rack_guard::device
