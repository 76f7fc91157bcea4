#pragma once

/**
 * @file mpsc_ring_buffer.hpp
 * @brief Bounded, lock-free, multi-producer single-consumer ring buffer used
 * as the export pipeline's span and log queue.
 *
 * Producers on any thread call `try_emplace`; only the pipeline's flush path
 * calls `try_pop`. A full buffer rejects the new item (drop-new), which is
 * what lets instrumentation calls return immediately regardless of how far
 * behind the exporter is.
 *
 * Synchronization:
 * - `_tail` is advanced by producers with a relaxed CAS. It only reserves a
 *   slot; the item is published by the slot's ready flag.
 * - A producer constructs the item in its slot, then stores the slot's ready
 *   flag with release. The consumer loads it with acquire before reading.
 * - The consumer advances `_head` with release after destroying the item;
 *   producers read `_head` with acquire to check for free space.
 *
 * Capacity is rounded up to the next power of two (minimum 2) so that slot
 * indices are computed with a mask.
 */

#include <atomic>
#include <cstddef>
#include <new>
#include <stdexcept>
#include <utility>

namespace Sonar::detail {

#ifdef __cpp_lib_hardware_interference_size
inline constexpr size_t kCacheLineSize =
    std::hardware_destructive_interference_size;
#else
inline constexpr size_t kCacheLineSize = 64;
#endif

// Smallest power of two >= n, never less than 2.
inline size_t next_power_of_two(size_t n) {
  if (n <= 1) {
    return 2;
  }
  size_t v = n - 1;
  v |= v >> 1;
  v |= v >> 2;
  v |= v >> 4;
  v |= v >> 8;
  v |= v >> 16;
  if constexpr (sizeof(size_t) > 4) {
    v |= v >> 32;
  }
  return v + 1;
}

template <typename T> class MpscRingBuffer {
public:
  explicit MpscRingBuffer(size_t capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("Capacity cannot be zero.");
    }
    _capacity = next_power_of_two(capacity);
    _mask = _capacity - 1;
    _buffer = static_cast<T *>(::operator new(_capacity * sizeof(T)));
    _ready_flags = new std::atomic<bool>[_capacity]();
  }

  ~MpscRingBuffer() {
    // Destroy whatever was published but never consumed.
    size_t head = _head.load(std::memory_order_relaxed);
    const size_t tail = _tail.load(std::memory_order_relaxed);
    for (; head != tail; ++head) {
      if (_ready_flags[head & _mask].load(std::memory_order_acquire)) {
        _buffer[head & _mask].~T();
      }
    }
    ::operator delete(_buffer);
    delete[] _ready_flags;
  }

  MpscRingBuffer(const MpscRingBuffer &) = delete;
  MpscRingBuffer &operator=(const MpscRingBuffer &) = delete;

  /**
   * @brief Constructs an item and publishes it. Returns false without
   * blocking when the buffer is full.
   */
  template <typename... Args> bool try_emplace(Args &&...args) {
    // Build the item before touching shared state so a throwing constructor
    // leaves the buffer consistent.
    T item(std::forward<Args>(args)...);

    size_t ticket = _tail.load(std::memory_order_relaxed);
    while (true) {
      const size_t head = _head.load(std::memory_order_acquire);
      if (ticket - head >= _capacity) {
        return false;
      }
      if (_tail.compare_exchange_weak(ticket, ticket + 1,
                                      std::memory_order_relaxed,
                                      std::memory_order_relaxed)) {
        break;
      }
      // ticket now holds the tail observed by the failed CAS.
    }

    new (&_buffer[ticket & _mask]) T(std::move(item));
    _ready_flags[ticket & _mask].store(true, std::memory_order_release);
    return true;
  }

  /**
   * @brief Moves the oldest published item into out_value. Returns false
   * when the buffer is empty or the oldest claimed slot is not yet published.
   * Must only be called from one thread at a time.
   */
  bool try_pop(T &out_value) {
    const size_t head = _head.load(std::memory_order_relaxed);
    if (head == _tail.load(std::memory_order_relaxed)) {
      return false;
    }
    if (!_ready_flags[head & _mask].load(std::memory_order_acquire)) {
      return false;
    }

    out_value = std::move(_buffer[head & _mask]);
    _buffer[head & _mask].~T();
    _ready_flags[head & _mask].store(false, std::memory_order_relaxed);
    _head.store(head + 1, std::memory_order_release);
    return true;
  }

  // Number of claimed slots. Racy by nature; only used to decide when to wake
  // the flush thread early.
  size_t size_approx() const {
    const size_t tail = _tail.load(std::memory_order_relaxed);
    const size_t head = _head.load(std::memory_order_relaxed);
    return tail >= head ? tail - head : 0;
  }

  size_t capacity() const { return _capacity; }

private:
  alignas(kCacheLineSize) std::atomic<size_t> _head{0};
  alignas(kCacheLineSize) std::atomic<size_t> _tail{0};

  size_t _capacity;
  size_t _mask;
  T *_buffer;
  std::atomic<bool> *_ready_flags;
};

} // namespace Sonar::detail
