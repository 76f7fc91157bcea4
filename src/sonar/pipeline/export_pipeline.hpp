#pragma once

#include "sonar/helpers/mpsc_ring_buffer.hpp"
#include "sonar/sonar_core.hpp"
#include "sonar/sonar_exporter.hpp"
#include "sonar/sonar_options.hpp"
#include "sonar/sonar_records.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace Sonar::detail {

/**
 * @brief Batches finished spans and log records and ships them through an
 * Exporter from a background thread.
 *
 * State machine: Configured -> Running -> Draining -> Stopped. (The
 * "uninitialized" state is the absence of a pipeline.)
 *
 * - enqueue never blocks. When a queue is full the new record is dropped and
 *   counted (drop-new). Records arriving after Stopped are discarded.
 * - The flush thread wakes every schedule_delay, or early once a queue holds
 *   a full batch. A tick that finds a flush already running is skipped.
 * - Each batch gets up to max_attempts export attempts with exponential
 *   backoff between retryable failures; then it is dropped and counted lost.
 * - shutdown performs a final flush bounded by shutdown_timeout; after that
 *   pending retries are abandoned, the export in flight is cancelled and
 *   the exporter is shut down.
 */
class ExportPipeline {
public:
  enum class State : uint8_t { kConfigured, kRunning, kDraining, kStopped };

  using Clock = std::chrono::steady_clock;

  ExportPipeline(const Options &options, std::unique_ptr<Exporter> exporter);
  ~ExportPipeline();

  ExportPipeline(const ExportPipeline &) = delete;
  ExportPipeline &operator=(const ExportPipeline &) = delete;

  // Configured -> Running. Starts the flush thread.
  void start();

  bool enqueue(SpanData &&span);
  bool enqueue(LogRecord &&record);

  // Exports everything buffered at the time of the call. Returns false if
  // anything was lost or the timeout expired first.
  bool force_flush(std::chrono::milliseconds timeout);

  // Returns true when the final flush exported everything. Idempotent.
  bool shutdown();

  State state() const { return _state.load(std::memory_order_acquire); }
  PipelineStats stats() const;

private:
  template <typename Record> struct Queue {
    explicit Queue(size_t capacity) : buffer(capacity) {}
    MpscRingBuffer<Record> buffer;
    std::atomic<uint64_t> enqueued{0};
    std::atomic<uint64_t> exported{0};
    std::atomic<uint64_t> dropped{0};
    std::atomic<uint64_t> lost{0};
  };

  void run();
  void wake_early();

  // Both queues; caller holds _flush_mutex.
  bool flush_all(Clock::time_point deadline);

  template <typename Record>
  bool drain(Queue<Record> &queue, Clock::time_point deadline,
             const std::function<ExportResult(const std::vector<Record> &)>
                 &send);

  ExportResult export_with_retry(
      const std::function<ExportResult()> &attempt, Clock::time_point deadline);

  // Sleeps for the backoff unless the deadline passes first or shutdown
  // abandons retries. Returns false if the sleep was cut short.
  bool wait_backoff(std::chrono::milliseconds backoff,
                    Clock::time_point deadline);

  const size_t _max_batch_size;
  const std::chrono::milliseconds _schedule_delay;
  const std::chrono::milliseconds _shutdown_timeout;
  const int _max_attempts;
  const std::chrono::milliseconds _initial_backoff;
  const std::chrono::milliseconds _max_backoff;

  std::unique_ptr<Exporter> _exporter;
  Queue<SpanData> _spans;
  Queue<LogRecord> _logs;
  std::atomic<uint64_t> _export_attempts{0};

  std::atomic<State> _state{State::kConfigured};

  // Serializes flushes: the timer path try-locks and skips when busy.
  std::timed_mutex _flush_mutex;

  // Wakes the flush thread.
  std::mutex _wake_mutex;
  std::condition_variable _wake_cv;
  std::atomic<bool> _flush_requested{false};
  bool _stop_requested = false;

  // Signals the end of the final flush, and interrupts backoff sleeps.
  std::mutex _done_mutex;
  std::condition_variable _done_cv;
  bool _final_flush_done = false;
  bool _final_flush_ok = true;
  std::atomic<bool> _abandon{false};
  Clock::time_point _shutdown_deadline;

  std::mutex _shutdown_mutex;
  std::thread _worker;
};

} // namespace Sonar::detail
