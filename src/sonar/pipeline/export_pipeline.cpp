#include "sonar/pipeline/export_pipeline.hpp"
#include "sonar/logging/internal_log.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace Sonar::detail {

ExportPipeline::ExportPipeline(const Options &options,
                               std::unique_ptr<Exporter> exporter)
    : _max_batch_size(options.max_export_batch_size),
      _schedule_delay(options.schedule_delay),
      _shutdown_timeout(options.shutdown_timeout),
      _max_attempts(options.max_attempts),
      _initial_backoff(options.initial_backoff),
      _max_backoff(options.max_backoff), _exporter(std::move(exporter)),
      _spans(options.max_queue_size), _logs(options.max_queue_size) {
  if (!_exporter) {
    throw std::invalid_argument("ExportPipeline requires an exporter");
  }
}

ExportPipeline::~ExportPipeline() { shutdown(); }

void ExportPipeline::start() {
  State expected = State::kConfigured;
  if (!_state.compare_exchange_strong(expected, State::kRunning,
                                      std::memory_order_acq_rel)) {
    return;
  }
  _worker = std::thread([this] { run(); });
  logging::internal_logger()->debug(
      "Export pipeline running (batch={}, delay={}ms, attempts={})",
      _max_batch_size, _schedule_delay.count(), _max_attempts);
}

bool ExportPipeline::enqueue(SpanData &&span) {
  if (state() != State::kRunning ||
      !_spans.buffer.try_emplace(std::move(span))) {
    if (_spans.dropped.fetch_add(1, std::memory_order_relaxed) == 0 &&
        state() == State::kRunning) {
      logging::internal_logger()->warn(
          "Span queue full (capacity {}); dropping new spans",
          _spans.buffer.capacity());
    }
    return false;
  }
  _spans.enqueued.fetch_add(1, std::memory_order_relaxed);
  if (_spans.buffer.size_approx() >= _max_batch_size) {
    wake_early();
  }
  return true;
}

bool ExportPipeline::enqueue(LogRecord &&record) {
  if (state() != State::kRunning ||
      !_logs.buffer.try_emplace(std::move(record))) {
    if (_logs.dropped.fetch_add(1, std::memory_order_relaxed) == 0 &&
        state() == State::kRunning) {
      logging::internal_logger()->warn(
          "Log queue full (capacity {}); dropping new log records",
          _logs.buffer.capacity());
    }
    return false;
  }
  _logs.enqueued.fetch_add(1, std::memory_order_relaxed);
  if (_logs.buffer.size_approx() >= _max_batch_size) {
    wake_early();
  }
  return true;
}

// Only the producer that flips the flag touches the mutex, and only long
// enough to order the flag against the flush thread's predicate check.
void ExportPipeline::wake_early() {
  if (_flush_requested.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  { std::lock_guard<std::mutex> lock(_wake_mutex); }
  _wake_cv.notify_one();
}

void ExportPipeline::run() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(_wake_mutex);
      _wake_cv.wait_for(lock, _schedule_delay, [this] {
        return _stop_requested ||
               _flush_requested.load(std::memory_order_acquire);
      });
      if (_stop_requested) {
        break;
      }
    }
    _flush_requested.store(false, std::memory_order_release);

    std::unique_lock<std::timed_mutex> flush_lock(_flush_mutex,
                                                  std::try_to_lock);
    if (!flush_lock.owns_lock()) {
      // A force_flush is draining right now; this tick is redundant.
      continue;
    }
    flush_all(Clock::time_point::max());
  }

  bool ok = false;
  std::unique_lock<std::timed_mutex> flush_lock(_flush_mutex, std::defer_lock);
  if (flush_lock.try_lock_until(_shutdown_deadline)) {
    ok = flush_all(_shutdown_deadline);
  } else {
    logging::internal_logger()->warn(
        "Final flush skipped: a flush was still running at the shutdown "
        "deadline");
  }

  {
    std::lock_guard<std::mutex> lock(_done_mutex);
    _final_flush_done = true;
    _final_flush_ok = ok;
  }
  _done_cv.notify_all();
}

bool ExportPipeline::flush_all(Clock::time_point deadline) {
  bool ok = drain<SpanData>(_spans, deadline,
                            [this](const std::vector<SpanData> &batch) {
                              return _exporter->export_spans(batch);
                            });
  ok = drain<LogRecord>(_logs, deadline,
                        [this](const std::vector<LogRecord> &batch) {
                          return _exporter->export_logs(batch);
                        }) &&
       ok;
  return ok;
}

template <typename Record>
bool ExportPipeline::drain(
    Queue<Record> &queue, Clock::time_point deadline,
    const std::function<ExportResult(const std::vector<Record> &)> &send) {
  // Only what is buffered now; producers that keep writing during the drain
  // are left for the next flush.
  size_t budget = queue.buffer.size_approx();
  bool ok = true;
  std::vector<Record> batch;
  batch.reserve(std::min(budget, _max_batch_size));

  while (budget > 0) {
    batch.clear();
    Record record;
    while (batch.size() < _max_batch_size && budget > 0 &&
           queue.buffer.try_pop(record)) {
      batch.push_back(std::move(record));
      --budget;
    }
    if (batch.empty()) {
      break;
    }

    ExportResult result = ExportResult::kPermanentFailure;
    if (!_abandon.load(std::memory_order_acquire) && Clock::now() < deadline) {
      result = export_with_retry([&] { return send(batch); }, deadline);
    }

    if (result == ExportResult::kSuccess) {
      queue.exported.fetch_add(batch.size(), std::memory_order_relaxed);
    } else {
      queue.lost.fetch_add(batch.size(), std::memory_order_relaxed);
      logging::internal_logger()->warn("Dropped a batch of {} records",
                                       batch.size());
      ok = false;
    }

    if (batch.size() < _max_batch_size) {
      break;
    }
  }
  return ok;
}

ExportResult
ExportPipeline::export_with_retry(const std::function<ExportResult()> &attempt,
                                  Clock::time_point deadline) {
  auto backoff = _initial_backoff;
  for (int n = 1;; ++n) {
    _export_attempts.fetch_add(1, std::memory_order_relaxed);

    ExportResult result = ExportResult::kPermanentFailure;
    try {
      result = attempt();
    } catch (const std::exception &e) {
      // A throwing exporter must not take the flush thread down with it.
      logging::internal_logger()->error("Exporter threw: {}", e.what());
    }

    if (result != ExportResult::kRetryableFailure) {
      return result;
    }
    if (n >= _max_attempts) {
      logging::internal_logger()->warn("Export failed after {} attempts", n);
      return result;
    }
    logging::internal_logger()->debug(
        "Export attempt {}/{} failed; retrying in {}ms", n, _max_attempts,
        backoff.count());
    if (!wait_backoff(backoff, deadline)) {
      return result;
    }
    backoff = std::min(backoff * 2, _max_backoff);
  }
}

bool ExportPipeline::wait_backoff(std::chrono::milliseconds backoff,
                                  Clock::time_point deadline) {
  const auto now = Clock::now();
  const bool cut_by_deadline = deadline - now < backoff;
  const auto wake_at = cut_by_deadline ? deadline : now + backoff;

  std::unique_lock<std::mutex> lock(_done_mutex);
  if (_done_cv.wait_until(lock, wake_at, [this] {
        return _abandon.load(std::memory_order_acquire);
      })) {
    return false;
  }
  return !cut_by_deadline;
}

bool ExportPipeline::force_flush(std::chrono::milliseconds timeout) {
  const auto current = state();
  if (current != State::kRunning && current != State::kConfigured) {
    return false;
  }
  const auto deadline = Clock::now() + timeout;
  std::unique_lock<std::timed_mutex> lock(_flush_mutex, std::defer_lock);
  if (!lock.try_lock_until(deadline)) {
    return false;
  }
  return flush_all(deadline);
}

bool ExportPipeline::shutdown() {
  std::lock_guard<std::mutex> guard(_shutdown_mutex);
  if (state() == State::kStopped) {
    return _final_flush_ok;
  }

  _shutdown_deadline = Clock::now() + _shutdown_timeout;
  _state.store(State::kDraining, std::memory_order_release);

  bool ok = false;
  if (_worker.joinable()) {
    {
      std::lock_guard<std::mutex> lock(_wake_mutex);
      _stop_requested = true;
    }
    _wake_cv.notify_all();

    {
      std::unique_lock<std::mutex> lock(_done_mutex);
      if (!_done_cv.wait_until(lock, _shutdown_deadline,
                               [this] { return _final_flush_done; })) {
        _abandon.store(true, std::memory_order_release);
        logging::internal_logger()->warn(
            "Shutdown timeout of {}ms expired; abandoning pending exports",
            _shutdown_timeout.count());
      }
    }
    _done_cv.notify_all();
    if (_abandon.load(std::memory_order_acquire)) {
      // Interrupt the export the flush thread may be blocked in.
      try {
        _exporter->cancel();
      } catch (const std::exception &e) {
        logging::internal_logger()->error("Exporter cancel threw: {}",
                                          e.what());
      }
    }
    _worker.join();
    // Anything the flush thread had in hand when time ran out is lost, even
    // if the final drain itself found nothing left to send.
    ok = _final_flush_ok && !_abandon.load(std::memory_order_acquire);
  } else {
    // Never started: flush on the caller's thread.
    std::unique_lock<std::timed_mutex> lock(_flush_mutex, std::defer_lock);
    ok = lock.try_lock_until(_shutdown_deadline) &&
         flush_all(_shutdown_deadline);
    std::lock_guard<std::mutex> done(_done_mutex);
    _final_flush_ok = ok;
  }

  try {
    _exporter->shutdown();
  } catch (const std::exception &e) {
    logging::internal_logger()->error("Exporter shutdown threw: {}", e.what());
  }
  _state.store(State::kStopped, std::memory_order_release);

  const auto s = stats();
  logging::internal_logger()->debug(
      "Export pipeline stopped: spans exported={} dropped={} lost={}, logs "
      "exported={} dropped={} lost={}",
      s.spans_exported, s.spans_dropped, s.spans_lost, s.logs_exported,
      s.logs_dropped, s.logs_lost);
  return ok;
}

PipelineStats ExportPipeline::stats() const {
  PipelineStats s;
  s.spans_enqueued = _spans.enqueued.load(std::memory_order_relaxed);
  s.spans_exported = _spans.exported.load(std::memory_order_relaxed);
  s.spans_dropped = _spans.dropped.load(std::memory_order_relaxed);
  s.spans_lost = _spans.lost.load(std::memory_order_relaxed);
  s.logs_enqueued = _logs.enqueued.load(std::memory_order_relaxed);
  s.logs_exported = _logs.exported.load(std::memory_order_relaxed);
  s.logs_dropped = _logs.dropped.load(std::memory_order_relaxed);
  s.logs_lost = _logs.lost.load(std::memory_order_relaxed);
  s.export_attempts = _export_attempts.load(std::memory_order_relaxed);
  return s;
}

} // namespace Sonar::detail
