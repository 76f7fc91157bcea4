#pragma once

#include "sonar_common_types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Sonar {

namespace detail {
struct SpanState;
class Tracer;
} // namespace detail

// --- Span Handle ---
/**
 * @brief Shared handle to a span.
 *
 * Copies refer to the same span, so a handle may be passed to another thread
 * as an explicit parent, or stopped from a thread other than the one that
 * started it. A default-constructed Span is the no-op span: every operation
 * on it does nothing, and it is what start_span returns before
 * Sonar::initialize has succeeded.
 *
 * Once a span is stopped it is immutable. set_tag and set_status on a stopped
 * span are silently ignored; they never throw, so that instrumentation cannot
 * break the code it observes.
 */
class Span {
public:
  Span() = default;

  bool is_noop() const { return _state == nullptr; }
  // True while the span is open. Always false for the no-op span.
  bool is_recording() const;

  TraceId trace_id() const;
  SpanId span_id() const;
  std::optional<SpanId> parent_span_id() const;
  std::string name() const;
  SpanKind kind() const;
  SpanStatus status() const;
  std::optional<std::string> tag(std::string_view key) const;

  // Last write wins. No-op once stopped.
  void set_tag(std::string_view key, std::string_view value);
  void set_status(SpanStatus status, std::string_view description = {});

  // Idempotent. Equivalent to Sonar::stop_span(*this).
  void end();

  // W3C trace context header value, "00-<trace-id>-<span-id>-01".
  std::string traceparent() const;

  bool operator==(const Span &other) const { return _state == other._state; }

private:
  friend class detail::Tracer;
  explicit Span(std::shared_ptr<detail::SpanState> state)
      : _state(std::move(state)) {}

  std::shared_ptr<detail::SpanState> _state;
};

/**
 * @brief Stops the held span when the scope exits.
 */
class ScopedSpan {
public:
  explicit ScopedSpan(Span span) : _span(std::move(span)) {}
  ~ScopedSpan() { _span.end(); }

  ScopedSpan(const ScopedSpan &) = delete;
  ScopedSpan &operator=(const ScopedSpan &) = delete;

  Span *operator->() { return &_span; }
  const Span &get() const { return _span; }

private:
  Span _span;
};

/**
 * @brief Counters of the active export pipeline. All zero when
 * uninitialized.
 */
struct PipelineStats {
  uint64_t spans_enqueued = 0;
  uint64_t spans_exported = 0;
  // Rejected because the queue was full, or the pipeline stopped.
  uint64_t spans_dropped = 0;
  // Given up on after the retry budget was spent.
  uint64_t spans_lost = 0;
  uint64_t logs_enqueued = 0;
  uint64_t logs_exported = 0;
  uint64_t logs_dropped = 0;
  uint64_t logs_lost = 0;
  uint64_t export_attempts = 0;
};

} // namespace Sonar
