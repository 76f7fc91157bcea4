#include "sonar/tracer.hpp"
#include "sonar/context/context_stack.hpp"
#include "sonar/exporter/console_echo.hpp"
#include "sonar/helpers/id_generator.hpp"
#include "sonar/logging/internal_log.hpp"
#include "sonar/span_state.hpp"

#include <utility>

namespace Sonar::detail {

Tracer::Tracer(Options options, std::unique_ptr<Exporter> exporter,
               uint64_t generation)
    : _options(std::move(options)), _generation(generation),
      _pipeline(_options, std::move(exporter)) {}

Tracer::~Tracer() { shutdown(); }

void Tracer::start() { _pipeline.start(); }

uint64_t Tracer::get_timestamp() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Span Tracer::start_span(std::string_view name, SpanKind kind,
                        const std::optional<Span> &parent) {
  auto &stack = this_thread_stack();
  std::optional<Span> effective_parent = parent;
  if (!effective_parent || effective_parent->is_noop()) {
    effective_parent = stack.current();
  }

  SpanData data;
  if (effective_parent) {
    data.trace_id = effective_parent->trace_id();
    data.parent_span_id = effective_parent->span_id();
  } else {
    data.trace_id = generate_trace_id();
  }
  data.span_id = generate_span_id();
  data.name = std::string(name);
  data.kind = kind;
  data.start_time_unix_nano = get_timestamp();

  Span span(std::make_shared<SpanState>(std::move(data), weak_from_this(),
                                        _generation));
  stack.push(span);
  return span;
}

void Tracer::end_span(const Span &span) {
  auto &state = *span._state;
  SpanData finished;
  {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.ended.load(std::memory_order_relaxed)) {
      return;
    }
    state.data.end_time_unix_nano = get_timestamp();
    state.ended.store(true, std::memory_order_release);
    finished = state.data;
  }

  this_thread_stack().pop(span);

  if (_options.console_echo) {
    exporter::echo_span(finished);
  }
  _pipeline.enqueue(std::move(finished));
}

void Tracer::write_log(std::string_view message, Severity severity,
                       const std::optional<ErrorInfo> &error,
                       const std::optional<Span> &span) {
  if (severity < _options.min_severity) {
    return;
  }

  LogRecord record;
  record.time_unix_nano = get_timestamp();
  record.severity = severity;
  record.message = std::string(message);
  record.error = error;

  const std::optional<Span> target =
      span ? span : this_thread_stack().current();
  if (target && target->is_recording()) {
    record.trace_id = target->trace_id();
    record.span_id = target->span_id();
  }

  if (_options.console_echo) {
    exporter::echo_log(record);
  }
  _pipeline.enqueue(std::move(record));
}

bool Tracer::force_flush(std::chrono::milliseconds timeout) {
  return _pipeline.force_flush(timeout);
}

bool Tracer::shutdown() { return _pipeline.shutdown(); }

} // namespace Sonar::detail
