#include "sonar/sonar.hpp"
#include "sonar/context/context_stack.hpp"
#include "sonar/exporter/exporter_factory.hpp"
#include "sonar/logging/internal_log.hpp"
#include "sonar/span_state.hpp"
#include "sonar/tracer.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace Sonar {

// --- Span Implementation ---
bool Span::is_recording() const {
  return _state && !_state->ended.load(std::memory_order_acquire);
}

TraceId Span::trace_id() const {
  return _state ? _state->data.trace_id : kInvalidTraceId;
}

SpanId Span::span_id() const {
  return _state ? _state->data.span_id : kInvalidSpanId;
}

std::optional<SpanId> Span::parent_span_id() const {
  if (!_state) {
    return std::nullopt;
  }
  return _state->data.parent_span_id;
}

std::string Span::name() const {
  return _state ? _state->data.name : std::string();
}

SpanKind Span::kind() const {
  return _state ? _state->data.kind : SpanKind::kInternal;
}

SpanStatus Span::status() const {
  if (!_state) {
    return SpanStatus::kUnset;
  }
  std::lock_guard<std::mutex> lock(_state->mutex);
  return _state->data.status;
}

std::optional<std::string> Span::tag(std::string_view key) const {
  if (!_state) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(_state->mutex);
  for (const auto &[k, v] : _state->data.tags) {
    if (k == key) {
      return v;
    }
  }
  return std::nullopt;
}

void Span::set_tag(std::string_view key, std::string_view value) {
  if (!_state) {
    return;
  }
  std::lock_guard<std::mutex> lock(_state->mutex);
  if (_state->ended.load(std::memory_order_relaxed)) {
    return;
  }
  auto &tags = _state->data.tags;
  auto it = std::find_if(tags.begin(), tags.end(),
                         [&](const Tag &tag) { return tag.first == key; });
  if (it != tags.end()) {
    it->second = std::string(value);
  } else {
    tags.emplace_back(std::string(key), std::string(value));
  }
}

void Span::set_status(SpanStatus status, std::string_view description) {
  if (!_state) {
    return;
  }
  std::lock_guard<std::mutex> lock(_state->mutex);
  if (_state->ended.load(std::memory_order_relaxed)) {
    return;
  }
  _state->data.status = status;
  _state->data.status_description =
      status == SpanStatus::kError ? std::string(description) : std::string();
}

void Span::end() {
  if (!_state) {
    return;
  }
  if (auto tracer = _state->tracer.lock()) {
    tracer->end_span(*this);
    return;
  }
  // The pipeline that started this span is gone; freeze it and discard.
  std::lock_guard<std::mutex> lock(_state->mutex);
  _state->ended.store(true, std::memory_order_release);
}

std::string Span::traceparent() const {
  if (!_state) {
    return {};
  }
  return "00-" + trace_id().to_hex() + "-" + span_id().to_hex() + "-01";
}

// --- Global Tracer ---
namespace {
std::mutex g_tracer_mutex;
std::shared_ptr<detail::Tracer> g_tracer;

std::shared_ptr<detail::Tracer> active_tracer() {
  std::lock_guard<std::mutex> lock(g_tracer_mutex);
  return g_tracer;
}

// Swaps out the current tracer and shuts it down outside the lock.
void retire_tracer(std::shared_ptr<detail::Tracer> next) {
  std::shared_ptr<detail::Tracer> previous;
  {
    std::lock_guard<std::mutex> lock(g_tracer_mutex);
    previous = std::exchange(g_tracer, std::move(next));
  }
  if (previous) {
    previous->shutdown();
  }
}

// Drains the active tracer if the host exits without calling shutdown.
void shutdown_at_exit() {
  try {
    Sonar::shutdown();
  } catch (const std::exception &e) {
    logging::internal_logger()->error("Shutdown at exit failed: {}", e.what());
  }
}

void register_exit_shutdown() {
  static std::once_flag registered;
  std::call_once(registered, [] {
    if (std::atexit(shutdown_at_exit) != 0) {
      logging::internal_logger()->warn(
          "Could not register shutdown at exit; call Sonar::shutdown before "
          "returning from main");
    }
  });
}
} // namespace

// --- Setup ---
std::optional<ConfigError> initialize(const Options &options,
                                      std::unique_ptr<Exporter> exporter) {
  if (auto error = validate(options)) {
    return error;
  }
  if (!exporter) {
    return ConfigError{ConfigError::Code::kTransportSetup,
                       "Exporter must not be null"};
  }
  if (!logging::set_internal_level(options.internal_log_level)) {
    return ConfigError{ConfigError::Code::kInvalidOption,
                       "Unknown internal log level '" +
                           options.internal_log_level + "'"};
  }

  register_exit_shutdown();

  // The old pipeline drains before the new one accepts anything.
  retire_tracer(nullptr);
  const uint64_t generation = detail::advance_generation();
  auto tracer = std::make_shared<detail::Tracer>(options, std::move(exporter),
                                                 generation);
  tracer->start();
  retire_tracer(std::move(tracer));

  logging::internal_logger()->info(
      "Sonar initialized: service='{}' endpoint='{}' protocol={}",
      options.service_name, options.endpoint, to_string(options.protocol));
  return std::nullopt;
}

std::optional<ConfigError> initialize(const Options &options) {
  if (auto error = validate(options)) {
    return error;
  }
  std::unique_ptr<Exporter> exporter;
  try {
    exporter = exporter::make_otlp_exporter(options,
                                            *parse_endpoint(options.endpoint));
  } catch (const std::runtime_error &e) {
    return ConfigError{ConfigError::Code::kTransportSetup, e.what()};
  }
  return initialize(options, std::move(exporter));
}

std::optional<ConfigError> initialize(std::string_view service_name,
                                      std::string_view endpoint,
                                      std::string_view protocol,
                                      bool console_echo) {
  Options options;
  options.service_name = std::string(service_name);
  options.endpoint = std::string(endpoint);
  options.console_echo = console_echo;
  try {
    options.protocol = parse_protocol(protocol);
  } catch (const InvalidArgumentError &e) {
    return ConfigError{ConfigError::Code::kInvalidProtocol, e.what()};
  }
  return initialize(options);
}

bool is_initialized() { return active_tracer() != nullptr; }

bool force_flush(std::chrono::milliseconds timeout) {
  auto tracer = active_tracer();
  if (!tracer) {
    return false;
  }
  return tracer->force_flush(timeout);
}

void shutdown() {
  retire_tracer(nullptr);
  detail::advance_generation();
}

PipelineStats stats() {
  auto tracer = active_tracer();
  return tracer ? tracer->stats() : PipelineStats{};
}

// --- Spans ---
Span start_span(std::string_view name, SpanKind kind,
                const std::optional<Span> &parent) {
  auto tracer = active_tracer();
  if (!tracer) {
    logging::warn_uninitialized_once("start_span");
    return Span();
  }
  return tracer->start_span(name, kind, parent);
}

Span start_span(std::string_view name, std::string_view kind,
                const std::optional<Span> &parent) {
  return start_span(name, parse_span_kind(kind), parent);
}

void set_tag(Span &span, std::string_view key, std::string_view value) {
  span.set_tag(key, value);
}

void stop_span(const std::optional<Span> &span) {
  std::optional<Span> target =
      span ? span : detail::this_thread_stack().current();
  if (target) {
    target->end();
  }
}

std::optional<Span> current_span() { return context::current_span(); }

// --- Logs ---
void write_log(std::string_view message, Severity severity,
               const std::optional<ErrorInfo> &error,
               const std::optional<Span> &span) {
  auto tracer = active_tracer();
  if (tracer) {
    tracer->write_log(message, severity, error, span);
    return;
  }

  logging::warn_uninitialized_once("write_log");
  auto fallback = logging::fallback_logger();
  const auto level = logging::to_spdlog_level(severity);
  if (error) {
    fallback->log(level, "{} ({}: {})", message, error->type, error->message);
  } else {
    fallback->log(level, "{}", message);
  }
}

} // namespace Sonar
