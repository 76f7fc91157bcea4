#pragma once

// This is the primary include file for using the Sonar tracing library.
// It declares the top-level API and the SONAR_SPAN convenience macro.
#include "sonar_common_types.hpp"
#include "sonar_context.hpp"
#include "sonar_core.hpp"
#include "sonar_errors.hpp"
#include "sonar_exporter.hpp"
#include "sonar_options.hpp"
#include "sonar_records.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

namespace Sonar {

// --- Setup ---

/**
 * @brief Validates the options, builds the OTLP exporter for the configured
 * protocol and starts a fresh export pipeline. Any pipeline that was already
 * running is shut down first; spans it started are discarded when stopped.
 *
 * @return std::nullopt on success, otherwise the configuration error. This
 * is the only call in the library that reports failure to its caller.
 */
std::optional<ConfigError> initialize(const Options &options);

// Same as above, with a caller-provided transport in place of OTLP.
std::optional<ConfigError> initialize(const Options &options,
                                      std::unique_ptr<Exporter> exporter);

// String form used by scripting front ends. An unknown protocol yields
// ConfigError::Code::kInvalidProtocol.
std::optional<ConfigError> initialize(std::string_view service_name,
                                      std::string_view endpoint,
                                      std::string_view protocol,
                                      bool console_echo);

bool is_initialized();

// Drains everything buffered so far. Returns false if some records could
// not be exported within the timeout.
bool force_flush(std::chrono::milliseconds timeout = std::chrono::seconds(10));

// Final flush (bounded by Options::shutdown_timeout), then releases the
// transport. Later calls behave as uninitialized. Idempotent. Runs at exit
// as well when the host returns from main without calling it.
void shutdown();

PipelineStats stats();

// --- Spans ---

/**
 * @brief Starts a span and makes it current on the calling thread.
 *
 * The parent defaults to the calling thread's current span. A span with a
 * parent shares its trace id; otherwise a new trace is started.
 */
Span start_span(std::string_view name, SpanKind kind = SpanKind::kInternal,
                const std::optional<Span> &parent = std::nullopt);

// Throws InvalidArgumentError when `kind` names no SpanKind.
Span start_span(std::string_view name, std::string_view kind,
                const std::optional<Span> &parent = std::nullopt);

// No-op on a stopped span.
void set_tag(Span &span, std::string_view key, std::string_view value);

// Stops the given span, or the current one when none is given. Idempotent.
void stop_span(const std::optional<Span> &span = std::nullopt);

std::optional<Span> current_span();

// --- Logs ---

/**
 * @brief Records a log entry, correlated to `span` (default: the current
 * span) when that span is open. Before initialization the record goes to
 * the local fallback sink on stderr.
 */
void write_log(std::string_view message,
               Severity severity = Severity::kInformation,
               const std::optional<ErrorInfo> &error = std::nullopt,
               const std::optional<Span> &span = std::nullopt);

// --- Helper Macros ---
#define SONAR_CONCAT_IMPL(a, b) a##b
#define SONAR_CONCAT(a, b) SONAR_CONCAT_IMPL(a, b)

// Starts a span that stops at the end of the enclosing scope.
//   SONAR_SPAN("load_config");
//   SONAR_SPAN("fetch", Sonar::SpanKind::kClient);
#define SONAR_SPAN(...)                                                        \
  Sonar::ScopedSpan SONAR_CONCAT(sonar_span_, __LINE__)(                       \
      Sonar::start_span(__VA_ARGS__))

} // namespace Sonar
