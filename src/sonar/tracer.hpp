#pragma once

#include "sonar/pipeline/export_pipeline.hpp"
#include "sonar/sonar_core.hpp"
#include "sonar/sonar_options.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace Sonar::detail {

/**
 * @brief One initialized instance of the library: the options it was
 * configured with, its export pipeline and its context generation.
 *
 * The facade holds the active Tracer in a shared_ptr. Spans keep a weak
 * reference to the Tracer that started them, so a span that outlives a
 * re-initialization is discarded instead of leaking into the new pipeline.
 */
class Tracer : public std::enable_shared_from_this<Tracer> {
public:
  Tracer(Options options, std::unique_ptr<Exporter> exporter,
         uint64_t generation);
  ~Tracer();

  Tracer(const Tracer &) = delete;
  Tracer &operator=(const Tracer &) = delete;

  void start();

  Span start_span(std::string_view name, SpanKind kind,
                  const std::optional<Span> &parent);
  void end_span(const Span &span);

  void write_log(std::string_view message, Severity severity,
                 const std::optional<ErrorInfo> &error,
                 const std::optional<Span> &span);

  bool force_flush(std::chrono::milliseconds timeout);
  bool shutdown();
  PipelineStats stats() const { return _pipeline.stats(); }

  const Options &options() const { return _options; }
  uint64_t generation() const { return _generation; }

  // Nanoseconds since the Unix epoch.
  static uint64_t get_timestamp();

private:
  const Options _options;
  const uint64_t _generation;
  ExportPipeline _pipeline;
};

} // namespace Sonar::detail
