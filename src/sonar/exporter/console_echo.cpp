#include "sonar/exporter/console_echo.hpp"
#include "sonar/logging/internal_log.hpp"

#include <spdlog/fmt/fmt.h>

namespace Sonar::exporter {

std::string format_span(const SpanData &span) {
  std::string out = fmt::format(
      "[span] {} kind={} trace_id={} span_id={} parent_id={} duration_us={} "
      "status={}",
      span.name, to_string(span.kind), span.trace_id.to_hex(),
      span.span_id.to_hex(),
      span.parent_span_id ? span.parent_span_id->to_hex() : std::string("-"),
      span.duration_nanos() / 1000, to_string(span.status));
  if (!span.tags.empty()) {
    out += " tags={";
    for (size_t i = 0; i < span.tags.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += fmt::format("{}: '{}'", span.tags[i].first, span.tags[i].second);
    }
    out += "}";
  }
  return out;
}

std::string format_log(const LogRecord &record) {
  std::string out =
      fmt::format("[log] [{}] {}", to_string(record.severity), record.message);
  if (record.is_correlated()) {
    out += fmt::format(" trace_id={} span_id={}", record.trace_id.to_hex(),
                       record.span_id.to_hex());
  }
  if (record.error) {
    out += fmt::format(" error='{}'", record.error->message);
    if (!record.error->stack_trace.empty()) {
      out += "\n" + record.error->stack_trace;
    }
  }
  return out;
}

void echo_span(const SpanData &span) {
  logging::console_logger()->info(format_span(span));
}

void echo_log(const LogRecord &record) {
  logging::console_logger()->log(logging::to_spdlog_level(record.severity), format_log(record));
}

} // namespace Sonar::exporter
