#pragma once

#include "sonar_common_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Sonar {

using Tag = std::pair<std::string, std::string>;

/**
 * @brief Immutable snapshot of a stopped span, as handed to the export
 * pipeline. Timestamps are nanoseconds since the Unix epoch.
 */
struct SpanData {
  TraceId trace_id;
  SpanId span_id;
  std::optional<SpanId> parent_span_id;
  std::string name;
  SpanKind kind = SpanKind::kInternal;
  uint64_t start_time_unix_nano = 0;
  uint64_t end_time_unix_nano = 0;
  // Insertion order of first write; keys are unique.
  std::vector<Tag> tags;
  SpanStatus status = SpanStatus::kUnset;
  std::string status_description;

  uint64_t duration_nanos() const {
    return end_time_unix_nano >= start_time_unix_nano
               ? end_time_unix_nano - start_time_unix_nano
               : 0;
  }
};

/**
 * @brief A single log record, optionally correlated to the span that was
 * active when it was written.
 */
struct LogRecord {
  uint64_t time_unix_nano = 0;
  Severity severity = Severity::kInformation;
  std::string message;
  std::optional<ErrorInfo> error;
  // Both set or both invalid.
  TraceId trace_id;
  SpanId span_id;

  bool is_correlated() const {
    return trace_id.is_valid() && span_id.is_valid();
  }
};

} // namespace Sonar
