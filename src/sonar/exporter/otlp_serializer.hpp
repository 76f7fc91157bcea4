#pragma once

#include "sonar/sonar_records.hpp"

#include "opentelemetry/proto/collector/logs/v1/logs_service.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.pb.h"

#include <string>
#include <vector>

namespace Sonar::exporter {

namespace otlp_collector_trace = opentelemetry::proto::collector::trace::v1;
namespace otlp_collector_logs = opentelemetry::proto::collector::logs::v1;

inline constexpr const char *kScopeName = "sonar";
inline constexpr const char *kSdkVersion = "1.0.0";

/**
 * @brief Converts Sonar records into OTLP v1 export requests.
 *
 * Every request carries a single ResourceSpans/ResourceLogs entry with the
 * service.name and telemetry.sdk.* resource attributes, and a single scope
 * named "sonar".
 */
class OtlpSerializer {
public:
  explicit OtlpSerializer(std::string service_name);

  otlp_collector_trace::ExportTraceServiceRequest
  build_trace_request(const std::vector<SpanData> &spans) const;

  otlp_collector_logs::ExportLogsServiceRequest
  build_logs_request(const std::vector<LogRecord> &logs) const;

  const std::string &service_name() const { return _service_name; }

private:
  std::string _service_name;
};

// SeverityNumber of the first slot of each OTLP severity range.
int severity_number(Severity severity);

} // namespace Sonar::exporter
