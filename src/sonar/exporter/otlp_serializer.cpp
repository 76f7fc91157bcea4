#include "sonar/exporter/otlp_serializer.hpp"

#include <utility>

namespace Sonar::exporter {

namespace otlp_common = opentelemetry::proto::common::v1;
namespace otlp_resource = opentelemetry::proto::resource::v1;
namespace otlp_trace = opentelemetry::proto::trace::v1;
namespace otlp_logs = opentelemetry::proto::logs::v1;

namespace {

template <size_t N> std::string id_bytes(const std::array<uint8_t, N> &bytes) {
  return std::string(reinterpret_cast<const char *>(bytes.data()), N);
}

void add_string_attribute(
    google::protobuf::RepeatedPtrField<otlp_common::KeyValue> *attributes,
    const std::string &key, const std::string &value) {
  auto *kv = attributes->Add();
  kv->set_key(key);
  kv->mutable_value()->set_string_value(value);
}

void fill_resource(otlp_resource::Resource *resource,
                   const std::string &service_name) {
  auto *attributes = resource->mutable_attributes();
  add_string_attribute(attributes, "service.name", service_name);
  add_string_attribute(attributes, "telemetry.sdk.name", "sonar");
  add_string_attribute(attributes, "telemetry.sdk.language", "cpp");
  add_string_attribute(attributes, "telemetry.sdk.version", kSdkVersion);
}

void fill_scope(otlp_common::InstrumentationScope *scope) {
  scope->set_name(kScopeName);
  scope->set_version(kSdkVersion);
}

otlp_trace::Span::SpanKind to_proto(SpanKind kind) {
  switch (kind) {
  case SpanKind::kInternal:
    return otlp_trace::Span::SPAN_KIND_INTERNAL;
  case SpanKind::kServer:
    return otlp_trace::Span::SPAN_KIND_SERVER;
  case SpanKind::kClient:
    return otlp_trace::Span::SPAN_KIND_CLIENT;
  case SpanKind::kProducer:
    return otlp_trace::Span::SPAN_KIND_PRODUCER;
  case SpanKind::kConsumer:
    return otlp_trace::Span::SPAN_KIND_CONSUMER;
  }
  return otlp_trace::Span::SPAN_KIND_UNSPECIFIED;
}

otlp_trace::Status::StatusCode to_proto(SpanStatus status) {
  switch (status) {
  case SpanStatus::kOk:
    return otlp_trace::Status::STATUS_CODE_OK;
  case SpanStatus::kError:
    return otlp_trace::Status::STATUS_CODE_ERROR;
  case SpanStatus::kUnset:
    break;
  }
  return otlp_trace::Status::STATUS_CODE_UNSET;
}

} // namespace

int severity_number(Severity severity) {
  switch (severity) {
  case Severity::kTrace:
    return otlp_logs::SEVERITY_NUMBER_TRACE;
  case Severity::kDebug:
    return otlp_logs::SEVERITY_NUMBER_DEBUG;
  case Severity::kInformation:
    return otlp_logs::SEVERITY_NUMBER_INFO;
  case Severity::kWarning:
    return otlp_logs::SEVERITY_NUMBER_WARN;
  case Severity::kError:
    return otlp_logs::SEVERITY_NUMBER_ERROR;
  case Severity::kCritical:
    return otlp_logs::SEVERITY_NUMBER_FATAL;
  }
  return otlp_logs::SEVERITY_NUMBER_UNSPECIFIED;
}

OtlpSerializer::OtlpSerializer(std::string service_name)
    : _service_name(std::move(service_name)) {}

otlp_collector_trace::ExportTraceServiceRequest
OtlpSerializer::build_trace_request(const std::vector<SpanData> &spans) const {
  otlp_collector_trace::ExportTraceServiceRequest request;
  auto *resource_spans = request.add_resource_spans();
  fill_resource(resource_spans->mutable_resource(), _service_name);

  auto *scope_spans = resource_spans->add_scope_spans();
  fill_scope(scope_spans->mutable_scope());

  for (const auto &data : spans) {
    auto *span = scope_spans->add_spans();
    span->set_trace_id(id_bytes(data.trace_id.bytes));
    span->set_span_id(id_bytes(data.span_id.bytes));
    if (data.parent_span_id && data.parent_span_id->is_valid()) {
      span->set_parent_span_id(id_bytes(data.parent_span_id->bytes));
    }
    span->set_name(data.name);
    span->set_kind(to_proto(data.kind));
    span->set_start_time_unix_nano(data.start_time_unix_nano);
    span->set_end_time_unix_nano(data.end_time_unix_nano);
    for (const auto &[key, value] : data.tags) {
      add_string_attribute(span->mutable_attributes(), key, value);
    }
    auto *status = span->mutable_status();
    status->set_code(to_proto(data.status));
    // OTLP only defines a message for the error status.
    if (data.status == SpanStatus::kError) {
      status->set_message(data.status_description);
    }
  }
  return request;
}

otlp_collector_logs::ExportLogsServiceRequest
OtlpSerializer::build_logs_request(const std::vector<LogRecord> &logs) const {
  otlp_collector_logs::ExportLogsServiceRequest request;
  auto *resource_logs = request.add_resource_logs();
  fill_resource(resource_logs->mutable_resource(), _service_name);

  auto *scope_logs = resource_logs->add_scope_logs();
  fill_scope(scope_logs->mutable_scope());

  for (const auto &record : logs) {
    auto *log = scope_logs->add_log_records();
    log->set_time_unix_nano(record.time_unix_nano);
    log->set_observed_time_unix_nano(record.time_unix_nano);
    log->set_severity_number(
        static_cast<otlp_logs::SeverityNumber>(severity_number(record.severity)));
    log->set_severity_text(std::string(to_string(record.severity)));
    log->mutable_body()->set_string_value(record.message);
    if (record.is_correlated()) {
      log->set_trace_id(id_bytes(record.trace_id.bytes));
      log->set_span_id(id_bytes(record.span_id.bytes));
    }
    if (record.error) {
      auto *attributes = log->mutable_attributes();
      if (!record.error->type.empty()) {
        add_string_attribute(attributes, "exception.type", record.error->type);
      }
      add_string_attribute(attributes, "exception.message",
                           record.error->message);
      if (!record.error->stack_trace.empty()) {
        add_string_attribute(attributes, "exception.stacktrace",
                             record.error->stack_trace);
      }
    }
  }
  return request;
}

} // namespace Sonar::exporter
