#include "sonar/exporter/otlp_grpc_exporter.hpp"
#include "sonar/logging/internal_log.hpp"

#include <cctype>
#include <string>

namespace Sonar::exporter {

namespace {
constexpr uint16_t kDefaultGrpcPort = 4317;

std::shared_ptr<grpc::ChannelCredentials> credentials_for(
    const Endpoint &endpoint) {
  if (endpoint.scheme == "https") {
    return grpc::SslCredentials(grpc::SslCredentialsOptions{});
  }
  return grpc::InsecureChannelCredentials();
}

// gRPC metadata keys must be lower case.
std::string lower(std::string s) {
  for (auto &c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}
} // namespace

ExportResult classify(const grpc::Status &status) {
  switch (status.error_code()) {
  case grpc::StatusCode::OK:
    return ExportResult::kSuccess;
  case grpc::StatusCode::CANCELLED:
  case grpc::StatusCode::DEADLINE_EXCEEDED:
  case grpc::StatusCode::RESOURCE_EXHAUSTED:
  case grpc::StatusCode::ABORTED:
  case grpc::StatusCode::OUT_OF_RANGE:
  case grpc::StatusCode::UNAVAILABLE:
  case grpc::StatusCode::DATA_LOSS:
    return ExportResult::kRetryableFailure;
  default:
    return ExportResult::kPermanentFailure;
  }
}

std::string OtlpGrpcExporter::make_target(const Endpoint &endpoint) {
  return endpoint.host + ":" +
         std::to_string(endpoint.port.value_or(kDefaultGrpcPort));
}

OtlpGrpcExporter::OtlpGrpcExporter(const Options &options,
                                   const Endpoint &endpoint)
    : OtlpGrpcExporter(options,
                       grpc::CreateChannel(make_target(endpoint),
                                           credentials_for(endpoint))) {}

OtlpGrpcExporter::OtlpGrpcExporter(
    const Options &options, std::shared_ptr<grpc::ChannelInterface> channel)
    : _serializer(options.service_name), _timeout(options.export_timeout),
      _channel(std::move(channel)),
      _trace_stub(otlp_collector_trace::TraceService::NewStub(_channel)),
      _logs_stub(otlp_collector_logs::LogsService::NewStub(_channel)) {
  for (const auto &[key, value] : options.headers) {
    _headers.emplace(lower(key), value);
  }
}

bool OtlpGrpcExporter::begin_call(grpc::ClientContext &context) {
  context.set_deadline(std::chrono::system_clock::now() + _timeout);
  for (const auto &[key, value] : _headers) {
    context.AddMetadata(key, value);
  }
  std::lock_guard<std::mutex> lock(_call_mutex);
  if (_cancelled) {
    return false;
  }
  _active_call = &context;
  return true;
}

void OtlpGrpcExporter::end_call() {
  std::lock_guard<std::mutex> lock(_call_mutex);
  _active_call = nullptr;
}

void OtlpGrpcExporter::cancel() {
  std::lock_guard<std::mutex> lock(_call_mutex);
  _cancelled = true;
  if (_active_call) {
    _active_call->TryCancel();
  }
}

ExportResult OtlpGrpcExporter::export_spans(const std::vector<SpanData> &spans) {
  if (!_trace_stub) {
    return ExportResult::kPermanentFailure;
  }
  grpc::ClientContext context;
  if (!begin_call(context)) {
    return ExportResult::kRetryableFailure;
  }
  otlp_collector_trace::ExportTraceServiceResponse response;
  const auto status = _trace_stub->Export(
      &context, _serializer.build_trace_request(spans), &response);
  end_call();
  if (!status.ok()) {
    logging::internal_logger()->warn(
        "OTLP/gRPC trace export of {} spans failed: code={} message='{}'",
        spans.size(), static_cast<int>(status.error_code()),
        status.error_message());
    return classify(status);
  }
  if (response.has_partial_success() &&
      response.partial_success().rejected_spans() > 0) {
    logging::internal_logger()->warn(
        "Collector rejected {} of {} spans: {}",
        response.partial_success().rejected_spans(), spans.size(),
        response.partial_success().error_message());
  }
  return ExportResult::kSuccess;
}

ExportResult OtlpGrpcExporter::export_logs(const std::vector<LogRecord> &logs) {
  if (!_logs_stub) {
    return ExportResult::kPermanentFailure;
  }
  grpc::ClientContext context;
  if (!begin_call(context)) {
    return ExportResult::kRetryableFailure;
  }
  otlp_collector_logs::ExportLogsServiceResponse response;
  const auto status = _logs_stub->Export(
      &context, _serializer.build_logs_request(logs), &response);
  end_call();
  if (!status.ok()) {
    logging::internal_logger()->warn(
        "OTLP/gRPC log export of {} records failed: code={} message='{}'",
        logs.size(), static_cast<int>(status.error_code()),
        status.error_message());
    return classify(status);
  }
  if (response.has_partial_success() &&
      response.partial_success().rejected_log_records() > 0) {
    logging::internal_logger()->warn(
        "Collector rejected {} of {} log records: {}",
        response.partial_success().rejected_log_records(), logs.size(),
        response.partial_success().error_message());
  }
  return ExportResult::kSuccess;
}

void OtlpGrpcExporter::shutdown() {
  _trace_stub.reset();
  _logs_stub.reset();
  _channel.reset();
}

} // namespace Sonar::exporter
