#pragma once

#include "sonar/exporter/otlp_serializer.hpp"
#include "sonar/sonar_exporter.hpp"
#include "sonar/sonar_options.hpp"

#include "opentelemetry/proto/collector/logs/v1/logs_service.grpc.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.grpc.pb.h"

#include <chrono>
#include <grpcpp/grpcpp.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace Sonar::exporter {

/**
 * @brief OTLP/gRPC transport: one unary Export call per batch on the trace
 * or logs collector service.
 */
class OtlpGrpcExporter : public Exporter {
public:
  OtlpGrpcExporter(const Options &options, const Endpoint &endpoint);

  // For tests: talk to an already-built channel.
  OtlpGrpcExporter(const Options &options,
                   std::shared_ptr<grpc::ChannelInterface> channel);

  ExportResult export_spans(const std::vector<SpanData> &spans) override;
  ExportResult export_logs(const std::vector<LogRecord> &logs) override;
  void cancel() override;
  void shutdown() override;

  // host:port target string for an endpoint; 4317 when no port is given.
  static std::string make_target(const Endpoint &endpoint);

private:
  // Sets deadline and metadata, and registers the call for cancel. Returns
  // false once cancel has been called.
  bool begin_call(grpc::ClientContext &context);
  void end_call();

  OtlpSerializer _serializer;
  std::chrono::milliseconds _timeout;
  std::map<std::string, std::string> _headers;
  std::shared_ptr<grpc::ChannelInterface> _channel;
  std::unique_ptr<otlp_collector_trace::TraceService::StubInterface>
      _trace_stub;
  std::unique_ptr<otlp_collector_logs::LogsService::StubInterface> _logs_stub;

  std::mutex _call_mutex;
  grpc::ClientContext *_active_call = nullptr;
  bool _cancelled = false;
};

// Retry classification for a failed call, following OTLP/gRPC.
ExportResult classify(const grpc::Status &status);

} // namespace Sonar::exporter
