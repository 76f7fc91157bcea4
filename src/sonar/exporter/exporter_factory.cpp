#include "sonar/exporter/exporter_factory.hpp"
#include "sonar/exporter/otlp_grpc_exporter.hpp"
#include "sonar/exporter/otlp_http_exporter.hpp"

namespace Sonar::exporter {

std::unique_ptr<Exporter> make_otlp_exporter(const Options &options,
                                             const Endpoint &endpoint) {
  switch (options.protocol) {
  case Protocol::kGrpc:
    return std::make_unique<OtlpGrpcExporter>(options, endpoint);
  case Protocol::kHttpProtobuf:
    return std::make_unique<OtlpHttpExporter>(options, endpoint);
  }
  return nullptr;
}

} // namespace Sonar::exporter
