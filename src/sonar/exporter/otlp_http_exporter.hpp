#pragma once

#include "sonar/exporter/otlp_serializer.hpp"
#include "sonar/sonar_exporter.hpp"
#include "sonar/sonar_options.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace Sonar::exporter {

/**
 * @brief OTLP/HTTP transport with binary protobuf bodies, one POST per batch
 * to `<endpoint>/v1/traces` or `<endpoint>/v1/logs`, via libcurl.
 */
class OtlpHttpExporter : public Exporter {
public:
  // Throws std::runtime_error when libcurl cannot create a handle.
  OtlpHttpExporter(const Options &options, const Endpoint &endpoint);
  ~OtlpHttpExporter() override;

  OtlpHttpExporter(const OtlpHttpExporter &) = delete;
  OtlpHttpExporter &operator=(const OtlpHttpExporter &) = delete;

  ExportResult export_spans(const std::vector<SpanData> &spans) override;
  ExportResult export_logs(const std::vector<LogRecord> &logs) override;
  void cancel() override;
  void shutdown() override;

  const std::string &traces_url() const { return _traces_url; }
  const std::string &logs_url() const { return _logs_url; }

  // Signal URL for a base endpoint, e.g. ("http://c:4318", "/v1/traces").
  static std::string make_url(const Endpoint &endpoint,
                              std::string_view signal_path);

private:
  ExportResult post(const std::string &url, const std::string &body,
                    size_t record_count);

  OtlpSerializer _serializer;
  std::chrono::milliseconds _timeout;
  std::map<std::string, std::string> _headers;
  std::string _traces_url;
  std::string _logs_url;

  std::mutex _curl_mutex;
  void *_curl = nullptr; // CURL*

  // Read by the transfer's progress callback, which aborts once it is set.
  std::atomic<bool> _cancelled{false};
};

// Retry classification of an HTTP status code, following OTLP/HTTP.
ExportResult classify_http_status(long status_code);

} // namespace Sonar::exporter
