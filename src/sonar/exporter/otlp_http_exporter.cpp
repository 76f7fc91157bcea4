#include "sonar/exporter/otlp_http_exporter.hpp"
#include "sonar/logging/internal_log.hpp"

#include <curl/curl.h>
#include <stdexcept>
#include <string>

namespace Sonar::exporter {

namespace {

// curl_global_init is process-wide and must run once before any handle is
// created; it is never undone.
void ensure_curl_initialized() {
  static const CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (result != CURLE_OK) {
    throw std::runtime_error(std::string("curl_global_init failed: ") +
                             curl_easy_strerror(result));
  }
}

size_t discard_body(char * /*data*/, size_t size, size_t count,
                    void * /*userdata*/) {
  return size * count;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int abort_when_cancelled(void *userdata, curl_off_t /*dltotal*/,
                         curl_off_t /*dlnow*/, curl_off_t /*ultotal*/,
                         curl_off_t /*ulnow*/) {
  const auto *cancelled = static_cast<const std::atomic<bool> *>(userdata);
  return cancelled->load(std::memory_order_acquire) ? 1 : 0;
}

} // namespace

ExportResult classify_http_status(long status_code) {
  if (status_code >= 200 && status_code < 300) {
    return ExportResult::kSuccess;
  }
  switch (status_code) {
  case 429:
  case 502:
  case 503:
  case 504:
    return ExportResult::kRetryableFailure;
  default:
    return ExportResult::kPermanentFailure;
  }
}

std::string OtlpHttpExporter::make_url(const Endpoint &endpoint,
                                       std::string_view signal_path) {
  std::string url = endpoint.scheme + "://" + endpoint.host;
  if (endpoint.port) {
    url += ":" + std::to_string(*endpoint.port);
  }
  url += endpoint.path;
  url += signal_path;
  return url;
}

OtlpHttpExporter::OtlpHttpExporter(const Options &options,
                                   const Endpoint &endpoint)
    : _serializer(options.service_name), _timeout(options.export_timeout),
      _headers(options.headers), _traces_url(make_url(endpoint, "/v1/traces")),
      _logs_url(make_url(endpoint, "/v1/logs")) {
  ensure_curl_initialized();
  _curl = curl_easy_init();
  if (!_curl) {
    throw std::runtime_error("curl_easy_init failed");
  }
}

OtlpHttpExporter::~OtlpHttpExporter() { shutdown(); }

void OtlpHttpExporter::cancel() {
  _cancelled.store(true, std::memory_order_release);
}

void OtlpHttpExporter::shutdown() {
  std::lock_guard<std::mutex> lock(_curl_mutex);
  if (_curl) {
    curl_easy_cleanup(static_cast<CURL *>(_curl));
    _curl = nullptr;
  }
}

ExportResult OtlpHttpExporter::export_spans(const std::vector<SpanData> &spans) {
  std::string body;
  if (!_serializer.build_trace_request(spans).SerializeToString(&body)) {
    logging::internal_logger()->error("Failed to serialize {} spans",
                                      spans.size());
    return ExportResult::kPermanentFailure;
  }
  return post(_traces_url, body, spans.size());
}

ExportResult OtlpHttpExporter::export_logs(const std::vector<LogRecord> &logs) {
  std::string body;
  if (!_serializer.build_logs_request(logs).SerializeToString(&body)) {
    logging::internal_logger()->error("Failed to serialize {} log records",
                                      logs.size());
    return ExportResult::kPermanentFailure;
  }
  return post(_logs_url, body, logs.size());
}

ExportResult OtlpHttpExporter::post(const std::string &url,
                                    const std::string &body,
                                    size_t record_count) {
  std::lock_guard<std::mutex> lock(_curl_mutex);
  auto *curl = static_cast<CURL *>(_curl);
  if (!curl) {
    return ExportResult::kPermanentFailure;
  }
  if (_cancelled.load(std::memory_order_acquire)) {
    return ExportResult::kRetryableFailure;
  }

  curl_easy_reset(curl);
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(_timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_body);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_when_cancelled);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                   static_cast<void *>(&_cancelled));

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/x-protobuf");
  for (const auto &[key, value] : _headers) {
    headers = curl_slist_append(headers, (key + ": " + value).c_str());
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

  const CURLcode result = curl_easy_perform(curl);
  long status_code = 0;
  if (result == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
  }
  curl_slist_free_all(headers);

  if (result != CURLE_OK) {
    // Connection refused, DNS failure, timeout: all transient from our side.
    logging::internal_logger()->warn(
        "OTLP/HTTP export of {} records to {} failed: {}", record_count, url,
        curl_easy_strerror(result));
    return ExportResult::kRetryableFailure;
  }

  const auto classified = classify_http_status(status_code);
  if (classified != ExportResult::kSuccess) {
    logging::internal_logger()->warn(
        "OTLP/HTTP export of {} records to {} returned HTTP {}", record_count,
        url, status_code);
  }
  return classified;
}

} // namespace Sonar::exporter
