#pragma once

#include "sonar_records.hpp"
#include <vector>

namespace Sonar {

enum class ExportResult : uint8_t {
  kSuccess,
  // Network hiccup, overloaded collector, deadline; worth retrying.
  kRetryableFailure,
  // Rejected payload, bad endpoint path, auth; retrying cannot help.
  kPermanentFailure
};

/**
 * @brief Transport seam of the export pipeline.
 *
 * The pipeline owns retries, batching and scheduling; an Exporter performs
 * exactly one transmission attempt per call and classifies the outcome. Calls
 * are serialized by the pipeline, so implementations need no locking of their
 * own around export_spans and export_logs. cancel is the exception: it arrives
 * from the thread running shutdown while an export may be in flight.
 *
 * The built-in implementations speak OTLP over gRPC or HTTP/protobuf.
 * Callers can supply their own through Sonar::initialize.
 */
class Exporter {
public:
  virtual ~Exporter() = default;

  virtual ExportResult export_spans(const std::vector<SpanData> &spans) = 0;
  virtual ExportResult export_logs(const std::vector<LogRecord> &logs) = 0;

  /**
   * @brief Aborts the export in flight, if any, and makes later calls fail
   * fast with kRetryableFailure.
   *
   * Called from another thread when shutdown_timeout expires during the
   * final flush. Shutdown waits for the interrupted call to return, so an
   * exporter that can block must override this.
   */
  virtual void cancel() {}

  // Releases connections. Called once, after the final flush.
  virtual void shutdown() {}
};

} // namespace Sonar
