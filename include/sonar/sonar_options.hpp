#pragma once

#include "sonar_common_types.hpp"
#include "sonar_errors.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace Sonar {

/**
 * @brief Everything Sonar::initialize needs. Defaults match the usual
 * OpenTelemetry batch processor settings.
 */
struct Options {
  std::string service_name = "unknown_service";
  std::string endpoint = "http://localhost:4317";
  Protocol protocol = Protocol::kGrpc;
  // Print finished spans and log records to stdout.
  bool console_echo = false;

  size_t max_queue_size = 2048;
  size_t max_export_batch_size = 512;
  std::chrono::milliseconds schedule_delay{5000};
  std::chrono::milliseconds export_timeout{10000};
  std::chrono::milliseconds shutdown_timeout{10000};

  // Total attempts per batch, the first one included.
  int max_attempts = 5;
  std::chrono::milliseconds initial_backoff{1000};
  std::chrono::milliseconds max_backoff{5000};

  // Records below this severity are discarded before enqueue.
  Severity min_severity = Severity::kTrace;

  // Sent as gRPC metadata or HTTP headers on every export.
  std::map<std::string, std::string> headers;

  // spdlog level name for Sonar's own diagnostics ("warn", "debug", ...).
  std::string internal_log_level = "warn";

  /**
   * @brief Default options overlaid with the OTEL_* / SONAR_* environment
   * variables that are set. Malformed values are skipped with a warning.
   */
  static Options from_env();
};

/**
 * @brief Pieces of a validated collector endpoint.
 */
struct Endpoint {
  std::string scheme;
  std::string host;
  std::optional<uint16_t> port;
  // Without trailing slash; empty when the URI has no path.
  std::string path;
};

/**
 * @brief Parses an absolute http(s) URI. Returns std::nullopt when the
 * scheme, host or port is malformed.
 */
std::optional<Endpoint> parse_endpoint(std::string_view uri);

/**
 * @brief Full validation performed by Sonar::initialize.
 */
std::optional<ConfigError> validate(const Options &options);

} // namespace Sonar
