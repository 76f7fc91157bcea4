#include "sonar/sonar_common_types.hpp"
#include "sonar/sonar_errors.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace Sonar {

namespace {

template <size_t N> std::string bytes_to_hex(const std::array<uint8_t, N> &bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out(N * 2, '0');
  for (size_t i = 0; i < N; ++i) {
    out[2 * i] = kDigits[bytes[i] >> 4];
    out[2 * i + 1] = kDigits[bytes[i] & 0x0f];
  }
  return out;
}

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

[[noreturn]] void throw_unknown(std::string_view what, std::string_view text) {
  throw InvalidArgumentError("Unknown " + std::string(what) + ": '" +
                             std::string(text) + "'");
}

} // namespace

bool TraceId::is_valid() const {
  return std::any_of(bytes.begin(), bytes.end(),
                     [](uint8_t b) { return b != 0; });
}

std::string TraceId::to_hex() const { return bytes_to_hex(bytes); }

bool SpanId::is_valid() const {
  return std::any_of(bytes.begin(), bytes.end(),
                     [](uint8_t b) { return b != 0; });
}

std::string SpanId::to_hex() const { return bytes_to_hex(bytes); }

SpanKind parse_span_kind(std::string_view text) {
  for (auto kind : {SpanKind::kInternal, SpanKind::kServer, SpanKind::kClient,
                    SpanKind::kProducer, SpanKind::kConsumer}) {
    if (iequals(text, to_string(kind))) {
      return kind;
    }
  }
  throw_unknown("span kind", text);
}

Severity parse_severity(std::string_view text) {
  for (auto severity : {Severity::kTrace, Severity::kDebug,
                        Severity::kInformation, Severity::kWarning,
                        Severity::kError, Severity::kCritical}) {
    if (iequals(text, to_string(severity))) {
      return severity;
    }
  }
  // Short spellings common in log configuration.
  if (iequals(text, "info")) {
    return Severity::kInformation;
  }
  if (iequals(text, "warn")) {
    return Severity::kWarning;
  }
  throw_unknown("severity", text);
}

Protocol parse_protocol(std::string_view text) {
  if (iequals(text, "grpc")) {
    return Protocol::kGrpc;
  }
  if (iequals(text, "http/protobuf") || iequals(text, "http-protobuf")) {
    return Protocol::kHttpProtobuf;
  }
  throw_unknown("protocol", text);
}

std::string_view to_string(SpanKind kind) {
  switch (kind) {
  case SpanKind::kInternal:
    return "Internal";
  case SpanKind::kServer:
    return "Server";
  case SpanKind::kClient:
    return "Client";
  case SpanKind::kProducer:
    return "Producer";
  case SpanKind::kConsumer:
    return "Consumer";
  }
  return "Internal";
}

std::string_view to_string(SpanStatus status) {
  switch (status) {
  case SpanStatus::kUnset:
    return "Unset";
  case SpanStatus::kOk:
    return "Ok";
  case SpanStatus::kError:
    return "Error";
  }
  return "Unset";
}

std::string_view to_string(Severity severity) {
  switch (severity) {
  case Severity::kTrace:
    return "Trace";
  case Severity::kDebug:
    return "Debug";
  case Severity::kInformation:
    return "Information";
  case Severity::kWarning:
    return "Warning";
  case Severity::kError:
    return "Error";
  case Severity::kCritical:
    return "Critical";
  }
  return "Information";
}

std::string_view to_string(Protocol protocol) {
  switch (protocol) {
  case Protocol::kGrpc:
    return "grpc";
  case Protocol::kHttpProtobuf:
    return "http/protobuf";
  }
  return "grpc";
}

std::string_view to_string(ConfigError::Code code) {
  switch (code) {
  case ConfigError::Code::kInvalidEndpoint:
    return "InvalidEndpoint";
  case ConfigError::Code::kInvalidProtocol:
    return "InvalidProtocol";
  case ConfigError::Code::kInvalidOption:
    return "InvalidOption";
  case ConfigError::Code::kTransportSetup:
    return "TransportSetup";
  }
  return "InvalidOption";
}

} // namespace Sonar
