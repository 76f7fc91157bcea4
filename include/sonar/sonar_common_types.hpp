#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Sonar {

// Forward declarations
class Span;
class Exporter;

/**
 * @brief 128-bit trace identifier shared by every span of one trace.
 * All-zero bytes denote an invalid id.
 */
struct TraceId {
  std::array<uint8_t, 16> bytes{};

  bool is_valid() const;
  std::string to_hex() const;
  bool operator==(const TraceId &) const = default;
};

/**
 * @brief 64-bit span identifier, unique within its trace.
 * All-zero bytes denote an invalid id.
 */
struct SpanId {
  std::array<uint8_t, 8> bytes{};

  bool is_valid() const;
  std::string to_hex() const;
  bool operator==(const SpanId &) const = default;
};

inline constexpr TraceId kInvalidTraceId{};
inline constexpr SpanId kInvalidSpanId{};

enum class SpanKind : uint8_t { kInternal, kServer, kClient, kProducer, kConsumer };

enum class SpanStatus : uint8_t { kUnset, kOk, kError };

// Ordered: comparisons express "at least as severe as".
enum class Severity : uint8_t {
  kTrace,
  kDebug,
  kInformation,
  kWarning,
  kError,
  kCritical
};

enum class Protocol : uint8_t { kGrpc, kHttpProtobuf };

/**
 * @brief Error payload attached to a log record. Exported as the
 * `exception.*` attributes.
 */
struct ErrorInfo {
  std::string type;
  std::string message;
  std::string stack_trace;
};

// --- Boundary parsing ---
// String forms are what the scripting surface passes in. Each parser throws
// InvalidArgumentError on an unrecognized value; matching ignores case.

SpanKind parse_span_kind(std::string_view text);
Severity parse_severity(std::string_view text);
Protocol parse_protocol(std::string_view text);

std::string_view to_string(SpanKind kind);
std::string_view to_string(SpanStatus status);
std::string_view to_string(Severity severity);
std::string_view to_string(Protocol protocol);

} // namespace Sonar
