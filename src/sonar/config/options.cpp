#include "sonar/sonar_options.hpp"
#include "sonar/logging/internal_log.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

namespace Sonar {

namespace {

const char *env(const char *name) {
  const char *value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

template <typename T> std::optional<T> parse_number(std::string_view text) {
  T value{};
  const auto *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

void warn_ignored(const char *name, const char *value) {
  logging::internal_logger()->warn("Ignoring {}='{}': not a valid value", name,
                                   value);
}

void overlay_millis(const char *name, std::chrono::milliseconds &target) {
  if (const char *value = env(name)) {
    auto ms = parse_number<long long>(value);
    if (ms && *ms > 0) {
      target = std::chrono::milliseconds(*ms);
    } else {
      warn_ignored(name, value);
    }
  }
}

void overlay_size(const char *name, size_t &target) {
  if (const char *value = env(name)) {
    auto n = parse_number<size_t>(value);
    if (n && *n > 0) {
      target = *n;
    } else {
      warn_ignored(name, value);
    }
  }
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

// "k1=v1,k2=v2" as used by OTEL_EXPORTER_OTLP_HEADERS.
void parse_headers(std::string_view text,
                   std::map<std::string, std::string> &out) {
  while (!text.empty()) {
    const auto comma = text.find(',');
    const auto item = text.substr(0, comma);
    const auto eq = item.find('=');
    if (eq != std::string_view::npos) {
      const auto key = trim(item.substr(0, eq));
      if (!key.empty()) {
        out[std::string(key)] = std::string(trim(item.substr(eq + 1)));
      }
    }
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
}

} // namespace

Options Options::from_env() {
  Options options;

  if (const char *value = env("OTEL_SERVICE_NAME")) {
    options.service_name = value;
  }
  if (const char *value = env("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    options.endpoint = value;
  }
  if (const char *value = env("OTEL_EXPORTER_OTLP_PROTOCOL")) {
    try {
      options.protocol = parse_protocol(value);
    } catch (const InvalidArgumentError &) {
      warn_ignored("OTEL_EXPORTER_OTLP_PROTOCOL", value);
    }
  }
  if (const char *value = env("OTEL_EXPORTER_OTLP_HEADERS")) {
    parse_headers(value, options.headers);
  }
  overlay_millis("OTEL_EXPORTER_OTLP_TIMEOUT", options.export_timeout);
  overlay_millis("OTEL_BSP_SCHEDULE_DELAY", options.schedule_delay);
  overlay_size("OTEL_BSP_MAX_QUEUE_SIZE", options.max_queue_size);
  overlay_size("OTEL_BSP_MAX_EXPORT_BATCH_SIZE",
               options.max_export_batch_size);

  if (const char *value = env("SONAR_CONSOLE_ECHO")) {
    const std::string_view v(value);
    options.console_echo = (v == "1" || v == "true" || v == "TRUE" ||
                            v == "True" || v == "yes");
  }
  if (const char *value = env("SONAR_LOG_LEVEL")) {
    options.internal_log_level = value;
  }
  return options;
}

std::optional<Endpoint> parse_endpoint(std::string_view uri) {
  const auto scheme_end = uri.find("://");
  if (scheme_end == std::string_view::npos) {
    return std::nullopt;
  }

  Endpoint endpoint;
  endpoint.scheme = std::string(uri.substr(0, scheme_end));
  for (auto &c : endpoint.scheme) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (endpoint.scheme != "http" && endpoint.scheme != "https") {
    return std::nullopt;
  }

  auto rest = uri.substr(scheme_end + 3);
  const auto path_start = rest.find('/');
  auto authority = rest.substr(0, path_start);
  if (path_start != std::string_view::npos) {
    auto path = rest.substr(path_start);
    while (!path.empty() && path.back() == '/') {
      path.remove_suffix(1);
    }
    endpoint.path = std::string(path);
  }

  if (authority.empty() || authority.find('@') != std::string_view::npos) {
    return std::nullopt;
  }

  // Bracketed IPv6 literal: [::1]:4317
  std::string_view host;
  std::string_view port;
  if (authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos || close == 1) {
      return std::nullopt;
    }
    host = authority.substr(0, close + 1);
    auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') {
        return std::nullopt;
      }
      port = tail.substr(1);
      if (port.empty()) {
        return std::nullopt;
      }
    }
  } else {
    const auto colon = authority.rfind(':');
    host = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
      port = authority.substr(colon + 1);
      if (port.empty()) {
        return std::nullopt;
      }
    }
  }

  if (host.empty()) {
    return std::nullopt;
  }
  if (host.front() != '[' &&
      host.find_first_of(" \t\r\n:") != std::string_view::npos) {
    return std::nullopt;
  }
  endpoint.host = std::string(host);

  if (!port.empty()) {
    auto number = parse_number<unsigned>(port);
    if (!number || *number == 0 || *number > 65535) {
      return std::nullopt;
    }
    endpoint.port = static_cast<uint16_t>(*number);
  }
  return endpoint;
}

std::optional<ConfigError> validate(const Options &options) {
  if (!parse_endpoint(options.endpoint)) {
    return ConfigError{ConfigError::Code::kInvalidEndpoint,
                       "Endpoint is not a well-formed http(s) URI: '" +
                           options.endpoint + "'"};
  }
  if (options.max_queue_size == 0 || options.max_export_batch_size == 0) {
    return ConfigError{ConfigError::Code::kInvalidOption,
                       "max_queue_size and max_export_batch_size must be "
                       "positive"};
  }
  if (options.max_export_batch_size > options.max_queue_size) {
    return ConfigError{ConfigError::Code::kInvalidOption,
                       "max_export_batch_size must not exceed max_queue_size"};
  }
  if (options.schedule_delay.count() <= 0 ||
      options.export_timeout.count() <= 0 ||
      options.shutdown_timeout.count() <= 0) {
    return ConfigError{ConfigError::Code::kInvalidOption,
                       "schedule_delay, export_timeout and shutdown_timeout "
                       "must be positive"};
  }
  if (options.max_attempts < 1) {
    return ConfigError{ConfigError::Code::kInvalidOption,
                       "max_attempts must be at least 1"};
  }
  if (options.initial_backoff.count() < 0 ||
      options.max_backoff < options.initial_backoff) {
    return ConfigError{ConfigError::Code::kInvalidOption,
                       "Backoff must satisfy 0 <= initial_backoff <= "
                       "max_backoff"};
  }
  return std::nullopt;
}

} // namespace Sonar
