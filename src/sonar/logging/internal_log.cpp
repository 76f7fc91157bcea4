#include "sonar/logging/internal_log.hpp"

#include <atomic>
#include <mutex>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace Sonar::logging {

namespace {
std::atomic<bool> g_uninitialized_warned{false};

// A replaceable logger. Slots are never destroyed, so a tracer torn down
// during static destruction can still log through them.
struct LoggerSlot {
  std::mutex mutex;
  std::shared_ptr<spdlog::logger> logger;
};

// Loggers are kept out of the spdlog registry so that a host application
// using the same names is not disturbed.
std::shared_ptr<spdlog::logger> make_default_internal_logger() {
  auto logger = std::make_shared<spdlog::logger>(
      "sonar", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  logger->set_level(spdlog::level::warn);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  return logger;
}

std::shared_ptr<spdlog::logger> make_default_fallback_logger() {
  auto logger = std::make_shared<spdlog::logger>(
      "sonar.fallback",
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  logger->set_level(spdlog::level::trace);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  return logger;
}

LoggerSlot &internal_slot() {
  static auto *slot = new LoggerSlot();
  return *slot;
}

LoggerSlot &fallback_slot() {
  static auto *slot = new LoggerSlot();
  return *slot;
}

std::shared_ptr<spdlog::logger>
get_or_create(LoggerSlot &slot,
              std::shared_ptr<spdlog::logger> (*make_default)()) {
  std::lock_guard<std::mutex> lock(slot.mutex);
  if (!slot.logger) {
    slot.logger = make_default();
  }
  return slot.logger;
}

void replace(LoggerSlot &slot, std::shared_ptr<spdlog::logger> logger,
             std::shared_ptr<spdlog::logger> (*make_default)()) {
  std::lock_guard<std::mutex> lock(slot.mutex);
  slot.logger = logger ? std::move(logger) : make_default();
}
} // namespace

std::shared_ptr<spdlog::logger> internal_logger() {
  return get_or_create(internal_slot(), make_default_internal_logger);
}

void set_internal_logger(std::shared_ptr<spdlog::logger> logger) {
  replace(internal_slot(), std::move(logger), make_default_internal_logger);
}

std::shared_ptr<spdlog::logger> fallback_logger() {
  return get_or_create(fallback_slot(), make_default_fallback_logger);
}

void set_fallback_logger(std::shared_ptr<spdlog::logger> logger) {
  replace(fallback_slot(), std::move(logger), make_default_fallback_logger);
}

std::shared_ptr<spdlog::logger> console_logger() {
  static auto *logger = new std::shared_ptr<spdlog::logger>([] {
    auto l = std::make_shared<spdlog::logger>(
        "sonar.console",
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    l->set_level(spdlog::level::trace);
    l->set_pattern("%v");
    return l;
  }());
  return *logger;
}

spdlog::level::level_enum to_spdlog_level(Severity severity) {
  switch (severity) {
  case Severity::kTrace:
    return spdlog::level::trace;
  case Severity::kDebug:
    return spdlog::level::debug;
  case Severity::kInformation:
    return spdlog::level::info;
  case Severity::kWarning:
    return spdlog::level::warn;
  case Severity::kError:
    return spdlog::level::err;
  case Severity::kCritical:
    return spdlog::level::critical;
  }
  return spdlog::level::info;
}

bool set_internal_level(std::string_view level_name) {
  const auto level = spdlog::level::from_str(std::string(level_name));
  // from_str maps unknown names to "off"; only accept "off" when asked for.
  if (level == spdlog::level::off && level_name != "off") {
    return false;
  }
  internal_logger()->set_level(level);
  return true;
}

void warn_uninitialized_once(std::string_view operation) {
  if (g_uninitialized_warned.exchange(true, std::memory_order_relaxed)) {
    return;
  }
  internal_logger()->warn(
      "{} called before Sonar::initialize; telemetry is disabled until "
      "initialization succeeds (this warning is shown once)",
      operation);
}

} // namespace Sonar::logging
