#pragma once

#include "sonar/sonar_common_types.hpp"
#include "sonar/sonar_logging.hpp"

#include <memory>
#include <spdlog/logger.h>
#include <string_view>

namespace Sonar::logging {

// stdout logger used for console echo of spans and log records.
std::shared_ptr<spdlog::logger> console_logger();

// Receives log records written before initialization. Replaced through
// set_fallback_logger.
std::shared_ptr<spdlog::logger> fallback_logger();

spdlog::level::level_enum to_spdlog_level(Severity severity);

// Applies a level name such as "debug" or "warn" to the internal logger.
// Unknown names leave the level unchanged and return false.
bool set_internal_level(std::string_view level_name);

/**
 * @brief Emits the "not initialized" warning the first time it is called in
 * the process; later calls do nothing.
 */
void warn_uninitialized_once(std::string_view operation);

} // namespace Sonar::logging
