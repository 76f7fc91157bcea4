#pragma once

#include <memory>
#include <spdlog/logger.h>

namespace Sonar::logging {

/**
 * @brief Logger for Sonar's own diagnostics (export failures, dropped
 * batches, use before initialization). Defaults to a colored stderr logger
 * named "sonar" at warn level.
 */
std::shared_ptr<spdlog::logger> internal_logger();

// Replaces the diagnostics logger, e.g. to route it into the host's own
// spdlog setup. Passing nullptr restores the default.
void set_internal_logger(std::shared_ptr<spdlog::logger> logger);

// Replaces the logger that write_log uses while Sonar is not initialized
// (default: colored stderr logger named "sonar.fallback"). Passing nullptr
// restores the default.
void set_fallback_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace Sonar::logging
