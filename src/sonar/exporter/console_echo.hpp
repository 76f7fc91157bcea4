#pragma once

#include "sonar/sonar_records.hpp"

#include <string>

namespace Sonar::exporter {

// One-line renderings used by console echo. Exposed for tests.
std::string format_span(const SpanData &span);
std::string format_log(const LogRecord &record);

// Print to the "sonar.console" stdout logger.
void echo_span(const SpanData &span);
void echo_log(const LogRecord &record);

} // namespace Sonar::exporter
