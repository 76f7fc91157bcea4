#pragma once

#include "sonar/sonar_common_types.hpp"

namespace Sonar::detail {

// Random, never-invalid identifiers. Each thread draws from its own engine.
TraceId generate_trace_id();
SpanId generate_span_id();

} // namespace Sonar::detail
