#pragma once

#include "sonar/sonar_exporter.hpp"
#include "sonar/sonar_options.hpp"

#include <memory>

namespace Sonar::exporter {

// Builds the OTLP transport selected by options.protocol. Throws
// std::runtime_error when the transport cannot be set up.
std::unique_ptr<Exporter> make_otlp_exporter(const Options &options,
                                             const Endpoint &endpoint);

} // namespace Sonar::exporter
