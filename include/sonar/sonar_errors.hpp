#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Sonar {

/**
 * @brief Raised when a boundary value (span kind, severity, protocol name)
 * is not one of the recognized enumerators. Fatal to the single call only.
 */
class InvalidArgumentError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @brief Setup-time failure returned by Sonar::initialize. Never thrown.
 */
struct ConfigError {
  enum class Code : uint8_t {
    kInvalidEndpoint,
    kInvalidProtocol,
    kInvalidOption,
    kTransportSetup
  };

  Code code;
  std::string message;
};

std::string_view to_string(ConfigError::Code code);

} // namespace Sonar
