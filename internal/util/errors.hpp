#pragma once

#include <stdexcept>
#include <string>

namespace renderplan::util {

/*
  Central error types.

  Unresolved references are not errors: lookups and pattern resolution
  return empty results instead. The CLI maps these to exit codes.
*/

// The layer metadata preamble never reached its closing ")" line.
class MalformedLayerError : public std::runtime_error {
 public:
  explicit MalformedLayerError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidFrameRange : public std::invalid_argument {
 public:
  explicit InvalidFrameRange(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace renderplan::util
