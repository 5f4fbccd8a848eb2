#pragma once

#include <cstddef>
#include <string>

#include "metapipe/Propagation.hpp"

namespace metapipe {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  PropagationLimits limits() const;

  // Propagation guards
  std::size_t maxPropagationDepth = PropagationLimits{}.maxDepth;
  std::size_t maxWaveDeliveries   = PropagationLimits{}.maxDeliveries;

  // Logging
  std::string logLevel = "info";
  bool        logJson  = false;
  std::string logFile;          // empty -> stdout

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
  static bool parseBool(const std::string& s);
  static std::size_t parseLimit(const std::string& s);
};

} // namespace util
} // namespace metapipe
