#pragma once

#include <stdexcept>
#include <string>

namespace metapipe {

// Raised by attach() when a binding names a port the unit does not declare.
class PortError : public std::runtime_error {
public:
  enum class Side { Source, Destination };

  PortError(Side side, std::string port, const std::string& what)
    : std::runtime_error(what), side_(side), port_(std::move(port)) {}

  Side side() const noexcept { return side_; }
  const std::string& port() const noexcept { return port_; }

private:
  Side side_;
  std::string port_;
};

// An Observable was asked to deliver a source port it holds no value for.
class ConsistencyError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Propagation exceeded its depth/delivery limits, or a graph description loops.
class GraphCycleError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace metapipe
