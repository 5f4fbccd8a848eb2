#pragma once

#include <string>

#include "metapipe/Units.hpp"

namespace metapipe {

// One (output-field -> input-parameter) pair requested at wiring time
struct PortBinding {
  std::string source;
  std::string dest;
};

/// Throws PortError unless `binding.source` is in `outputs` and
/// `binding.dest` names one of `inputs`.
void validateBinding(const PortList& outputs,
                     const ParamList& inputs,
                     const PortBinding& binding);

} // namespace metapipe
