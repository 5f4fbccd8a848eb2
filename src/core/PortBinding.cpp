#include "metapipe/PortBinding.hpp"
#include "metapipe/Errors.hpp"

namespace metapipe {

namespace {

std::string listPorts(const PortList& ports) {
  std::string out;
  for (const auto& p : ports) {
    if (!out.empty()) out += ", ";
    out += p;
  }
  return out;
}

std::string listParams(const ParamList& params) {
  std::string out;
  for (const auto& p : params) {
    if (!out.empty()) out += ", ";
    out += p.name;
  }
  return out;
}

} // namespace

void validateBinding(const PortList& outputs,
                     const ParamList& inputs,
                     const PortBinding& binding) {
  if (!hasPort(outputs, binding.source)) {
    throw PortError(PortError::Side::Source, binding.source,
                    "attach: '" + binding.source + "' is not an output of the producer (declared: " +
                      listPorts(outputs) + ")");
  }
  if (!findParam(inputs, binding.dest)) {
    throw PortError(PortError::Side::Destination, binding.dest,
                    "attach: '" + binding.dest + "' is not a parameter of the consumer (declared: " +
                      listParams(inputs) + ")");
  }
}

} // namespace metapipe
