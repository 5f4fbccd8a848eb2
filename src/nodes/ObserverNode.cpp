#include "metapipe/nodes/ObserverNode.hpp"

namespace metapipe {

const char* stateName(NodeState s) {
  switch (s) {
    case NodeState::AwaitingInput: return "awaiting_input";
    case NodeState::Ready:         return "ready";
    case NodeState::Executed:      return "executed";
  }
  return "awaiting_input";
}

bool inputsReady(const ParamList& params, const ValueMap& consuming) {
  for (const auto& p : params) {
    if (p.required && consuming.find(p.name) == consuming.end()) return false;
  }
  return true;
}

std::vector<std::string> missingInputs(const ParamList& params, const ValueMap& consuming) {
  std::vector<std::string> out;
  for (const auto& p : params) {
    if (p.required && consuming.find(p.name) == consuming.end()) out.push_back(p.name);
  }
  return out;
}

} // namespace metapipe
