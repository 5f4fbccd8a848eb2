#pragma once
#include <memory>
#include <string>
#include <vector>

#include "metapipe/Observer.hpp"
#include "metapipe/Units.hpp"

namespace metapipe {

enum class NodeState {
  AwaitingInput,
  Ready,
  Executed
};

const char* stateName(NodeState s);

// True once every required parameter has a value in `consuming`
bool inputsReady(const ParamList& params, const ValueMap& consuming);
std::vector<std::string> missingInputs(const ParamList& params, const ValueMap& consuming);

/// Consuming side of a node (NodeProc, NodeOut): something attach() can
/// point an edge at.
class ObserverNode {
public:
  virtual ~ObserverNode() = default;

  virtual const ParamList& inputs() const = 0;

  virtual Observer& observer() noexcept = 0;
  virtual const Observer& observer() const noexcept = 0;

  // Shares ownership with the node itself; throws std::bad_weak_ptr if the
  // node is not held by a shared_ptr.
  virtual std::shared_ptr<Observer> observerHandle() = 0;

  const ValueMap& consuming() const noexcept { return observer().consuming(); }
  bool ready() const { return inputsReady(inputs(), consuming()); }
};

} // namespace metapipe
