#pragma once
#include <string>

#include "metapipe/Observable.hpp"
#include "metapipe/Units.hpp"
#include "metapipe/nodes/INode.hpp"
#include "metapipe/nodes/ObserverNode.hpp"

namespace metapipe {

/// Producing side of a node (NodeIn, NodeProc): owns the Observable and does
/// the wiring.
class ObservableNode : public INode {
public:
  using INode::INode;

  virtual const PortList& outputs() const = 0;

  /// Subscribe `consumer` so that our `source` output lands on its `dest`
  /// input. Throws PortError if either port is undeclared.
  void attach(ObserverNode& consumer, const std::string& source, const std::string& dest);

  /// Remove every edge to `consumer`; no-op if none.
  void detach(ObserverNode& consumer);

  Observable& observable() noexcept { return observable_; }
  const Observable& observable() const noexcept { return observable_; }

  const ValueMap& providing() const noexcept { return observable_.providing(); }

protected:
  Observable observable_;
};

inline void attach(ObservableNode& producer, ObserverNode& consumer,
                   const std::string& source, const std::string& dest) {
  producer.attach(consumer, source, dest);
}

inline void detach(ObservableNode& producer, ObserverNode& consumer) {
  producer.detach(consumer);
}

} // namespace metapipe
