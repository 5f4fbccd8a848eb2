#pragma once
#include <memory>
#include <string>

#include "metapipe/Observer.hpp"
#include "metapipe/Units.hpp"
#include "metapipe/nodes/ObservableNode.hpp"
#include "metapipe/nodes/ObserverNode.hpp"

namespace metapipe {

/// Wraps a transform. Every delivery to its observer attempts run(); the
/// transform executes only once all required parameters are present, after
/// which inputs are cleared and outputs pushed downstream.
class NodeProc final : public ObservableNode, public ObserverNode {
public:
  explicit NodeProc(std::shared_ptr<ITransform> unit, std::string name = "NodeProc");

  const PortList& outputs() const override { return unit_->outputs(); }
  const ParamList& inputs() const override { return unit_->inputs(); }

  Observer& observer() noexcept override { return observer_; }
  const Observer& observer() const noexcept override { return observer_; }
  std::shared_ptr<Observer> observerHandle() override;

  void run() override;
  void shutdown() noexcept override;

  NodeState state() const;

  const std::shared_ptr<ITransform>& unit() const noexcept { return unit_; }

private:
  std::shared_ptr<ITransform> unit_;
  Observer observer_;
  bool stopped_ = false;
};

} // namespace metapipe
