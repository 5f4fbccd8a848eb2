#pragma once
#include <memory>
#include <string>

#include "metapipe/Observer.hpp"
#include "metapipe/Units.hpp"
#include "metapipe/nodes/INode.hpp"
#include "metapipe/nodes/ObserverNode.hpp"

namespace metapipe {

/// Terminal node: same readiness rule as NodeProc, but nothing to notify.
class NodeOut final : public INode, public ObserverNode {
public:
  explicit NodeOut(std::shared_ptr<ISink> unit, std::string name = "NodeOut");

  const ParamList& inputs() const override { return unit_->inputs(); }

  Observer& observer() noexcept override { return observer_; }
  const Observer& observer() const noexcept override { return observer_; }
  std::shared_ptr<Observer> observerHandle() override;

  void run() override;
  void shutdown() noexcept override;

  NodeState state() const;

  const std::shared_ptr<ISink>& unit() const noexcept { return unit_; }

private:
  std::shared_ptr<ISink> unit_;
  Observer observer_;
  bool stopped_ = false;
};

} // namespace metapipe
