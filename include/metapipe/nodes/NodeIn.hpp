#pragma once
#include <memory>
#include <string>

#include "metapipe/Units.hpp"
#include "metapipe/nodes/ObservableNode.hpp"

namespace metapipe {

/// Wraps a zero-input producer. Always ready; run() produces, then notifies.
class NodeIn final : public ObservableNode {
public:
  explicit NodeIn(std::shared_ptr<IProducer> unit, std::string name = "NodeIn");

  const PortList& outputs() const override { return unit_->outputs(); }

  void run() override;
  void shutdown() noexcept override;

  const std::shared_ptr<IProducer>& unit() const noexcept { return unit_; }

private:
  std::shared_ptr<IProducer> unit_;
  bool stopped_ = false;
};

} // namespace metapipe
