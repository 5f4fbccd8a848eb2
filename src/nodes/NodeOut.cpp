#include "metapipe/nodes/NodeOut.hpp"

#include <stdexcept>

#include "metapipe/util/Logger.hpp"
#include "metapipe/util/Metrics.hpp"

namespace metapipe {

NodeOut::NodeOut(std::shared_ptr<ISink> unit, std::string name)
  : INode(std::move(name)),
    unit_(std::move(unit)),
    observer_([this] { run(); }) {
  if (!unit_) throw std::invalid_argument("NodeOut: null sink");
}

std::shared_ptr<Observer> NodeOut::observerHandle() {
  return std::shared_ptr<Observer>(shared_from_this(), &observer_);
}

void NodeOut::run() {
  if (stopped_) return;

  if (!ready()) {
    METAPIPE_METRIC_HIT("node.not_ready");
    return;
  }

  try {
    unit_->run(observer_.consuming());
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "sink failed",
                       { {"node", name()}, {"err", ex.what()} });
    throw;
  }

  observer_.clear();
  countRun();
  METAPIPE_METRIC_HIT("node.runs");
  util::logger().log(util::LogLevel::Debug, "node ran", { {"node", name()} });
}

void NodeOut::shutdown() noexcept {
  stopped_ = true;
  observer_.clear();
}

NodeState NodeOut::state() const {
  if (runs() > 0 && consuming().empty()) return NodeState::Executed;
  if (ready()) return NodeState::Ready;
  return NodeState::AwaitingInput;
}

} // namespace metapipe
