#include "metapipe/nodes/NodeIn.hpp"

#include <stdexcept>

#include "metapipe/util/Logger.hpp"
#include "metapipe/util/Metrics.hpp"

namespace metapipe {

NodeIn::NodeIn(std::shared_ptr<IProducer> unit, std::string name)
  : ObservableNode(std::move(name)), unit_(std::move(unit)) {
  if (!unit_) throw std::invalid_argument("NodeIn: null producer");
}

void NodeIn::run() {
  if (stopped_) return;

  ValueMap out;
  try {
    out = unit_->run();
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "producer failed",
                       { {"node", name()}, {"err", ex.what()} });
    throw;
  }

  observable_.provide(std::move(out));
  countRun();
  METAPIPE_METRIC_HIT("node.runs");
  util::logger().log(util::LogLevel::Debug, "node ran", { {"node", name()} });

  observable_.notify();
}

void NodeIn::shutdown() noexcept {
  stopped_ = true;
  observable_.clear();
}

} // namespace metapipe
