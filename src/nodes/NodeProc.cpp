#include "metapipe/nodes/NodeProc.hpp"

#include <stdexcept>

#include "metapipe/util/Logger.hpp"
#include "metapipe/util/Metrics.hpp"

namespace metapipe {

namespace {

std::string joinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& n : names) {
    if (!out.empty()) out += ',';
    out += n;
  }
  return out;
}

} // namespace

NodeProc::NodeProc(std::shared_ptr<ITransform> unit, std::string name)
  : ObservableNode(std::move(name)),
    unit_(std::move(unit)),
    observer_([this] { run(); }) {
  if (!unit_) throw std::invalid_argument("NodeProc: null transform");
}

std::shared_ptr<Observer> NodeProc::observerHandle() {
  return std::shared_ptr<Observer>(shared_from_this(), &observer_);
}

void NodeProc::run() {
  if (stopped_) return;

  if (!ready()) {
    METAPIPE_METRIC_HIT("node.not_ready");
    auto& log = util::logger();
    if (log.enabled(util::LogLevel::Trace)) {
      log.log(util::LogLevel::Trace, "node not ready",
              { {"node", name()}, {"missing", joinNames(missingInputs(inputs(), consuming()))} });
    }
    return;
  }

  ValueMap out;
  try {
    out = unit_->run(observer_.consuming());
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "transform failed",
                       { {"node", name()}, {"err", ex.what()} });
    throw;
  }

  observable_.provide(std::move(out));
  observer_.clear();
  countRun();
  METAPIPE_METRIC_HIT("node.runs");
  util::logger().log(util::LogLevel::Debug, "node ran", { {"node", name()} });

  observable_.notify();
}

void NodeProc::shutdown() noexcept {
  stopped_ = true;
  observer_.clear();
  observable_.clear();
}

NodeState NodeProc::state() const {
  if (runs() > 0 && consuming().empty()) return NodeState::Executed;
  if (ready()) return NodeState::Ready;
  return NodeState::AwaitingInput;
}

} // namespace metapipe
