#include "metapipe/nodes/ObservableNode.hpp"

#include "metapipe/PortBinding.hpp"
#include "metapipe/util/Logger.hpp"

namespace metapipe {

void ObservableNode::attach(ObserverNode& consumer,
                            const std::string& source,
                            const std::string& dest) {
  validateBinding(outputs(), consumer.inputs(), PortBinding{source, dest});
  observable_.registerObserver(consumer.observerHandle(), source, dest);

  util::logger().log(util::LogLevel::Debug, "attached",
                     { {"from", name()}, {"source", source}, {"dest", dest} });
}

void ObservableNode::detach(ObserverNode& consumer) {
  observable_.unregisterObserver(&consumer.observer());
}

} // namespace metapipe
