#include "metapipe/Observer.hpp"

namespace metapipe {

Observer::Observer(UpdateHook hook)
  : hook_(std::move(hook)) {}

void Observer::update(const std::string& port, Value value) {
  consuming_[port] = std::move(value);
  if (hook_) hook_();
}

bool Observer::has(const std::string& port) const {
  return consuming_.find(port) != consuming_.end();
}

} // namespace metapipe
