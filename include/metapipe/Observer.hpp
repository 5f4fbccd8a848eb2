#pragma once

#include <functional>
#include <string>

#include "metapipe/Value.hpp"

namespace metapipe {

/// Receiving end of an edge. Accumulates delivered values per port and pokes
/// its owner after every single delivery.
class Observer {
public:
  using UpdateHook = std::function<void()>;

  explicit Observer(UpdateHook hook = {});

  Observer(const Observer&) = delete;
  Observer& operator=(const Observer&) = delete;

  /// Store `value` under `port` (last write wins), then call the hook.
  void update(const std::string& port, Value value);

  const ValueMap& consuming() const noexcept { return consuming_; }
  ValueMap& consuming() noexcept { return consuming_; }

  bool has(const std::string& port) const;
  void clear() noexcept { consuming_.clear(); }

  void setUpdateHook(UpdateHook hook) { hook_ = std::move(hook); }

private:
  UpdateHook hook_;
  ValueMap consuming_;
};

} // namespace metapipe
