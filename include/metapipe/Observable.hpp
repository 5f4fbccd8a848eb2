#pragma once

#include <memory>
#include <string>
#include <vector>

#include "metapipe/Observer.hpp"
#include "metapipe/Value.hpp"

namespace metapipe {

/// Sending end of a node. Holds the latest produced values and the ordered
/// list of downstream subscriptions.
class Observable {
public:
  struct Subscription {
    std::weak_ptr<Observer> observer;
    std::string source;   // key in providing()
    std::string dest;     // port on the observer
  };

  Observable() = default;
  Observable(const Observable&) = delete;
  Observable& operator=(const Observable&) = delete;

  /// Appends; registering the same triple twice delivers twice.
  void registerObserver(const std::shared_ptr<Observer>& observer,
                        std::string source,
                        std::string dest);

  /// Drops every subscription targeting `observer`, plus expired ones.
  void unregisterObserver(const Observer* observer);

  /// Deliver providing()[source] to every subscription, in registration order.
  /// Throws ConsistencyError (before delivering anything) if a subscribed
  /// source port has no value.
  void notify();

  std::vector<std::shared_ptr<Observer>> observers() const;
  bool isObserved(const Observer* observer) const;

  const std::vector<Subscription>& subscriptions() const noexcept { return subs_; }

  void provide(ValueMap values);
  const ValueMap& providing() const noexcept { return providing_; }
  ValueMap& providing() noexcept { return providing_; }

  void clear() noexcept;

private:
  ValueMap providing_;
  std::vector<Subscription> subs_;
};

} // namespace metapipe
