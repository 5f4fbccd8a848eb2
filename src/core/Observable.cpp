#include "metapipe/Observable.hpp"

#include <algorithm>

#include "metapipe/Errors.hpp"
#include "metapipe/Propagation.hpp"

namespace metapipe {

void Observable::registerObserver(const std::shared_ptr<Observer>& observer,
                                  std::string source,
                                  std::string dest) {
  subs_.push_back(Subscription{observer, std::move(source), std::move(dest)});
}

void Observable::unregisterObserver(const Observer* observer) {
  subs_.erase(std::remove_if(subs_.begin(), subs_.end(),
                             [observer](const Subscription& s) {
                               auto o = s.observer.lock();
                               return !o || o.get() == observer;
                             }),
              subs_.end());
}

void Observable::notify() {
  std::vector<Delivery> batch;
  batch.reserve(subs_.size());

  for (const auto& s : subs_) {
    if (s.observer.expired()) continue;
    auto it = providing_.find(s.source);
    if (it == providing_.end()) {
      throw ConsistencyError("notify: no value for source port '" + s.source + "'");
    }
    batch.push_back(Delivery{s.observer, s.dest, it->second});
  }

  Propagation::dispatch(std::move(batch));
}

std::vector<std::shared_ptr<Observer>> Observable::observers() const {
  std::vector<std::shared_ptr<Observer>> out;
  out.reserve(subs_.size());
  for (const auto& s : subs_) {
    if (auto o = s.observer.lock()) out.push_back(std::move(o));
  }
  return out;
}

bool Observable::isObserved(const Observer* observer) const {
  return std::any_of(subs_.begin(), subs_.end(), [observer](const Subscription& s) {
    auto o = s.observer.lock();
    return o && o.get() == observer;
  });
}

void Observable::provide(ValueMap values) {
  for (auto& [port, v] : values) {
    providing_[port] = std::move(v);
  }
}

void Observable::clear() noexcept {
  providing_.clear();
  subs_.clear();
}

} // namespace metapipe
