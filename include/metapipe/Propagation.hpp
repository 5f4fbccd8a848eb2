#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "metapipe/Value.hpp"

namespace metapipe {

class Observer;

struct PropagationLimits {
  std::size_t maxDepth      = 1024;     // longest producer->consumer chain per wave
  std::size_t maxDeliveries = 1000000;  // total deliveries per wave
};

void setPropagationLimits(const PropagationLimits& limits);
PropagationLimits propagationLimits();

// A value on its way to one Observer port
struct Delivery {
  std::weak_ptr<Observer> target;
  std::string port;
  Value value;
};

/**
 * Iterative replacement for notify()->update()->run()->notify() recursion.
 *
 * The first dispatch() on a thread opens a wave and drains it before
 * returning. Any dispatch() issued while that wave drains (a node running
 * because of a delivery and notifying in turn) only pushes onto the pending
 * stack one level deeper. Draining is depth first, in the same order the
 * recursive notify chain would run: a subscriber's whole downstream runs
 * before its next sibling is delivered. Exceeding either limit throws
 * GraphCycleError and discards the rest of the wave.
 */
class Propagation {
public:
  static void dispatch(std::vector<Delivery> batch);

  static bool inWave() noexcept;
  // Depth of the delivery currently being drained; 0 outside a wave.
  static std::size_t depth() noexcept;
};

} // namespace metapipe
