#include "metapipe/Propagation.hpp"

#include <atomic>
#include <vector>

#include "metapipe/Errors.hpp"
#include "metapipe/Observer.hpp"
#include "metapipe/util/Logger.hpp"
#include "metapipe/util/Metrics.hpp"

namespace metapipe {

namespace {

std::atomic<std::size_t> g_maxDepth{PropagationLimits{}.maxDepth};
std::atomic<std::size_t> g_maxDeliveries{PropagationLimits{}.maxDeliveries};

struct Queued {
  Delivery delivery;
  std::size_t depth;
};

// `pending` is a stack: the top is the next delivery to drain.
struct Wave {
  std::vector<Queued> pending;
  std::size_t depth = 0;
  std::size_t delivered = 0;
};

thread_local Wave* t_wave = nullptr;

// Installs a wave for this thread and always uninstalls it
class WaveGuard {
public:
  explicit WaveGuard(Wave& w) { t_wave = &w; }
  ~WaveGuard() { t_wave = nullptr; }
  WaveGuard(const WaveGuard&) = delete;
  WaveGuard& operator=(const WaveGuard&) = delete;
};

// Reversed so the first subscription ends up on top and its whole downstream
// chain drains before the next sibling.
void push(Wave& w, std::vector<Delivery>& batch, std::size_t depth) {
  for (auto it = batch.rbegin(); it != batch.rend(); ++it) {
    w.pending.push_back(Queued{std::move(*it), depth});
  }
}

} // namespace

void setPropagationLimits(const PropagationLimits& limits) {
  g_maxDepth.store(limits.maxDepth, std::memory_order_relaxed);
  g_maxDeliveries.store(limits.maxDeliveries, std::memory_order_relaxed);
}

PropagationLimits propagationLimits() {
  PropagationLimits l;
  l.maxDepth      = g_maxDepth.load(std::memory_order_relaxed);
  l.maxDeliveries = g_maxDeliveries.load(std::memory_order_relaxed);
  return l;
}

bool Propagation::inWave() noexcept { return t_wave != nullptr; }

std::size_t Propagation::depth() noexcept { return t_wave ? t_wave->depth : 0; }

void Propagation::dispatch(std::vector<Delivery> batch) {
  if (batch.empty()) return;

  if (t_wave) {
    const std::size_t next = t_wave->depth + 1;
    const std::size_t maxDepth = g_maxDepth.load(std::memory_order_relaxed);
    if (next > maxDepth) {
      throw GraphCycleError("propagation exceeded max depth " + std::to_string(maxDepth) +
                            " (cycle in the graph?)");
    }
    push(*t_wave, batch, next);
    return;
  }

  Wave wave;
  WaveGuard guard(wave);
  push(wave, batch, 1);
  METAPIPE_METRIC_HIT("propagation.waves");

  const std::size_t maxDeliveries = g_maxDeliveries.load(std::memory_order_relaxed);

  try {
    while (!wave.pending.empty()) {
      Queued q = std::move(wave.pending.back());
      wave.pending.pop_back();

      if (++wave.delivered > maxDeliveries) {
        throw GraphCycleError("propagation exceeded " + std::to_string(maxDeliveries) +
                              " deliveries in one wave (cycle in the graph?)");
      }

      auto target = q.delivery.target.lock();
      if (!target) {
        util::logger().log(util::LogLevel::Debug, "delivery to expired observer skipped",
                           { {"port", q.delivery.port} });
        continue;
      }

      wave.depth = q.depth;
      METAPIPE_METRIC_HIT("propagation.deliveries");
      target->update(q.delivery.port, std::move(q.delivery.value));
    }
  } catch (const std::exception& ex) {
    METAPIPE_METRIC_HIT("propagation.aborted");
    util::logger().log(util::LogLevel::Warn, "propagation wave aborted",
                       { {"err", ex.what()},
                         {"depth", std::to_string(wave.depth)},
                         {"dropped", std::to_string(wave.pending.size())} });
    throw;
  }
}

} // namespace metapipe
