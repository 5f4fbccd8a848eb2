// File: src/main.cpp
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "metapipe/Errors.hpp"
#include "metapipe/Propagation.hpp"
#include "metapipe/UnitRegistry.hpp"
#include "metapipe/graph/GraphBuilder.hpp"
#include "metapipe/util/Config.hpp"
#include "metapipe/util/Logger.hpp"
#include "metapipe/util/Metrics.hpp"

// ---------------------------
// main
//   argv[1] = graph description (JSON)
//   argv[2] = configFilePath (optional)
// ---------------------------
int main(int argc, char* argv[]) {
  using namespace metapipe::util;

  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <graph.json> [config]\n";
    return EXIT_FAILURE;
  }
  const std::string graphPath = argv[1];

  // ---------------------------
  // 1) Config
  // ---------------------------
  Config cfg;
  if (argc > 2) {
    if (!cfg.loadFromFile(argv[2])) {
      std::cerr << "[config] failed to load file: " << argv[2] << "\n";
      return EXIT_FAILURE;
    }
  }

  // ---------------------------
  // 2) Logger + propagation limits
  // ---------------------------
  logger().setLevel(parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logJson);
  if (!cfg.logFile.empty()) logger().setFile(cfg.logFile);

  metapipe::setPropagationLimits(cfg.limits());

  logger().log(LogLevel::Info, "boot",
               { {"graph", graphPath},
                 {"maxDepth", std::to_string(cfg.maxPropagationDepth)},
                 {"maxDeliveries", std::to_string(cfg.maxWaveDeliveries)} });

  // ---------------------------
  // 3) Build
  // ---------------------------
  auto& registry = metapipe::UnitRegistry::instance();
  metapipe::registerBuiltinUnits(registry);

  std::shared_ptr<metapipe::Graph> graph;
  try {
    graph = metapipe::graph::buildFromFile(graphPath, registry);
  } catch (const metapipe::PortError& ex) {
    logger().log(LogLevel::Error, "bad wiring", { {"port", ex.port()}, {"err", ex.what()} });
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "build failed", { {"err", ex.what()} });
    return EXIT_FAILURE;
  }

  // ---------------------------
  // 4) Run
  // ---------------------------
  try {
    graph->run();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "run failed", { {"err", ex.what()} });
    return EXIT_FAILURE;
  }

  std::vector<Field> fields;
  for (const auto& kv : MetricRegistry::instance().snapshotCounters()) {
    fields.push_back({kv.first, std::to_string(static_cast<long long>(kv.second))});
  }
  logger().log(LogLevel::Info, "metrics", fields);

  graph->shutdown();
  logger().log(LogLevel::Info, "stopped", {});
  return EXIT_SUCCESS;
}
