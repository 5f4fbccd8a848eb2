#pragma once

#include <memory>
#include <string>

#include <rapidjson/document.h>

#include "metapipe/UnitRegistry.hpp"
#include "metapipe/graph/Graph.hpp"
#include "metapipe/nodes/INode.hpp"

namespace metapipe {
namespace graph {

  // ---- Low level builders (used internally & for tests) ----

  // Wrap a unit in the node kind matching its capability:
  // producer -> NodeIn, transform -> NodeProc, sink -> NodeOut.
  std::shared_ptr<INode> makeNode(AnyUnit unit, const std::string& name);

  // Build a single node from its JSON description ({"id", "unit", "params"?, "name"?}).
  std::shared_ptr<INode> buildOne(
    const rapidjson::Value& spec,
    const UnitRegistry&     registry
  );

  // ---- Public API ----

  // Build and wire a whole graph from a validated-or-not description.
  //  - std::runtime_error : malformed description, unknown unit/node id,
  //                         edge out of a sink or into a source
  //  - GraphCycleError    : the edges form a cycle (checked before wiring)
  //  - PortError          : an edge names an undeclared port
  std::shared_ptr<Graph> build(
    const rapidjson::Value& doc,
    const UnitRegistry&     registry = UnitRegistry::instance()
  );

  std::shared_ptr<Graph> buildFromString(
    const std::string&  json,
    const UnitRegistry& registry = UnitRegistry::instance()
  );

  std::shared_ptr<Graph> buildFromFile(
    const std::string&  path,
    const UnitRegistry& registry = UnitRegistry::instance()
  );

} // namespace graph
} // namespace metapipe
