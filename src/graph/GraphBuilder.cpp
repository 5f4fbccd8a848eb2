#include "metapipe/graph/GraphBuilder.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

// RapidJSON
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "metapipe/Errors.hpp"
#include "metapipe/JsonValidator.hpp"
#include "metapipe/nodes/NodeIn.hpp"
#include "metapipe/nodes/NodeOut.hpp"
#include "metapipe/nodes/NodeProc.hpp"
#include "metapipe/util/Logger.hpp"

// ----------------- Tiny helpers -----------------
namespace {

inline std::string strOr(const rapidjson::Value& v, const char* k, const std::string& def="") {
  return (v.HasMember(k) && v[k].IsString()) ? std::string(v[k].GetString()) : def;
}

// Shared by every node description without "params"
const rapidjson::Value& emptyParams() {
  static const rapidjson::Value empty(rapidjson::kObjectType);
  return empty;
}

std::string joinIds(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ", ";
    out += id;
  }
  return out;
}

} // namespace

// ----------------- Builder impl -----------------
namespace metapipe::graph {

std::shared_ptr<INode> makeNode(AnyUnit unit, const std::string& name) {
  return std::visit([&name](auto&& u) -> std::shared_ptr<INode> {
    using U = std::decay_t<decltype(u)>;
    if (!u) throw std::runtime_error("GraphBuilder: unit factory returned null for '" + name + "'");
    if constexpr (std::is_same_v<U, std::shared_ptr<IProducer>>) {
      return std::make_shared<NodeIn>(u, name);
    } else if constexpr (std::is_same_v<U, std::shared_ptr<ITransform>>) {
      return std::make_shared<NodeProc>(u, name);
    } else {
      return std::make_shared<NodeOut>(u, name);
    }
  }, std::move(unit));
}

std::shared_ptr<INode> buildOne(const rapidjson::Value& spec, const UnitRegistry& registry) {
  JsonValidator::validateNode(spec);

  const std::string id   = spec["id"].GetString();
  const std::string unit = spec["unit"].GetString();
  const std::string name = strOr(spec, "name", id);
  const auto& params = spec.HasMember("params") ? spec["params"] : emptyParams();

  try {
    return makeNode(registry.create(unit, params), name);
  } catch (const std::runtime_error& ex) {
    throw std::runtime_error("GraphBuilder: node '" + id + "': " + ex.what());
  }
}

std::shared_ptr<Graph> build(const rapidjson::Value& doc, const UnitRegistry& registry) {
  JsonValidator::validateGraph(doc);

  auto g = std::make_shared<Graph>();
  for (const auto& spec : doc["nodes"].GetArray()) {
    g->add(spec["id"].GetString(), buildOne(spec, registry));
  }

  std::vector<Graph::Edge> edges;
  if (doc.HasMember("edges")) {
    for (const auto& e : doc["edges"].GetArray()) {
      Graph::Edge edge{ e["from"].GetString(), e["source"].GetString(),
                        e["to"].GetString(),   e["dest"].GetString() };
      if (!g->node(edge.from)) throw std::runtime_error("GraphBuilder: edge from unknown node '" + edge.from + "'");
      if (!g->node(edge.to))   throw std::runtime_error("GraphBuilder: edge to unknown node '" + edge.to + "'");
      edges.push_back(std::move(edge));
    }
  }

  auto looped = cyclicNodes(g->ids(), edges);
  if (!looped.empty()) {
    throw GraphCycleError("GraphBuilder: cycle through nodes: " + joinIds(looped));
  }

  for (const auto& e : edges) g->connect(e);

  util::logger().log(util::LogLevel::Info, "graph built",
                     { {"nodes", std::to_string(g->size())}, {"edges", std::to_string(edges.size())} });
  return g;
}

std::shared_ptr<Graph> buildFromString(const std::string& json, const UnitRegistry& registry) {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError()) {
    throw std::runtime_error(std::string("GraphBuilder: JSON parse error at offset ") +
                             std::to_string(doc.GetErrorOffset()) + ": " +
                             rapidjson::GetParseError_En(doc.GetParseError()));
  }
  return build(doc, registry);
}

std::shared_ptr<Graph> buildFromFile(const std::string& path, const UnitRegistry& registry) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("GraphBuilder: cannot open '" + path + "'");
  std::ostringstream ss;
  ss << in.rdbuf();
  return buildFromString(ss.str(), registry);
}

} // namespace metapipe::graph
