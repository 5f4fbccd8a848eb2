#include "metapipe/JsonValidator.hpp"

#include "metapipe/util/Logger.hpp"

#include <stdexcept>
#include <string>

namespace metapipe {

void JsonValidator::validateGraph(const rapidjson::Value& doc) {
  if (!doc.IsObject()) {
    throw std::runtime_error("Graph description must be a JSON object");
  }

  if (!doc.HasMember("nodes") || !doc["nodes"].IsArray()) {
    throw std::runtime_error("Graph description missing nodes array");
  }
  if (doc["nodes"].Empty()) {
    throw std::runtime_error("Graph description has no nodes");
  }
  for (const auto& n : doc["nodes"].GetArray()) validateNode(n);

  if (doc.HasMember("edges")) {
    if (!doc["edges"].IsArray()) {
      throw std::runtime_error("Graph description 'edges' must be an array");
    }
    for (const auto& e : doc["edges"].GetArray()) validateEdge(e);
  }

  util::logger().log(
    util::LogLevel::Debug,
    "Graph description validated",
    { {"nodes", std::to_string(doc["nodes"].Size())} }
  );
}

void JsonValidator::validateNode(const rapidjson::Value& v) {
  if (!v.IsObject()) {
    throw std::runtime_error("Node must be an object");
  }

  requireString(v, "id");
  requireString(v, "unit");

  if (v.HasMember("params")) {
    requireMember(v, "params", rapidjson::kObjectType);
  }
  if (v.HasMember("name")) {
    requireString(v, "name");
  }
}

void JsonValidator::validateEdge(const rapidjson::Value& v) {
  if (!v.IsObject()) {
    throw std::runtime_error("Edge must be an object");
  }

  requireString(v, "from");
  requireString(v, "to");
  requireString(v, "source");
  requireString(v, "dest");
}

} // namespace metapipe
