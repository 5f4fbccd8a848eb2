#include "metapipe/UnitRegistry.hpp"

#include <memory>
#include <stdexcept>

#include "metapipe/JsonValue.hpp"
#include "metapipe/util/Logger.hpp"

// ----------------- Tiny helpers -----------------
namespace {

using namespace metapipe;

inline std::string strOr(const rapidjson::Value& v, const char* k, const std::string& def) {
  return (v.IsObject() && v.HasMember(k) && v[k].IsString()) ? std::string(v[k].GetString()) : def;
}
inline double numOr(const rapidjson::Value& v, const char* k, double def) {
  return (v.IsObject() && v.HasMember(k) && v[k].IsNumber()) ? v[k].GetDouble() : def;
}

std::vector<std::string> stringList(const rapidjson::Value& v, const char* k, const char* unit) {
  std::vector<std::string> out;
  if (!v.IsObject() || !v.HasMember(k)) return out;
  if (!v[k].IsArray()) throw std::runtime_error(std::string(unit) + ": '" + k + "' must be an array");
  for (const auto& e : v[k].GetArray()) {
    if (!e.IsString()) throw std::runtime_error(std::string(unit) + ": '" + k + "' entries must be strings");
    out.emplace_back(e.GetString());
  }
  return out;
}

double numberArg(const ValueMap& args, const std::string& port, const char* unit) {
  auto it = args.find(port);
  if (it == args.end()) throw std::runtime_error(std::string(unit) + ": missing '" + port + "'");
  auto n = asNumber(it->second);
  if (!n) throw std::runtime_error(std::string(unit) + ": '" + port + "' is not a number");
  return *n;
}

// constant: emits params.values as-is
AnyUnit makeConstant(const rapidjson::Value& params) {
  if (!params.IsObject() || !params.HasMember("values") || !params["values"].IsObject())
    throw std::runtime_error("constant: 'values' object required");

  PortList outputs;
  ValueMap values;
  for (const auto& m : params["values"].GetObject()) {
    std::string port = m.name.GetString();
    outputs.push_back(port);
    values.emplace(std::move(port), valueFromJson(m.value));
  }
  return std::make_shared<FunctionProducer>(std::move(outputs), [values] { return values; });
}

// scale: out = in * factor
AnyUnit makeScale(const rapidjson::Value& params) {
  const std::string in  = strOr(params, "in", "x");
  const std::string out = strOr(params, "out", "y");
  const double factor   = numOr(params, "factor", 1.0);
  return std::make_shared<FunctionTransform>(
    ParamList{ {in, true} }, PortList{ out },
    [in, out, factor](const ValueMap& args) {
      return ValueMap{ {out, numberArg(args, in, "scale") * factor} };
    });
}

// add: sum = a + b
AnyUnit makeAdd(const rapidjson::Value&) {
  return std::make_shared<FunctionTransform>(
    ParamList{ {"a", true}, {"b", true} }, PortList{ "sum" },
    [](const ValueMap& args) {
      return ValueMap{ {"sum", numberArg(args, "a", "add") + numberArg(args, "b", "add")} };
    });
}

// log: one info line per execution with every received port
AnyUnit makeLog(const rapidjson::Value& params) {
  ParamList inputs;
  for (auto& p : stringList(params, "ports", "log"))    inputs.push_back(Param{p, true});
  for (auto& p : stringList(params, "optional", "log")) inputs.push_back(Param{p, false});
  if (inputs.empty()) throw std::runtime_error("log: 'ports' must name at least one port");

  const std::string label = strOr(params, "label", "log");
  return std::make_shared<FunctionSink>(
    inputs,
    [inputs, label](const ValueMap& args) {
      std::vector<util::Field> fields;
      for (const auto& p : inputs) {
        auto it = args.find(p.name);
        if (it != args.end()) fields.push_back({p.name, toString(it->second)});
      }
      util::logger().log(util::LogLevel::Info, label, fields);
    });
}

} // namespace

namespace metapipe {

void registerBuiltinUnits(UnitRegistry& registry) {
  registry.registerUnit("constant", makeConstant);
  registry.registerUnit("scale",    makeScale);
  registry.registerUnit("add",      makeAdd);
  registry.registerUnit("log",      makeLog);
}

} // namespace metapipe
