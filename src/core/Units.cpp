#include "metapipe/Units.hpp"

#include <algorithm>
#include <stdexcept>

namespace metapipe {

bool hasPort(const PortList& ports, const std::string& name) {
  return std::find(ports.begin(), ports.end(), name) != ports.end();
}

const Param* findParam(const ParamList& params, const std::string& name) {
  auto it = std::find_if(params.begin(), params.end(),
                         [&name](const Param& p) { return p.name == name; });
  return it == params.end() ? nullptr : &*it;
}

FunctionProducer::FunctionProducer(PortList outputs, Fn fn)
  : outputs_(std::move(outputs)), fn_(std::move(fn)) {
  if (!fn_) throw std::invalid_argument("FunctionProducer: empty function");
}

ValueMap FunctionProducer::run() { return fn_(); }

FunctionTransform::FunctionTransform(ParamList inputs, PortList outputs, Fn fn)
  : inputs_(std::move(inputs)), outputs_(std::move(outputs)), fn_(std::move(fn)) {
  if (!fn_) throw std::invalid_argument("FunctionTransform: empty function");
}

ValueMap FunctionTransform::run(const ValueMap& args) { return fn_(args); }

FunctionSink::FunctionSink(ParamList inputs, Fn fn)
  : inputs_(std::move(inputs)), fn_(std::move(fn)) {
  if (!fn_) throw std::invalid_argument("FunctionSink: empty function");
}

void FunctionSink::run(const ValueMap& args) { fn_(args); }

} // namespace metapipe
