#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "metapipe/Value.hpp"

namespace metapipe {

// A named input parameter of a transform or sink. Optional parameters may be
// wired like any other, but a node does not wait for them.
struct Param {
  std::string name;
  bool required = true;
};

using ParamList = std::vector<Param>;
using PortList  = std::vector<std::string>;

bool hasPort(const PortList& ports, const std::string& name);
const Param* findParam(const ParamList& params, const std::string& name);

/// Zero-input unit; entry point of a graph.
class IProducer {
public:
  virtual ~IProducer() = default;

  virtual const PortList& outputs() const = 0;
  virtual ValueMap run() = 0;
};

/// Named inputs in, named outputs out.
class ITransform {
public:
  virtual ~ITransform() = default;

  virtual const ParamList& inputs() const = 0;
  virtual const PortList& outputs() const = 0;
  virtual ValueMap run(const ValueMap& args) = 0;
};

/// Named inputs in, side effect out.
class ISink {
public:
  virtual ~ISink() = default;

  virtual const ParamList& inputs() const = 0;
  virtual void run(const ValueMap& args) = 0;
};

using AnyUnit = std::variant<std::shared_ptr<IProducer>,
                             std::shared_ptr<ITransform>,
                             std::shared_ptr<ISink>>;

// ---- std::function adapters ----

class FunctionProducer final : public IProducer {
public:
  using Fn = std::function<ValueMap()>;

  FunctionProducer(PortList outputs, Fn fn);

  const PortList& outputs() const override { return outputs_; }
  ValueMap run() override;

private:
  PortList outputs_;
  Fn fn_;
};

class FunctionTransform final : public ITransform {
public:
  using Fn = std::function<ValueMap(const ValueMap&)>;

  FunctionTransform(ParamList inputs, PortList outputs, Fn fn);

  const ParamList& inputs() const override { return inputs_; }
  const PortList& outputs() const override { return outputs_; }
  ValueMap run(const ValueMap& args) override;

private:
  ParamList inputs_;
  PortList outputs_;
  Fn fn_;
};

class FunctionSink final : public ISink {
public:
  using Fn = std::function<void(const ValueMap&)>;

  FunctionSink(ParamList inputs, Fn fn);

  const ParamList& inputs() const override { return inputs_; }
  void run(const ValueMap& args) override;

private:
  ParamList inputs_;
  Fn fn_;
};

} // namespace metapipe
