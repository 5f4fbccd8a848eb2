// include/metapipe/nodes/INode.hpp
#pragma once
#include <cstddef>
#include <memory>
#include <string>

namespace metapipe {

// Nodes must be owned by a std::shared_ptr: wiring hands out observer
// handles aliased on the consuming node.
class INode : public std::enable_shared_from_this<INode> {
public:
  explicit INode(std::string name) : name_(std::move(name)) {}
  virtual ~INode() = default;

  INode(const INode&) = delete;
  INode& operator=(const INode&) = delete;

  virtual void run() = 0;
  virtual void shutdown() noexcept = 0;

  const std::string& name() const noexcept { return name_; }

  // Number of times the wrapped unit actually executed
  std::size_t runs() const noexcept { return runs_; }

protected:
  void countRun() noexcept { ++runs_; }

private:
  std::string name_;
  std::size_t runs_ = 0;
};

} // namespace metapipe
