#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "metapipe/nodes/INode.hpp"
#include "metapipe/nodes/NodeIn.hpp"

namespace metapipe {

/// Owns a set of wired nodes by id. Wiring itself lives in the nodes'
/// Observables; the edge list here is only a record of what was connected.
class Graph {
public:
  struct Edge {
    std::string from;
    std::string source;
    std::string to;
    std::string dest;
  };

  Graph() = default;
  ~Graph();

  Graph(const Graph&) = delete;
  Graph& operator=(const Graph&) = delete;

  /// Throws std::runtime_error on a duplicate or empty id.
  void add(const std::string& id, std::shared_ptr<INode> node);

  /// attach() the two nodes. Throws std::runtime_error for unknown ids, an
  /// edge leaving a sink or entering a source; PortError for bad ports.
  void connect(const Edge& e);

  /// Run every source node, in the order they were added.
  void run();

  std::shared_ptr<INode> node(const std::string& id) const;

  template <class T>
  std::shared_ptr<T> get(const std::string& id) const {
    return std::dynamic_pointer_cast<T>(node(id));
  }

  const std::vector<std::string>& ids() const noexcept { return order_; }
  const std::vector<Edge>& edges() const noexcept { return edges_; }
  std::vector<std::shared_ptr<NodeIn>> sources() const;
  std::size_t size() const noexcept { return order_.size(); }

  void shutdown() noexcept;

private:
  std::vector<std::string> order_;
  std::unordered_map<std::string, std::shared_ptr<INode>> nodes_;
  std::vector<Edge> edges_;
};

/// Ids that sit on, or downstream of, a cycle formed by `edges` (empty when
/// acyclic). Sorted for stable messages.
std::vector<std::string> cyclicNodes(const std::vector<std::string>& ids,
                                     const std::vector<Graph::Edge>& edges);

} // namespace metapipe
