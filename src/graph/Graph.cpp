#include "metapipe/graph/Graph.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>

#include "metapipe/nodes/ObservableNode.hpp"
#include "metapipe/nodes/ObserverNode.hpp"
#include "metapipe/util/Logger.hpp"

namespace metapipe {

Graph::~Graph() { shutdown(); }

void Graph::add(const std::string& id, std::shared_ptr<INode> node) {
  if (id.empty()) throw std::runtime_error("Graph: empty node id");
  if (!node) throw std::runtime_error("Graph: null node '" + id + "'");
  if (!nodes_.emplace(id, std::move(node)).second)
    throw std::runtime_error("Graph: duplicate node id '" + id + "'");
  order_.push_back(id);
}

void Graph::connect(const Edge& e) {
  auto from = node(e.from);
  if (!from) throw std::runtime_error("Graph: edge from unknown node '" + e.from + "'");
  auto to = node(e.to);
  if (!to) throw std::runtime_error("Graph: edge to unknown node '" + e.to + "'");

  auto producer = std::dynamic_pointer_cast<ObservableNode>(from);
  if (!producer) throw std::runtime_error("Graph: node '" + e.from + "' has no outputs");
  auto* consumer = dynamic_cast<ObserverNode*>(to.get());
  if (!consumer) throw std::runtime_error("Graph: node '" + e.to + "' has no inputs");

  producer->attach(*consumer, e.source, e.dest);
  edges_.push_back(e);
}

void Graph::run() {
  auto srcs = sources();
  util::logger().log(util::LogLevel::Info, "graph run",
                     { {"nodes", std::to_string(size())}, {"sources", std::to_string(srcs.size())} });
  for (auto& s : srcs) s->run();
}

std::shared_ptr<INode> Graph::node(const std::string& id) const {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<NodeIn>> Graph::sources() const {
  std::vector<std::shared_ptr<NodeIn>> out;
  for (const auto& id : order_) {
    if (auto s = std::dynamic_pointer_cast<NodeIn>(nodes_.at(id))) out.push_back(std::move(s));
  }
  return out;
}

void Graph::shutdown() noexcept {
  for (auto& kv : nodes_) {
    if (kv.second) kv.second->shutdown();
  }
}

std::vector<std::string> cyclicNodes(const std::vector<std::string>& ids,
                                     const std::vector<Graph::Edge>& edges) {
  std::unordered_map<std::string, std::size_t> indeg;
  std::unordered_map<std::string, std::vector<std::string>> next;
  for (const auto& id : ids) indeg[id] = 0;
  for (const auto& e : edges) {
    next[e.from].push_back(e.to);
    ++indeg[e.to];
  }

  // Kahn: whatever never reaches in-degree 0 is on or behind a cycle
  std::deque<std::string> ready;
  for (const auto& kv : indeg) {
    if (kv.second == 0) ready.push_back(kv.first);
  }
  while (!ready.empty()) {
    auto id = std::move(ready.front());
    ready.pop_front();
    for (const auto& to : next[id]) {
      if (--indeg[to] == 0) ready.push_back(to);
    }
  }

  std::vector<std::string> out;
  for (const auto& kv : indeg) {
    if (kv.second > 0) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace metapipe
