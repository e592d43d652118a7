#include "wgen/room_graph.h"

#include "wgen/schema_contract.h"

#include <algorithm>

namespace wgen {

std::set<Edge> edge_set(const RoomGraph& graph) {
  std::set<Edge> edges;
  for (const auto& room : graph.rooms) {
    for (const auto& neighbor : room.neighbors) {
      edges.emplace(room.id, neighbor);
    }
  }
  return edges;
}

std::set<std::string> room_ids(const RoomGraph& graph) {
  std::set<std::string> ids;
  for (const auto& room : graph.rooms) {
    ids.insert(room.id);
  }
  return ids;
}

std::vector<std::string> drop_dangling_edges(RoomGraph& graph) {
  std::vector<std::string> removed;
  const auto ids = room_ids(graph);
  for (auto& room : graph.rooms) {
    std::set<std::string> seen;
    std::vector<std::string> kept;
    for (const auto& neighbor : room.neighbors) {
      if (neighbor == room.id) {
        removed.push_back("dropped self-loop on room '" + room.id + "'");
      } else if (ids.count(neighbor) == 0) {
        removed.push_back("dropped edge " + room.id + " -> " + neighbor + " (unknown room)");
      } else if (!seen.insert(neighbor).second) {
        removed.push_back("dropped duplicate edge " + room.id + " -> " + neighbor);
      } else {
        kept.push_back(neighbor);
      }
    }
    room.neighbors = std::move(kept);
  }
  return removed;
}

int ensure_bidirectional(RoomGraph& graph) {
  // Collect first so edges added during the pass are not themselves re-examined.
  std::vector<Edge> missing;
  const auto edges = edge_set(graph);
  for (const auto& edge : edges) {
    if (edges.count(Edge{edge.second, edge.first}) == 0 && graph.find(edge.second) != nullptr) {
      missing.push_back(edge);
    }
  }
  for (const auto& edge : missing) {
    auto* target = graph.find(edge.second);
    if (std::find(target->neighbors.begin(), target->neighbors.end(), edge.first) == target->neighbors.end()) {
      target->neighbors.push_back(edge.first);
    }
  }
  return static_cast<int>(missing.size());
}

std::vector<std::string> exit_budget_warnings(const RoomGraph& graph) {
  std::vector<std::string> warnings;
  for (const auto& room : graph.rooms) {
    const int limit = room.kind == RoomKind::Navigation ? contract::kMaxNavigationExits : contract::kMaxScopedExits;
    const int count = static_cast<int>(room.neighbors.size());
    if (count > limit) {
      warnings.push_back(std::string(to_string(room.kind)) + " room '" + room.id + "' has " +
                         std::to_string(count) + " exits (budget " + std::to_string(limit) + ")");
    }
  }
  return warnings;
}

} // namespace wgen
