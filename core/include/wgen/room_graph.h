#pragma once

#include "wgen/world_types.h"

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace wgen {

using Edge = std::pair<std::string, std::string>;

std::set<Edge> edge_set(const RoomGraph& graph);

// Removes self-loops, repeated neighbor entries and edges to rooms that are not
// in the graph. Returns one message per removed edge.
std::vector<std::string> drop_dangling_edges(RoomGraph& graph);

// For every A -> B without B -> A, appends A to B's neighbors. Returns the
// number of edges added; a second call always returns 0.
int ensure_bidirectional(RoomGraph& graph);

// Navigation rooms above four exits, dialogue/combat rooms above two.
std::vector<std::string> exit_budget_warnings(const RoomGraph& graph);

std::set<std::string> room_ids(const RoomGraph& graph);

} // namespace wgen
