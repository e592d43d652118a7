#pragma once

#include "wgen/world_types.h"

#include <string>
#include <vector>

// Pure prompt renderers. Every prompt starts with a "### Request: <kind> <id>"
// line so transcripts and logs can be matched back to the artifact.
namespace wgen::prompts {

std::string request_header(const std::string& kind, const std::string& id);

std::string system_prompt(const WorldBrief& brief);

std::string chapter_id_for(int chapter_number);

// `previous` is the last finished chapter, if any.
std::string outline_prompt(const WorldBrief& brief, const GenerationSettings& settings, int chapter_number,
                           const ChapterArtifact* previous);

std::string room_graph_prompt(const WorldBrief& brief, const GenerationSettings& settings,
                              const ChapterOutline& outline);

std::string navigation_room_prompt(const RoomNode& room, const RoomGraph& graph, const ChapterOutline& outline,
                                   int chapter_number);
std::string dialogue_room_prompt(const RoomNode& room, const RoomGraph& graph, const ChapterOutline& outline,
                                 int chapter_number);
std::string combat_room_prompt(const RoomNode& room, const RoomGraph& graph, const ChapterOutline& outline,
                               int chapter_number);
// Dispatches on room.kind.
std::string room_prompt(const RoomNode& room, const RoomGraph& graph, const ChapterOutline& outline,
                        int chapter_number);

// `valid_prerequisites` lists quests the new quest may depend on (earlier main
// quests of the world); objective targets are drawn from the graph, outline
// enemies and outline items.
std::string quest_prompt(const QuestSummary& quest, const ChapterOutline& outline, const RoomGraph& graph,
                         int chapter_number, const std::vector<std::string>& valid_prerequisites);

std::string enemy_prompt(const EnemySummary& enemy, const DifficultyBand& band, int chapter_number);

std::string item_prompt(const ItemSummary& item, int chapter_number);

} // namespace wgen::prompts
