#pragma once

#include "wgen/world_types.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

// Typed views of generated documents. Readers record type mismatches in
// `errors` and keep going so one bad field does not hide the others.
namespace wgen {

struct RoomAction {
  std::string id;
  std::string description;
};

struct DialogueResponse {
  std::string text;
  int next_step = -1;
};

struct DialogueStep {
  std::string message;
  std::vector<DialogueResponse> responses;
};

struct RoomDialogue {
  std::string npc_name;
  std::string image;
  std::vector<DialogueStep> steps;
};

struct RoomExit {
  std::string name;
  std::string leads_to;
  std::vector<std::string> conditions;
  std::vector<std::string> conditions_not;
};

struct RoomCombat {
  std::string enemy_id;
  bool is_boss = false;
  std::string defeat_flag;
};

struct RoomDocument {
  std::string id;
  std::string type;
  std::string description;
  std::vector<std::string> npcs;
  std::vector<std::string> items;
  std::vector<RoomAction> actions;
  std::vector<RoomDialogue> dialogues;
  std::vector<RoomExit> exits;
  bool has_exits = false;
  std::optional<RoomCombat> combat;
};

struct QuestObjective {
  std::string id;
  std::string description;
  std::string type;
  std::string target_id;
  int target_count = 1;
  bool optional = false;
};

struct QuestRewards {
  int experience = 0;
  int gold = 0;
  std::vector<std::string> item_ids;
  std::vector<std::string> flags;
};

struct QuestDocument {
  std::string id;
  std::string name;
  std::string description;
  std::string giver;
  std::string giver_location;
  std::string quest_type;
  int chapter_number = 0;
  int difficulty = 1;
  std::vector<std::string> prerequisite_quests;
  std::vector<std::string> prerequisite_flags;
  std::vector<QuestObjective> objectives;
  std::vector<std::string> reveals_on_accept;
  std::vector<std::string> reveals_on_complete;
  std::optional<QuestRewards> rewards;
};

struct EnemyAttack {
  std::string name;
  std::string description;
  int damage_min = 0;
  int damage_max = 0;
  int hit_bonus = 0;
};

struct LootEntry {
  std::string item_id;
  double drop_chance = 0.0;
};

struct EnemyDocument {
  std::string id;
  std::string name;
  std::string description;
  std::string image;
  int max_hit_points = 0;
  int armor_class = 0;
  int experience = 0;
  int gold_drop = 0;
  std::vector<EnemyAttack> attacks;
  std::vector<LootEntry> loot;
};

struct ItemDocument {
  std::string id;
  std::string short_description;
  std::string description;
  std::string category;
  int effect_type = 0;
  int effect_amount = 0;
  int target = 0;
  bool stacking = false;
  int max_stack = 1;
  int buy_price = 0;
  int sell_price = 0;
  bool combat_usable = false;
};

void read_room(const nlohmann::json& j, RoomDocument& out, std::vector<std::string>& errors);
void read_quest(const nlohmann::json& j, QuestDocument& out, std::vector<std::string>& errors);
void read_enemy(const nlohmann::json& j, EnemyDocument& out, std::vector<std::string>& errors);
void read_item(const nlohmann::json& j, ItemDocument& out, std::vector<std::string>& errors);
void read_outline(const nlohmann::json& j, ChapterOutline& out, std::vector<std::string>& errors);
// Unknown roomType values fall back to navigation and add a warning.
void read_graph(const nlohmann::json& j, RoomGraph& out, std::vector<std::string>& errors,
                std::vector<std::string>& warnings);

// Convenience for callers that only need the prerequisite and objective data
// of an already-accepted quest.
QuestDocument quest_view(const nlohmann::json& j);
RoomDocument room_view(const nlohmann::json& j);

} // namespace wgen
