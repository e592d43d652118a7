#pragma once

#include <string>
#include <string_view>
#include <vector>

// Shared vocabulary for prompt rendering and validation. Prompts embed these
// lists verbatim; the validator checks documents against the same lists.
namespace wgen::contract {

constexpr int kMaxNavigationExits = 4;
constexpr int kMaxScopedExits = 2;
constexpr int kMinQuestDifficulty = 1;
constexpr int kMaxQuestDifficulty = 10;
constexpr int kMaxEffectType = 4;
constexpr int kMaxItemTarget = 3;
constexpr int kDialogueEnd = -1;

const std::vector<std::string>& room_types();
const std::vector<std::string>& location_types();
const std::vector<std::string>& npc_roles();
const std::vector<std::string>& quest_types();
const std::vector<std::string>& objective_types();
const std::vector<std::string>& item_categories();

// "0=Damage, 1=Heal, 2=Bless, 3=CurePoison, 4=Open"
std::string effect_type_legend();
// "0=NPC, 1=Self, 2=Lock, 3=None"
std::string item_target_legend();

bool contains(const std::vector<std::string>& values, std::string_view value);

enum class TargetKind {
  Room,
  Npc,
  Enemy,
  Item,
  None
};

// What an objective's targetId refers to, by objective type.
TargetKind objective_target_kind(std::string_view objective_type);

// Lowercase snake_case: [a-z0-9_]+, starting with a letter.
bool is_snake_case_id(std::string_view id);
std::string id_rules_text();

} // namespace wgen::contract
