#include "wgen/schema_contract.h"

#include <algorithm>

namespace wgen::contract {

const std::vector<std::string>& room_types() {
  static const std::vector<std::string> kValues = {"crossroad", "interaction", "combat"};
  return kValues;
}

const std::vector<std::string>& location_types() {
  static const std::vector<std::string> kValues = {"hub", "exploration", "dungeon", "boss", "transition"};
  return kValues;
}

const std::vector<std::string>& npc_roles() {
  static const std::vector<std::string> kValues = {"quest_giver", "merchant", "mentor", "antagonist", "citizen"};
  return kValues;
}

const std::vector<std::string>& quest_types() {
  static const std::vector<std::string> kValues = {"Main", "Side"};
  return kValues;
}

const std::vector<std::string>& objective_types() {
  static const std::vector<std::string> kValues = {
      "GoToRoom", "TalkToNPC", "CollectItem", "DeliverItem", "DefeatEnemy",
      "DefeatCount", "SetFlag", "UseItem", "Custom"};
  return kValues;
}

const std::vector<std::string>& item_categories() {
  static const std::vector<std::string> kValues = {"weapon", "armor", "consumable", "key", "quest"};
  return kValues;
}

std::string effect_type_legend() {
  return "0=Damage, 1=Heal, 2=Bless, 3=CurePoison, 4=Open";
}

std::string item_target_legend() {
  return "0=NPC, 1=Self, 2=Lock, 3=None";
}

bool contains(const std::vector<std::string>& values, std::string_view value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

TargetKind objective_target_kind(std::string_view objective_type) {
  if (objective_type == "GoToRoom") return TargetKind::Room;
  if (objective_type == "TalkToNPC") return TargetKind::Npc;
  if (objective_type == "DefeatEnemy" || objective_type == "DefeatCount") return TargetKind::Enemy;
  if (objective_type == "CollectItem" || objective_type == "DeliverItem" || objective_type == "UseItem") {
    return TargetKind::Item;
  }
  return TargetKind::None;
}

bool is_snake_case_id(std::string_view id) {
  if (id.empty() || id.front() < 'a' || id.front() > 'z') {
    return false;
  }
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) return false;
  }
  return true;
}

std::string id_rules_text() {
  return "IDs are lowercase snake_case (letters, digits, underscores; starting with a letter), "
         "e.g. 'haunted_mill', 'guard_captain'. Reuse an ID exactly wherever the same thing is referenced.";
}

} // namespace wgen::contract
