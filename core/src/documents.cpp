#include "wgen/documents.h"

#include "wgen/json_fields.h"

namespace wgen {

using json = nlohmann::json;

namespace {
void read_dialogue(const json& j, RoomDialogue& out, std::vector<std::string>& errors) {
  fields::read(j, "npc_name", out.npc_name, &errors);
  fields::read(j, "dialogue_image", out.image, &errors);
  for (const auto& step_json : fields::objects(j, "dialogues", &errors)) {
    DialogueStep step;
    fields::read(step_json, "message", step.message, &errors);
    for (const auto& response_json : fields::objects(step_json, "responses", &errors)) {
      DialogueResponse response;
      fields::read(response_json, "text", response.text, &errors);
      fields::read(response_json, "next_step", response.next_step, &errors);
      step.responses.push_back(std::move(response));
    }
    out.steps.push_back(std::move(step));
  }
}

void read_quest_summary(const json& j, bool is_main, QuestSummary& out, std::vector<std::string>& errors) {
  fields::read(j, "questId", out.id, &errors);
  fields::read(j, "questName", out.name, &errors);
  fields::read(j, "description", out.description, &errors);
  fields::read(j, "questGiver", out.quest_giver, &errors);
  fields::read(j, "taskLocation", out.task_location, &errors);
  fields::read(j, "difficulty", out.difficulty, &errors);
  out.is_main = is_main;
}
} // namespace

void read_room(const json& j, RoomDocument& out, std::vector<std::string>& errors) {
  fields::read(j, "room_id", out.id, &errors);
  fields::read(j, "room_type", out.type, &errors);
  fields::read(j, "description", out.description, &errors);
  fields::read(j, "npcs", out.npcs, &errors);
  fields::read(j, "items", out.items, &errors);
  for (const auto& action_json : fields::objects(j, "actions", &errors)) {
    RoomAction action;
    fields::read(action_json, "action_id", action.id, &errors);
    fields::read(action_json, "action_description", action.description, &errors);
    out.actions.push_back(std::move(action));
  }
  for (const auto& dialogue_json : fields::objects(j, "dialogues", &errors)) {
    RoomDialogue dialogue;
    read_dialogue(dialogue_json, dialogue, errors);
    out.dialogues.push_back(std::move(dialogue));
  }
  out.has_exits = j.contains("exits") && j["exits"].is_array();
  for (const auto& exit_json : fields::objects(j, "exits", &errors)) {
    RoomExit exit;
    fields::read(exit_json, "exit_name", exit.name, &errors);
    fields::read(exit_json, "leads_to", exit.leads_to, &errors);
    fields::read(exit_json, "conditions", exit.conditions, &errors);
    fields::read(exit_json, "conditions_not", exit.conditions_not, &errors);
    out.exits.push_back(std::move(exit));
  }
  auto combat_it = j.find("combat");
  if (combat_it != j.end() && !combat_it->is_null()) {
    if (!combat_it->is_object()) {
      errors.push_back("field 'combat' must be an object or null");
    } else {
      RoomCombat combat;
      fields::read(*combat_it, "enemyId", combat.enemy_id, &errors);
      fields::read(*combat_it, "isBoss", combat.is_boss, &errors);
      fields::read(*combat_it, "defeatFlag", combat.defeat_flag, &errors);
      out.combat = std::move(combat);
    }
  }
}

void read_quest(const json& j, QuestDocument& out, std::vector<std::string>& errors) {
  fields::read(j, "questId", out.id, &errors);
  fields::read(j, "questName", out.name, &errors);
  fields::read(j, "questDescription", out.description, &errors);
  fields::read(j, "questGiver", out.giver, &errors);
  fields::read(j, "questGiverLocation", out.giver_location, &errors);
  fields::read(j, "questType", out.quest_type, &errors);
  fields::read(j, "chapterNumber", out.chapter_number, &errors);
  fields::read(j, "difficulty", out.difficulty, &errors);
  fields::read(j, "prerequisiteQuests", out.prerequisite_quests, &errors);
  fields::read(j, "prerequisiteFlags", out.prerequisite_flags, &errors);
  fields::read(j, "revealsOnAccept", out.reveals_on_accept, &errors);
  fields::read(j, "revealsOnComplete", out.reveals_on_complete, &errors);
  for (const auto& objective_json : fields::objects(j, "objectives", &errors)) {
    QuestObjective objective;
    fields::read(objective_json, "objectiveId", objective.id, &errors);
    fields::read(objective_json, "description", objective.description, &errors);
    fields::read(objective_json, "type", objective.type, &errors);
    fields::read(objective_json, "targetId", objective.target_id, &errors);
    fields::read(objective_json, "targetCount", objective.target_count, &errors);
    fields::read(objective_json, "isOptional", objective.optional, &errors);
    out.objectives.push_back(std::move(objective));
  }
  auto rewards_it = j.find("rewards");
  if (rewards_it != j.end() && !rewards_it->is_null()) {
    if (!rewards_it->is_object()) {
      errors.push_back("field 'rewards' must be an object");
      return;
    }
    QuestRewards rewards;
    fields::read(*rewards_it, "experiencePoints", rewards.experience, &errors);
    fields::read(*rewards_it, "gold", rewards.gold, &errors);
    fields::read(*rewards_it, "itemIds", rewards.item_ids, &errors);
    for (const auto& flag_json : fields::objects(*rewards_it, "flagsToSet", &errors)) {
      std::string name;
      fields::read(flag_json, "flagName", name, &errors);
      if (!name.empty()) rewards.flags.push_back(name);
    }
    out.rewards = std::move(rewards);
  }
}

void read_enemy(const json& j, EnemyDocument& out, std::vector<std::string>& errors) {
  fields::read(j, "enemyId", out.id, &errors);
  fields::read(j, "enemyName", out.name, &errors);
  fields::read(j, "description", out.description, &errors);
  fields::read(j, "enemyImage", out.image, &errors);
  fields::read(j, "maxHitPoints", out.max_hit_points, &errors);
  fields::read(j, "armorClass", out.armor_class, &errors);
  fields::read(j, "experienceValue", out.experience, &errors);
  fields::read(j, "goldDrop", out.gold_drop, &errors);
  for (const auto& attack_json : fields::objects(j, "attacks", &errors)) {
    EnemyAttack attack;
    fields::read(attack_json, "attackName", attack.name, &errors);
    fields::read(attack_json, "attackDescription", attack.description, &errors);
    fields::read(attack_json, "damageMin", attack.damage_min, &errors);
    fields::read(attack_json, "damageMax", attack.damage_max, &errors);
    fields::read(attack_json, "hitBonus", attack.hit_bonus, &errors);
    out.attacks.push_back(std::move(attack));
  }
  for (const auto& loot_json : fields::objects(j, "lootTable", &errors)) {
    LootEntry loot;
    fields::read(loot_json, "itemId", loot.item_id, &errors);
    fields::read(loot_json, "dropChance", loot.drop_chance, &errors);
    out.loot.push_back(std::move(loot));
  }
}

void read_item(const json& j, ItemDocument& out, std::vector<std::string>& errors) {
  fields::read(j, "itemId", out.id, &errors);
  fields::read(j, "shortDescription", out.short_description, &errors);
  fields::read(j, "description", out.description, &errors);
  fields::read(j, "category", out.category, &errors);
  fields::read(j, "effectType", out.effect_type, &errors);
  fields::read(j, "effectAmount", out.effect_amount, &errors);
  fields::read(j, "target", out.target, &errors);
  fields::read(j, "stacking", out.stacking, &errors);
  fields::read(j, "maxStack", out.max_stack, &errors);
  fields::read(j, "buyPrice", out.buy_price, &errors);
  fields::read(j, "sellPrice", out.sell_price, &errors);
  fields::read(j, "combatUsable", out.combat_usable, &errors);
}

void read_outline(const json& j, ChapterOutline& out, std::vector<std::string>& errors) {
  fields::read(j, "chapterId", out.chapter_id, &errors);
  fields::read(j, "chapterName", out.chapter_name, &errors);
  fields::read(j, "chapterDescription", out.description, &errors);
  fields::read(j, "chapterIntro", out.intro, &errors);
  fields::read(j, "hubLocationId", out.hub_location_id, &errors);
  fields::read(j, "entryLocationId", out.entry_location_id, &errors);
  fields::read(j, "exitLocationId", out.exit_location_id, &errors);
  for (const auto& loc_json : fields::objects(j, "locations", &errors)) {
    LocationSummary loc;
    fields::read(loc_json, "locationId", loc.id, &errors);
    fields::read(loc_json, "locationName", loc.name, &errors);
    fields::read(loc_json, "locationType", loc.type, &errors);
    fields::read(loc_json, "description", loc.description, &errors);
    fields::read(loc_json, "alwaysVisible", loc.always_visible, &errors);
    fields::read(loc_json, "connectedTo", loc.connected_to, &errors);
    out.locations.push_back(std::move(loc));
  }
  for (const auto& quest_json : fields::objects(j, "mainQuests", &errors)) {
    QuestSummary quest;
    read_quest_summary(quest_json, true, quest, errors);
    out.main_quests.push_back(std::move(quest));
  }
  for (const auto& quest_json : fields::objects(j, "sideQuests", &errors)) {
    QuestSummary quest;
    read_quest_summary(quest_json, false, quest, errors);
    out.side_quests.push_back(std::move(quest));
  }
  for (const auto& npc_json : fields::objects(j, "keyNPCs", &errors)) {
    NpcSummary npc;
    fields::read(npc_json, "npcId", npc.id, &errors);
    fields::read(npc_json, "npcName", npc.name, &errors);
    fields::read(npc_json, "role", npc.role, &errors);
    fields::read(npc_json, "personality", npc.personality, &errors);
    fields::read(npc_json, "locationId", npc.location_id, &errors);
    out.key_npcs.push_back(std::move(npc));
  }
  for (const auto& enemy_json : fields::objects(j, "enemies", &errors)) {
    EnemySummary enemy;
    fields::read(enemy_json, "enemyId", enemy.id, &errors);
    fields::read(enemy_json, "enemyName", enemy.name, &errors);
    fields::read(enemy_json, "enemyType", enemy.enemy_type, &errors);
    fields::read(enemy_json, "description", enemy.description, &errors);
    fields::read(enemy_json, "challengeRating", enemy.challenge_rating, &errors);
    out.enemies.push_back(std::move(enemy));
  }
  for (const auto& item_json : fields::objects(j, "items", &errors)) {
    ItemSummary item;
    fields::read(item_json, "itemId", item.id, &errors);
    fields::read(item_json, "itemName", item.name, &errors);
    fields::read(item_json, "itemType", item.item_type, &errors);
    fields::read(item_json, "value", item.value, &errors);
    out.items.push_back(std::move(item));
  }
}

void read_graph(const json& j, RoomGraph& out, std::vector<std::string>& errors,
                std::vector<std::string>& warnings) {
  fields::read(j, "chapterId", out.chapter_id, &errors);
  fields::read(j, "hubRoomId", out.hub_id, &errors);
  fields::read(j, "entryRoomId", out.entry_id, &errors);
  fields::read(j, "exitRoomId", out.exit_id, &errors);
  for (const auto& room_json : fields::objects(j, "rooms", &errors)) {
    RoomNode node;
    std::string type;
    fields::read(room_json, "roomId", node.id, &errors);
    fields::read(room_json, "roomName", node.name, &errors);
    fields::read(room_json, "roomType", type, &errors);
    fields::read(room_json, "description", node.description, &errors);
    fields::read(room_json, "connectsTo", node.neighbors, &errors);
    fields::read(room_json, "npcs", node.npcs, &errors);
    fields::read(room_json, "enemyId", node.enemy_id, &errors);
    fields::read(room_json, "isHub", node.is_hub, &errors);
    const auto kind = room_kind_from_string(type);
    if (kind) {
      node.kind = *kind;
    } else {
      warnings.push_back("room '" + node.id + "' has unknown roomType '" + type + "', treated as crossroad");
    }
    out.rooms.push_back(std::move(node));
  }
}

QuestDocument quest_view(const json& j) {
  QuestDocument doc;
  std::vector<std::string> ignored;
  read_quest(j, doc, ignored);
  return doc;
}

RoomDocument room_view(const json& j) {
  RoomDocument doc;
  std::vector<std::string> ignored;
  read_room(j, doc, ignored);
  return doc;
}

} // namespace wgen
