#include "wgen/schema_validator.h"

#include "wgen/documents.h"
#include "wgen/json_fields.h"
#include "wgen/schema_contract.h"

#include <algorithm>
#include <map>

namespace wgen {

using json = nlohmann::json;

const char* to_string(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::Room:
      return "room";
    case ArtifactKind::Quest:
      return "quest";
    case ArtifactKind::Enemy:
      return "enemy";
    case ArtifactKind::Item:
      return "item";
    case ArtifactKind::Outline:
      return "outline";
    case ArtifactKind::Graph:
      return "graph";
  }
  return "unknown";
}

namespace {
// Parser diagnostics quote the last bytes read, which may stop inside a
// multi-byte sequence. Incomplete sequences become '?'.
std::string scrub_utf8(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    size_t len = 0;
    if (lead < 0x80) {
      len = 1;
    } else if ((lead & 0xE0) == 0xC0) {
      len = 2;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
    }
    bool complete = len > 0 && i + len <= text.size();
    for (size_t k = 1; complete && k < len; ++k) {
      complete = (static_cast<unsigned char>(text[i + k]) & 0xC0) == 0x80;
    }
    if (complete) {
      out.append(text, i, len);
      i += len;
    } else {
      out.push_back('?');
      ++i;
    }
  }
  return out;
}

std::string_view trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

void check_id(const std::string& field, const std::string& id, const ValidateOptions& options,
              ValidationResult& result) {
  if (id.empty()) {
    result.errors.push_back(field + " is required");
    return;
  }
  if (!options.expected_id.empty() && id != options.expected_id) {
    result.errors.push_back(field + " '" + id + "' does not match requested id '" + options.expected_id + "'");
  }
  if (!contract::is_snake_case_id(id)) {
    result.warnings.push_back(field + " '" + id + "' is not snake_case");
  }
}

void validate_dialogue(const RoomDialogue& dialogue, ValidationResult& result) {
  const std::string who = dialogue.npc_name.empty() ? std::string("<unnamed>") : dialogue.npc_name;
  if (dialogue.npc_name.empty()) {
    result.warnings.push_back("dialogue missing npc_name");
  }
  if (dialogue.steps.empty()) {
    result.warnings.push_back("dialogue '" + who + "' has no steps");
    return;
  }
  const int step_count = static_cast<int>(dialogue.steps.size());
  for (int i = 0; i < step_count; ++i) {
    const auto& step = dialogue.steps[static_cast<size_t>(i)];
    if (step.message.empty()) {
      result.warnings.push_back("dialogue '" + who + "' step " + std::to_string(i) + " has an empty message");
    }
    if (step.responses.empty()) {
      result.warnings.push_back("dialogue '" + who + "' step " + std::to_string(i) + " has no responses");
    }
    for (const auto& response : step.responses) {
      if (response.next_step != contract::kDialogueEnd &&
          (response.next_step < 0 || response.next_step >= step_count)) {
        result.errors.push_back("dialogue '" + who + "' step " + std::to_string(i) +
                                " points to missing step " + std::to_string(response.next_step));
      }
    }
  }
}

void validate_room(const json& doc, const ValidateOptions& options, ValidationResult& result) {
  RoomDocument room;
  read_room(doc, room, result.errors);

  check_id("room_id", room.id, options, result);
  if (room.description.empty()) {
    result.errors.push_back("description is required");
  }

  std::optional<RoomKind> kind;
  if (!room.type.empty()) {
    kind = room_kind_from_string(room.type);
    if (!kind) {
      result.warnings.push_back("unknown room_type '" + room.type + "' (expected: " +
                                fields::join(contract::room_types(), ", ") + ")");
    }
  }
  if (options.expected_room_kind) {
    if (!kind || *kind != *options.expected_room_kind) {
      result.errors.push_back(std::string("room_type must be '") + to_string(*options.expected_room_kind) +
                              "' but was '" + room.type + "'");
    }
    kind = options.expected_room_kind;
  }

  if (!room.has_exits || room.exits.empty()) {
    result.warnings.push_back("room has no exits defined");
  }
  for (const auto& exit : room.exits) {
    const std::string name = exit.name.empty() ? std::string("<unnamed>") : exit.name;
    if (exit.leads_to.empty()) {
      result.errors.push_back("exit '" + name + "' missing leads_to");
      continue;
    }
    if (exit.leads_to == room.id) {
      result.errors.push_back("exit '" + name + "' leads back into the same room");
    }
    if (options.known_ids && options.known_ids->count(exit.leads_to) == 0) {
      result.errors.push_back("exit '" + name + "' leads to unknown room: '" + exit.leads_to + "'");
    } else if (!options.allowed_exits.empty() && !contract::contains(options.allowed_exits, exit.leads_to)) {
      result.warnings.push_back("exit '" + name + "' leads to '" + exit.leads_to + "', which is not a graph neighbor");
    }
  }

  std::set<std::string> action_ids;
  for (const auto& action : room.actions) {
    if (action.id.empty()) {
      result.warnings.push_back("action missing action_id");
    } else {
      action_ids.insert(action.id);
    }
  }
  std::set<std::string> speakers;
  for (const auto& dialogue : room.dialogues) {
    if (!dialogue.npc_name.empty()) {
      speakers.insert(dialogue.npc_name);
    }
    validate_dialogue(dialogue, result);
  }

  if (!kind) {
    return;
  }
  switch (*kind) {
    case RoomKind::Navigation:
      if (!room.actions.empty()) {
        result.errors.push_back("crossroad room must have an empty actions list");
      }
      if (!room.dialogues.empty()) {
        result.errors.push_back("crossroad room must have an empty dialogues list");
      }
      if (!room.npcs.empty()) {
        result.errors.push_back("crossroad room must have an empty npcs list");
      }
      if (room.combat) {
        result.warnings.push_back("crossroad room carries a combat block");
      }
      break;
    case RoomKind::Dialogue:
      if (room.actions.empty()) {
        result.warnings.push_back("interaction room has no actions");
      }
      for (const auto& id : action_ids) {
        if (speakers.count(id) == 0) {
          result.errors.push_back("action_id '" + id + "' has no dialogue with a matching npc_name");
        }
      }
      for (const auto& speaker : speakers) {
        if (action_ids.count(speaker) == 0) {
          result.errors.push_back("dialogue npc_name '" + speaker + "' has no matching action_id");
        }
      }
      break;
    case RoomKind::Combat:
      if (!room.combat || room.combat->enemy_id.empty()) {
        result.errors.push_back("combat room requires combat.enemyId");
      }
      if (!room.dialogues.empty()) {
        result.warnings.push_back("combat room should not carry dialogues");
      }
      break;
  }
}

void validate_quest(const json& doc, const ValidateOptions& options, ValidationResult& result) {
  QuestDocument quest;
  read_quest(doc, quest, result.errors);

  check_id("questId", quest.id, options, result);
  if (quest.name.empty()) {
    result.errors.push_back("questName is required");
  }
  if (!quest.quest_type.empty() && !contract::contains(contract::quest_types(), quest.quest_type)) {
    result.warnings.push_back("questType '" + quest.quest_type + "' should be Main or Side");
  }
  if (quest.difficulty < contract::kMinQuestDifficulty || quest.difficulty > contract::kMaxQuestDifficulty) {
    result.warnings.push_back("difficulty " + std::to_string(quest.difficulty) + " outside 1-10");
  }
  if (quest.objectives.empty()) {
    result.errors.push_back("quest must have at least one objective");
  }
  for (size_t i = 0; i < quest.objectives.size(); ++i) {
    const auto& objective = quest.objectives[i];
    const std::string label = objective.id.empty() ? "objective " + std::to_string(i) : "objective '" + objective.id + "'";
    if (objective.id.empty()) {
      result.errors.push_back(label + " missing objectiveId");
    }
    if (!contract::contains(contract::objective_types(), objective.type)) {
      result.errors.push_back(label + " has invalid type '" + objective.type + "'");
    }
    if (objective.target_id.empty() && contract::objective_target_kind(objective.type) != contract::TargetKind::None) {
      result.errors.push_back(label + " missing targetId");
    }
    if (objective.target_count < 1) {
      result.errors.push_back(label + " targetCount must be at least 1");
    }
  }
  if (std::find(quest.prerequisite_quests.begin(), quest.prerequisite_quests.end(), quest.id) !=
      quest.prerequisite_quests.end()) {
    result.errors.push_back("quest lists itself as a prerequisite");
  }
  if (!quest.rewards) {
    result.warnings.push_back("quest has no rewards");
  } else {
    if (quest.rewards->gold < 0) {
      result.errors.push_back("rewards.gold must not be negative");
    }
    if (quest.rewards->experience < 0) {
      result.errors.push_back("rewards.experiencePoints must not be negative");
    }
  }
}

void validate_enemy(const json& doc, const ValidateOptions& options, ValidationResult& result) {
  EnemyDocument enemy;
  read_enemy(doc, enemy, result.errors);

  check_id("enemyId", enemy.id, options, result);
  if (enemy.name.empty()) {
    result.errors.push_back("enemyName is required");
  }
  if (enemy.max_hit_points <= 0) {
    result.errors.push_back("maxHitPoints must be positive");
  }
  if (enemy.armor_class < 0) {
    result.warnings.push_back("armorClass is negative");
  }
  if (enemy.attacks.empty()) {
    result.warnings.push_back("enemy has no attacks");
  }
  for (const auto& attack : enemy.attacks) {
    const std::string name = attack.name.empty() ? std::string("<unnamed>") : attack.name;
    if (attack.damage_min < 0) {
      result.errors.push_back("attack '" + name + "' has negative damageMin");
    }
    if (attack.damage_max < attack.damage_min) {
      result.errors.push_back("attack '" + name + "' damageMax (" + std::to_string(attack.damage_max) +
                              ") < damageMin (" + std::to_string(attack.damage_min) + ")");
    }
  }
  for (const auto& loot : enemy.loot) {
    if (loot.item_id.empty()) {
      result.warnings.push_back("loot entry missing itemId");
    }
    if (loot.drop_chance < 0.0 || loot.drop_chance > 1.0) {
      result.errors.push_back("loot '" + loot.item_id + "' dropChance must be within 0-1");
    }
  }
}

void validate_item(const json& doc, const ValidateOptions& options, ValidationResult& result) {
  ItemDocument item;
  read_item(doc, item, result.errors);

  check_id("itemId", item.id, options, result);
  if (item.short_description.empty()) {
    result.errors.push_back("shortDescription is required");
  }
  if (item.stacking && item.max_stack <= 0) {
    result.errors.push_back("stackable item must have maxStack > 0");
  }
  if (item.effect_type < 0 || item.effect_type > contract::kMaxEffectType) {
    result.errors.push_back("effectType " + std::to_string(item.effect_type) + " outside " +
                            contract::effect_type_legend());
  }
  if (item.target < 0 || item.target > contract::kMaxItemTarget) {
    result.errors.push_back("target " + std::to_string(item.target) + " outside " + contract::item_target_legend());
  }
  if (item.buy_price < 0 || item.sell_price < 0) {
    result.warnings.push_back("item has a negative price");
  }
  if (!item.category.empty() && !contract::contains(contract::item_categories(), item.category)) {
    result.warnings.push_back("unknown item category '" + item.category + "'");
  }
}

void validate_outline(const json& doc, const ValidateOptions& options, ValidationResult& result) {
  ChapterOutline outline;
  read_outline(doc, outline, result.errors);

  if (outline.chapter_id.empty()) {
    result.errors.push_back("chapterId is required");
  } else if (!options.expected_id.empty() && outline.chapter_id != options.expected_id) {
    result.warnings.push_back("chapterId '" + outline.chapter_id + "' differs from requested '" +
                              options.expected_id + "'");
  }
  if (outline.chapter_name.empty()) {
    result.errors.push_back("chapterName is required");
  }
  if (outline.locations.empty()) {
    result.errors.push_back("at least one location is required");
  }
  if (outline.main_quests.empty()) {
    result.errors.push_back("at least one main quest is required");
  }

  std::set<std::string> location_ids;
  for (const auto& loc : outline.locations) {
    if (loc.id.empty()) {
      result.errors.push_back("location missing locationId");
    } else if (!location_ids.insert(loc.id).second) {
      result.errors.push_back("duplicate location id: " + loc.id);
    }
    if (!loc.type.empty() && !contract::contains(contract::location_types(), loc.type)) {
      result.warnings.push_back("location '" + loc.id + "' has unknown locationType '" + loc.type + "'");
    }
  }

  std::set<std::string> quest_ids;
  auto check_quests = [&](const std::vector<QuestSummary>& quests) {
    for (const auto& quest : quests) {
      if (quest.id.empty()) {
        result.errors.push_back("quest summary missing questId");
      } else if (!quest_ids.insert(quest.id).second) {
        result.errors.push_back("duplicate quest id: " + quest.id);
      }
      if (!quest.task_location.empty() && location_ids.count(quest.task_location) == 0) {
        result.warnings.push_back("quest '" + quest.id + "' references unknown location: " + quest.task_location);
      }
    }
  };
  check_quests(outline.main_quests);
  check_quests(outline.side_quests);

  std::set<std::string> enemy_ids;
  for (const auto& enemy : outline.enemies) {
    if (enemy.id.empty()) {
      result.errors.push_back("enemy summary missing enemyId");
    } else if (!enemy_ids.insert(enemy.id).second) {
      result.errors.push_back("duplicate enemy id: " + enemy.id);
    }
  }
  for (const auto& npc : outline.key_npcs) {
    if (npc.id.empty()) {
      result.warnings.push_back("key NPC missing npcId");
    }
  }
}

void validate_graph(const json& doc, const ValidateOptions& options, ValidationResult& result) {
  RoomGraph graph;
  read_graph(doc, graph, result.errors, result.warnings);

  if (graph.chapter_id.empty()) {
    result.errors.push_back("chapterId is required");
  } else if (!options.expected_id.empty() && graph.chapter_id != options.expected_id) {
    result.warnings.push_back("chapterId '" + graph.chapter_id + "' differs from requested '" +
                              options.expected_id + "'");
  }
  if (graph.rooms.empty()) {
    result.errors.push_back("room graph has no rooms");
    return;
  }

  std::set<std::string> room_ids;
  for (const auto& room : graph.rooms) {
    if (room.id.empty()) {
      result.errors.push_back("room has empty roomId");
    } else if (!room_ids.insert(room.id).second) {
      result.errors.push_back("duplicate room id: " + room.id);
    }
  }
  auto check_anchor = [&](const char* field, const std::string& id) {
    if (!id.empty() && room_ids.count(id) == 0) {
      result.errors.push_back(std::string(field) + " '" + id + "' not found in room list");
    }
  };
  check_anchor("hubRoomId", graph.hub_id);
  check_anchor("entryRoomId", graph.entry_id);
  check_anchor("exitRoomId", graph.exit_id);

  std::map<std::string, const RoomNode*> by_id;
  for (const auto& room : graph.rooms) {
    by_id[room.id] = &room;
  }
  for (const auto& room : graph.rooms) {
    if (room.id.empty()) continue;
    if (room.name.empty()) {
      result.warnings.push_back("room '" + room.id + "' missing roomName");
    }
    if (room.neighbors.empty()) {
      result.warnings.push_back("room '" + room.id + "' has no connections (isolated room)");
    }
    for (const auto& neighbor : room.neighbors) {
      auto it = by_id.find(neighbor);
      if (it == by_id.end()) {
        result.errors.push_back("room '" + room.id + "' connects to unknown room '" + neighbor + "'");
        continue;
      }
      const auto& back = it->second->neighbors;
      if (std::find(back.begin(), back.end(), room.id) == back.end()) {
        result.warnings.push_back("connection " + room.id + " -> " + neighbor + " is not bidirectional");
      }
    }
    if (room.kind == RoomKind::Dialogue && room.npcs.empty()) {
      result.warnings.push_back("interaction room '" + room.id + "' has no NPCs");
    }
    if (room.kind == RoomKind::Combat && room.enemy_id.empty()) {
      result.warnings.push_back("combat room '" + room.id + "' has no enemyId");
    }
  }
}
} // namespace

std::string clean_json(std::string_view raw) {
  std::string_view text = trim(raw);
  if (text.substr(0, 3) == "```") {
    const auto newline = text.find('\n');
    // "```json{...}" on a single line still counts as a fence.
    if (newline == std::string_view::npos) {
      text.remove_prefix(text.substr(0, 7) == "```json" ? 7 : 3);
    } else {
      text.remove_prefix(newline + 1);
    }
    text = trim(text);
  }
  if (text.size() >= 3 && text.substr(text.size() - 3) == "```") {
    text.remove_suffix(3);
    text = trim(text);
  }
  return std::string(text);
}

ValidationResult validate_document(ArtifactKind kind, const json& doc, const ValidateOptions& options) {
  ValidationResult result;
  result.parsed = doc;
  if (!doc.is_object()) {
    result.errors.push_back(std::string(to_string(kind)) + " document must be a JSON object");
    return result;
  }
  switch (kind) {
    case ArtifactKind::Room:
      validate_room(doc, options, result);
      break;
    case ArtifactKind::Quest:
      validate_quest(doc, options, result);
      break;
    case ArtifactKind::Enemy:
      validate_enemy(doc, options, result);
      break;
    case ArtifactKind::Item:
      validate_item(doc, options, result);
      break;
    case ArtifactKind::Outline:
      validate_outline(doc, options, result);
      break;
    case ArtifactKind::Graph:
      validate_graph(doc, options, result);
      break;
  }
  return result;
}

ValidationResult validate(ArtifactKind kind, std::string_view raw, const ValidateOptions& options) {
  ValidationResult result;
  if (trim(raw).empty()) {
    result.parse_failed = true;
    result.errors.push_back("JSON is empty");
    return result;
  }

  const std::string cleaned = clean_json(raw);
  json doc = json::parse(cleaned, nullptr, false);
  if (doc.is_discarded()) {
    result.parse_failed = true;
    std::string detail;
    try {
      (void)json::parse(cleaned);
    } catch (const json::parse_error& e) {
      detail = scrub_utf8(e.what());
    }
    result.errors.push_back("JSON parse error" + (detail.empty() ? std::string() : ": " + detail));
    if (cleaned.find("```") != std::string::npos) {
      result.errors.push_back("response still contains markdown code fencing; expected bare JSON");
    }
    return result;
  }
  if (!doc.is_object()) {
    result.parse_failed = true;
    result.errors.push_back(std::string(to_string(kind)) + " response must be a JSON object");
    return result;
  }
  return validate_document(kind, doc, options);
}

} // namespace wgen
