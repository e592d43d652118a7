#include "wgen/prompt_builder.h"

#include "wgen/json_fields.h"
#include "wgen/schema_contract.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>

namespace wgen::prompts {

using ordered_json = nlohmann::ordered_json;

namespace {
std::string alternatives(const std::vector<std::string>& values) {
  return fields::join(values, "|");
}

void write_format(std::ostringstream& oss, const ordered_json& shape) {
  oss << "\n=== OUTPUT FORMAT ===\n";
  oss << shape.dump(2) << "\n";
  oss << "\nRespond with the JSON object only: no markdown, no code fences, no commentary.\n";
}

void write_exit_destinations(std::ostringstream& oss, const RoomNode& room, const RoomGraph& graph) {
  oss << "\n=== VALID EXIT DESTINATIONS (use ONLY these room IDs) ===\n";
  for (const auto& id : room.neighbors) {
    const auto* target = graph.find(id);
    oss << "- " << id;
    if (target && !target->name.empty()) {
      oss << ": " << target->name;
    }
    oss << "\n";
  }
}

ordered_json exit_stubs(const RoomNode& room, const RoomGraph& graph, const std::string& forward_condition) {
  ordered_json exits = ordered_json::array();
  for (size_t i = 0; i < room.neighbors.size(); ++i) {
    const auto& id = room.neighbors[i];
    const auto* target = graph.find(id);
    const std::string target_name = target && !target->name.empty() ? target->name : id;
    ordered_json conditions = ordered_json::array();
    // The first exit is the way back; later ones open after the encounter.
    if (!forward_condition.empty() && i > 0) {
      conditions.push_back(forward_condition);
    }
    exits.push_back({{"exit_name", "<direction to " + target_name + ">"},
                     {"leads_to", id},
                     {"conditions", conditions},
                     {"conditions_not", ordered_json::array()}});
  }
  return exits;
}

ordered_json room_shape(const RoomNode& room, RoomKind kind) {
  ordered_json shape;
  shape["room_id"] = room.id;
  shape["room_type"] = to_string(kind);
  shape["description"] = "<rich atmospheric description with sensory details>";
  shape["npcs"] = ordered_json::array();
  shape["items"] = ordered_json::array();
  shape["actions"] = ordered_json::array();
  shape["dialogues"] = ordered_json::array();
  shape["exits"] = ordered_json::array();
  shape["combat"] = nullptr;
  shape["events"] = ordered_json::array();
  return shape;
}

const NpcSummary* find_npc(const ChapterOutline& outline, const std::string& id) {
  for (const auto& npc : outline.key_npcs) {
    if (npc.id == id) return &npc;
  }
  return nullptr;
}

const EnemySummary* find_enemy(const ChapterOutline& outline, const std::string& id) {
  for (const auto& enemy : outline.enemies) {
    if (enemy.id == id) return &enemy;
  }
  return nullptr;
}

void write_room_details(std::ostringstream& oss, const RoomNode& room, const ChapterOutline& outline,
                        int chapter_number) {
  oss << "\n=== ROOM DETAILS ===\n";
  oss << "Room ID: " << room.id << "\n";
  oss << "Room Name: " << room.name << "\n";
  oss << "Brief Context: " << room.description << "\n";
  oss << "Chapter: " << chapter_number << " - " << outline.chapter_name << "\n";
}
} // namespace

std::string request_header(const std::string& kind, const std::string& id) {
  return "### Request: " + kind + " " + id + "\n";
}

std::string chapter_id_for(int chapter_number) {
  return "chapter_" + std::to_string(chapter_number);
}

std::string system_prompt(const WorldBrief& brief) {
  std::ostringstream oss;
  oss << "You are a content generator for a text-driven role-playing game. "
      << "You produce structured JSON documents that a game engine loads directly.\n";
  oss << "\n=== WORLD CONTEXT ===\n";
  oss << "World Name: " << brief.world_name << "\n";
  oss << "Theme: " << brief.theme << "\n";
  oss << "Tone: " << brief.tone << "\n";
  if (!brief.era.empty()) {
    oss << "Era: " << brief.era << "\n";
  }
  oss << "Setting: " << brief.setting_description << "\n";
  oss << "Main Conflict: " << brief.main_conflict << "\n";
  oss << "Player Role: " << brief.protagonist_role << "\n";
  oss << "Writing Style: " << brief.writing_style << "\n";
  oss << "Dialogue Tone: " << brief.dialogue_tone << "\n";
  if (!brief.key_locations.empty()) {
    oss << "Key Locations: " << fields::join(brief.key_locations, ", ") << "\n";
  }
  if (!brief.major_factions.empty()) {
    oss << "Major Factions: " << fields::join(brief.major_factions, ", ") << "\n";
  }
  if (!brief.narrative_themes.empty()) {
    oss << "Narrative Themes: " << fields::join(brief.narrative_themes, ", ") << "\n";
  }
  for (const auto& kv : brief.custom_parameters) {
    oss << kv.key << ": " << kv.value << "\n";
  }
  oss << "\n=== CRITICAL RULES ===\n";
  oss << "1. Output ONLY valid JSON - no markdown, no explanations, no code blocks\n";
  oss << "2. " << contract::id_rules_text() << "\n";
  oss << "3. Descriptions should be atmospheric and match the tone\n";
  oss << "4. NPC dialogue must reflect personality and world lore\n";
  oss << "5. All location/quest/NPC references must use consistent IDs\n";
  oss << "6. Combat encounters must match the specified difficulty level\n";
  return oss.str();
}

std::string outline_prompt(const WorldBrief& brief, const GenerationSettings& settings, int chapter_number,
                           const ChapterArtifact* previous) {
  const std::string chapter_id = chapter_id_for(chapter_number);
  const DifficultyBand band = difficulty_for_chapter(chapter_number);

  std::ostringstream oss;
  oss << request_header("outline", chapter_id);
  oss << "Generate a detailed outline for Chapter " << chapter_number << " of " << brief.world_name << ".\n";
  oss << "\n=== CHAPTER REQUIREMENTS ===\n";
  oss << "- " << settings.locations_per_chapter << " major locations\n";
  oss << "- " << settings.main_quests_per_chapter << " main quests (required for progression)\n";
  oss << "- " << settings.side_quests_per_chapter() << " side quests (optional)\n";
  oss << "- Base difficulty: " << band.base_difficulty << " (scale 1-10)\n";
  oss << "- Enemy challenge rating between " << band.min_enemy_cr << " and " << band.max_enemy_cr << "\n";
  oss << "- " << settings.enemy_types_per_chapter << " enemy types\n";
  oss << "- " << settings.npcs_per_chapter << " key NPCs\n";
  oss << "- Up to " << settings.items_per_chapter << " notable items\n";
  if (settings.allow_hard_side_quests) {
    oss << "- About " << settings.hard_side_quest_chance << "% of side quests may be harder than the chapter level\n";
  }

  const int hub_count = static_cast<int>(settings.locations_per_chapter * settings.hub_location_ratio);
  const int revealed_count = static_cast<int>(settings.locations_per_chapter * settings.quest_revealed_ratio);
  const int gated_count = std::max(0, settings.locations_per_chapter - hub_count - revealed_count);
  oss << "\n=== LOCATION DISTRIBUTION ===\n";
  oss << "- " << hub_count << " hub locations (always accessible: towns, shops)\n";
  oss << "- " << revealed_count << " quest-revealed locations (discovered through quests)\n";
  oss << "- " << gated_count << " progression-gated locations (require main quest completion)\n";

  if (previous) {
    oss << "\n=== PREVIOUS CHAPTER CONTEXT ===\n";
    oss << "Previous Chapter: " << previous->name << "\n";
    oss << "Summary: " << previous->description << "\n";
    oss << "Exit Location: " << previous->exit_location_id << "\n";
    oss << "The new chapter should continue naturally from this point. "
        << "Do not reuse IDs from earlier chapters for new content.\n";
  }

  ordered_json quest_stub = {{"questId", "<snake_case_id>"},
                             {"questName", "<quest name>"},
                             {"description", "<quest summary>"},
                             {"questGiver", "<npc_id>"},
                             {"taskLocation", "<location_id>"},
                             {"difficulty", band.base_difficulty}};
  ordered_json shape;
  shape["chapterId"] = chapter_id;
  shape["chapterName"] = "<evocative chapter name>";
  shape["chapterDescription"] = "<2-3 sentence summary>";
  shape["chapterIntro"] = "<opening narration when chapter starts>";
  shape["hubLocationId"] = "<main_hub_id>";
  shape["entryLocationId"] = "<entry_from_previous_chapter>";
  shape["exitLocationId"] = "<exit_to_next_chapter>";
  shape["locations"] = ordered_json::array({{{"locationId", "<snake_case_id>"},
                                             {"locationName", "<display name>"},
                                             {"locationType", alternatives(contract::location_types())},
                                             {"description", "<brief description>"},
                                             {"alwaysVisible", false},
                                             {"connectedTo", ordered_json::array({"<other_location_ids>"})}}});
  shape["mainQuests"] = ordered_json::array({quest_stub});
  shape["sideQuests"] = ordered_json::array({quest_stub});
  shape["keyNPCs"] = ordered_json::array({{{"npcId", "<snake_case_id>"},
                                           {"npcName", "<display name>"},
                                           {"role", alternatives(contract::npc_roles())},
                                           {"personality", "<brief personality>"},
                                           {"locationId", "<where they are found>"}}});
  shape["enemies"] = ordered_json::array({{{"enemyId", "<snake_case_id>"},
                                           {"enemyName", "<display name>"},
                                           {"enemyType", "<creature type>"},
                                           {"challengeRating", band.min_enemy_cr},
                                           {"description", "<brief description>"}}});
  shape["items"] = ordered_json::array({{{"itemId", "<snake_case_id>"},
                                         {"itemName", "<display name>"},
                                         {"itemType", alternatives(contract::item_categories())},
                                         {"value", 10}}});
  write_format(oss, shape);
  oss << "The last entry of mainQuests is the quest that completes this chapter.\n";
  return oss.str();
}

std::string room_graph_prompt(const WorldBrief& brief, const GenerationSettings& settings,
                              const ChapterOutline& outline) {
  std::ostringstream oss;
  oss << request_header("graph", outline.chapter_id);
  oss << "Generate the room connectivity graph for chapter '" << outline.chapter_name << "' of "
      << brief.world_name << ".\n";
  oss << "\n=== CHAPTER LOCATIONS ===\n";
  for (const auto& loc : outline.locations) {
    oss << "- " << loc.id << ": " << loc.name << " (" << loc.type << ") - " << loc.description << "\n";
  }
  oss << "Hub: " << outline.hub_location_id << ", Entry: " << outline.entry_location_id
      << ", Exit: " << outline.exit_location_id << "\n";
  oss << "\n=== KEY NPCs ===\n";
  for (const auto& npc : outline.key_npcs) {
    oss << "- " << npc.id << ": " << npc.name << " (" << npc.role << ") at " << npc.location_id << "\n";
  }
  oss << "\n=== ENEMIES ===\n";
  for (const auto& enemy : outline.enemies) {
    oss << "- " << enemy.id << ": " << enemy.name << " (CR " << enemy.challenge_rating << ")\n";
  }
  oss << "\n=== ROOM TYPE DEFINITIONS ===\n";
  oss << "1. 'crossroad' - Navigation hub with 2-" << contract::kMaxNavigationExits
      << " exits. NO NPC dialogues, NO combat.\n";
  oss << "2. 'interaction' - NPC dialogue room with 1-" << contract::kMaxScopedExits
      << " exits. Contains NPCs to talk to.\n";
  oss << "3. 'combat' - Combat encounter room with 1-" << contract::kMaxScopedExits
      << " exits. Contains one enemy.\n";
  oss << "\n=== REQUIREMENTS ===\n";
  oss << "- About " << settings.locations_per_chapter << " rooms in total\n";
  oss << "- Every location must have at least one room\n";
  oss << "- Hub locations should have mostly crossroad rooms\n";
  oss << "- Each NPC needs an interaction room where they can be found\n";
  oss << "- All connections must be bidirectional (if A connects to B, B must connect to A)\n";
  oss << "- " << contract::id_rules_text() << "\n";
  oss << "- Room IDs should follow the pattern locationId_descriptiveName\n";

  ordered_json shape;
  shape["chapterId"] = outline.chapter_id;
  shape["hubRoomId"] = "<main_hub_room_id>";
  shape["entryRoomId"] = "<entry_point_room_id>";
  shape["exitRoomId"] = "<exit_to_next_chapter_room_id>";
  shape["rooms"] = ordered_json::array({{{"roomId", "<snake_case_room_id>"},
                                         {"roomName", "<Display Name>"},
                                         {"roomType", alternatives(contract::room_types())},
                                         {"description", "<brief 1-sentence description for context>"},
                                         {"connectsTo", ordered_json::array({"<other_room_ids>"})},
                                         {"npcs", ordered_json::array({"<npc_ids_in_this_room>"})},
                                         {"enemyId", "<enemy_id_or_null>"},
                                         {"isHub", false}}});
  write_format(oss, shape);
  return oss.str();
}

std::string navigation_room_prompt(const RoomNode& room, const RoomGraph& graph, const ChapterOutline& outline,
                                   int chapter_number) {
  std::ostringstream oss;
  oss << request_header("room", room.id);
  oss << "Generate a CROSSROAD (navigation) room JSON for: " << room.name << "\n";
  write_room_details(oss, room, outline, chapter_number);
  write_exit_destinations(oss, room, graph);
  oss << "\n=== REQUIREMENTS ===\n";
  oss << "- Rich atmospheric description (2-3 paragraphs)\n";
  oss << "- actions array must be EMPTY []\n";
  oss << "- dialogues array must be EMPTY []\n";
  oss << "- npcs array must be EMPTY []\n";
  oss << "- Exactly " << room.neighbors.size() << " exits using ONLY the room IDs listed above\n";

  ordered_json shape = room_shape(room, RoomKind::Navigation);
  shape["exits"] = exit_stubs(room, graph, "");
  write_format(oss, shape);
  return oss.str();
}

std::string dialogue_room_prompt(const RoomNode& room, const RoomGraph& graph, const ChapterOutline& outline,
                                 int chapter_number) {
  std::ostringstream oss;
  oss << request_header("room", room.id);
  oss << "Generate an INTERACTION (NPC dialogue) room JSON for: " << room.name << "\n";
  oss << "\n!!! CRITICAL RULE - READ CAREFULLY !!!\n";
  oss << "Every action_id MUST EXACTLY EQUAL a dialogue npc_name (case-sensitive), and every\n";
  oss << "dialogue npc_name MUST have an action with the same action_id.\n";
  write_room_details(oss, room, outline, chapter_number);
  oss << "\n=== NPCs IN THIS ROOM (create dialogue for each) ===\n";
  for (const auto& npc_id : room.npcs) {
    const auto* npc = find_npc(outline, npc_id);
    if (npc) {
      oss << "- " << npc->id << ": " << npc->name << " (" << npc->role << ") - " << npc->personality << "\n";
    } else {
      oss << "- " << npc_id << "\n";
    }
  }
  write_exit_destinations(oss, room, graph);
  oss << "\n=== REQUIREMENTS ===\n";
  oss << "- Rich atmospheric description (2-3 paragraphs)\n";
  oss << "- Exactly " << room.npcs.size() << " action(s), one per NPC\n";
  oss << "- Each dialogue should have 3-5 steps with branching responses\n";
  oss << "- next_step: " << contract::kDialogueEnd << " ends the conversation, 0+ continues to that step index\n";
  oss << "- Exactly " << room.neighbors.size() << " exits using ONLY the room IDs listed above\n";

  ordered_json shape = room_shape(room, RoomKind::Dialogue);
  for (const auto& npc_id : room.npcs) {
    const auto* npc = find_npc(outline, npc_id);
    const std::string display = npc && !npc->name.empty() ? npc->name : npc_id;
    const std::string personality = npc && !npc->personality.empty() ? npc->personality : "mysterious";
    shape["npcs"].push_back(npc_id);
    shape["actions"].push_back({{"action_id", npc_id}, {"action_description", "Talk to " + display}});
    ordered_json steps = ordered_json::array();
    steps.push_back({{"message", "<" + personality + " greeting>"},
                     {"responses", ordered_json::array({{{"text", "<option 1>"}, {"next_step", 1}},
                                                        {{"text", "Farewell."}, {"next_step", -1}}})}});
    steps.push_back({{"message", "<response to option 1>"},
                     {"responses", ordered_json::array({{{"text", "<conclude>"}, {"next_step", -1}}})}});
    shape["dialogues"].push_back({{"npc_name", npc_id}, {"dialogue_image", "npc_default"}, {"dialogues", steps}});
  }
  shape["exits"] = exit_stubs(room, graph, "");
  write_format(oss, shape);
  return oss.str();
}

std::string combat_room_prompt(const RoomNode& room, const RoomGraph& graph, const ChapterOutline& outline,
                               int chapter_number) {
  std::ostringstream oss;
  oss << request_header("room", room.id);
  oss << "Generate a COMBAT (encounter) room JSON for: " << room.name << "\n";
  oss << "\n=== THIS IS A COMBAT ROOM ===\n";
  oss << "- Contains an enemy encounter\n";
  oss << "- May have treasure/loot after combat\n";
  oss << "- Usually 1-" << contract::kMaxScopedExits << " exits (back, and forward after victory)\n";
  write_room_details(oss, room, outline, chapter_number);
  oss << "\n=== ENEMY ===\n";
  const auto* enemy = find_enemy(outline, room.enemy_id);
  if (enemy) {
    oss << "- " << enemy->id << ": " << enemy->name << " (CR " << enemy->challenge_rating << ")\n";
    oss << "- Description: " << enemy->description << "\n";
  } else {
    oss << "- " << room.enemy_id << "\n";
  }
  write_exit_destinations(oss, room, graph);
  oss << "\n=== REQUIREMENTS ===\n";
  oss << "- Tense atmospheric description hinting at danger\n";
  oss << "- dialogues array must be EMPTY []\n";
  oss << "- combat.enemyId must be '" << room.enemy_id << "'\n";
  oss << "- Exactly " << room.neighbors.size() << " exits using ONLY the room IDs listed above\n";

  const std::string defeat_flag = room.enemy_id + "_defeated";
  ordered_json shape = room_shape(room, RoomKind::Combat);
  shape["exits"] = exit_stubs(room, graph, defeat_flag);
  shape["combat"] = {{"enemyId", room.enemy_id}, {"isBoss", false}, {"defeatFlag", defeat_flag}};
  write_format(oss, shape);
  return oss.str();
}

std::string room_prompt(const RoomNode& room, const RoomGraph& graph, const ChapterOutline& outline,
                        int chapter_number) {
  switch (room.kind) {
    case RoomKind::Dialogue:
      return dialogue_room_prompt(room, graph, outline, chapter_number);
    case RoomKind::Combat:
      return combat_room_prompt(room, graph, outline, chapter_number);
    case RoomKind::Navigation:
      break;
  }
  return navigation_room_prompt(room, graph, outline, chapter_number);
}

std::string quest_prompt(const QuestSummary& quest, const ChapterOutline& outline, const RoomGraph& graph,
                         int chapter_number, const std::vector<std::string>& valid_prerequisites) {
  std::ostringstream oss;
  oss << request_header("quest", quest.id);
  oss << "Generate a complete quest JSON for: " << quest.name << "\n";
  oss << "\n=== QUEST DETAILS ===\n";
  oss << "ID: " << quest.id << "\n";
  oss << "Type: " << (quest.is_main ? "MAIN QUEST (required for progression)" : "Side Quest (optional)") << "\n";
  oss << "Description: " << quest.description << "\n";
  oss << "Quest Giver: " << quest.quest_giver << "\n";
  oss << "Task Location: " << quest.task_location << "\n";
  oss << "Difficulty: " << quest.difficulty << "\n";
  oss << "Chapter: " << chapter_number << " - " << outline.chapter_name << "\n";

  oss << "\n=== VALID TARGET IDS ===\n";
  oss << "Rooms (GoToRoom, questGiverLocation, reveals*):";
  for (const auto& room : graph.rooms) {
    oss << " " << room.id;
  }
  oss << "\nNPCs (TalkToNPC):";
  for (const auto& npc : outline.key_npcs) {
    oss << " " << npc.id;
  }
  oss << "\nEnemies (DefeatEnemy, DefeatCount):";
  for (const auto& enemy : outline.enemies) {
    oss << " " << enemy.id;
  }
  oss << "\nItems (CollectItem, DeliverItem, UseItem):";
  for (const auto& item : outline.items) {
    oss << " " << item.id;
  }
  oss << "\nPrerequisite quests (prerequisiteQuests):";
  if (valid_prerequisites.empty()) {
    oss << " none";
  }
  for (const auto& id : valid_prerequisites) {
    oss << " " << id;
  }
  oss << "\n";

  oss << "\n=== REQUIREMENTS ===\n";
  oss << "- 2-4 meaningful objectives that tell a mini-story\n";
  oss << "- Rewards appropriate to difficulty (" << contract::kMinQuestDifficulty << "-"
      << contract::kMaxQuestDifficulty << "); never negative\n";
  oss << "- targetCount is at least 1\n";
  if (quest.is_main) {
    oss << "- Should reveal new locations on completion\n";
    oss << "- Critical to the chapter narrative\n";
  }
  oss << "\n=== OBJECTIVE TYPES ===\n";
  oss << fields::join(contract::objective_types(), ", ") << "\n";

  ordered_json shape;
  shape["questId"] = quest.id;
  shape["questName"] = quest.name;
  shape["questDescription"] = "<engaging description>";
  shape["questGiver"] = quest.quest_giver;
  shape["questGiverLocation"] = "<room_id>";
  shape["questType"] = quest.is_main ? "Main" : "Side";
  shape["chapterNumber"] = chapter_number;
  shape["difficulty"] = quest.difficulty;
  shape["prerequisiteQuests"] = ordered_json::array();
  shape["prerequisiteFlags"] = ordered_json::array();
  shape["objectives"] = ordered_json::array({{{"objectiveId", "<objective_id>"},
                                              {"description", "<what player needs to do>"},
                                              {"type", alternatives(contract::objective_types())},
                                              {"targetId", "<target id from the lists above>"},
                                              {"targetCount", 1},
                                              {"isOptional", false}}});
  shape["revealsOnAccept"] = ordered_json::array();
  shape["revealsOnComplete"] = ordered_json::array();
  shape["rewards"] = {{"experiencePoints", 50 * std::max(1, quest.difficulty)},
                      {"gold", 25 * std::max(1, quest.difficulty)},
                      {"itemIds", ordered_json::array()},
                      {"flagsToSet", ordered_json::array({{{"flagName", "quest_" + quest.id + "_complete"},
                                                           {"flagValue", "true"}}})}};
  shape["state"] = "NotStarted";
  write_format(oss, shape);
  return oss.str();
}

std::string enemy_prompt(const EnemySummary& enemy, const DifficultyBand& band, int chapter_number) {
  const int cr = std::max(1, enemy.challenge_rating);
  const int base_hp = 20 + cr * 15;
  const int base_ac = 8 + cr;
  const int base_damage = 5 + cr * 3;

  std::ostringstream oss;
  oss << request_header("enemy", enemy.id);
  oss << "Generate a complete enemy JSON for: " << enemy.name << "\n";
  oss << "\n=== ENEMY DETAILS ===\n";
  oss << "ID: " << enemy.id << "\n";
  oss << "Type: " << enemy.enemy_type << "\n";
  oss << "Challenge Rating: " << cr << " (chapter " << chapter_number << " range " << band.min_enemy_cr << "-"
      << band.max_enemy_cr << ")\n";
  oss << "Description: " << enemy.description << "\n";
  oss << "\n=== STAT GUIDELINES (based on CR) ===\n";
  oss << "- HP: ~" << base_hp << " (range: " << base_hp - 10 << " to " << base_hp + 10 << ")\n";
  oss << "- AC: ~" << base_ac << "\n";
  oss << "- Damage per attack: ~" << base_damage << "; damageMax must be >= damageMin\n";
  oss << "- dropChance is a probability between 0 and 1\n";

  ordered_json shape;
  shape["enemyId"] = enemy.id;
  shape["enemyName"] = enemy.name;
  shape["description"] = "<combat description>";
  shape["enemyImage"] = "enemy_default";
  shape["maxHitPoints"] = base_hp;
  shape["currentHitPoints"] = base_hp;
  shape["armorClass"] = base_ac;
  shape["experienceValue"] = cr * 25;
  shape["goldDrop"] = cr * 10;
  shape["attacks"] = ordered_json::array({{{"attackName", "<primary attack>"},
                                           {"attackDescription", "<flavor text>"},
                                           {"damageMin", base_damage - 2},
                                           {"damageMax", base_damage + 2},
                                           {"hitBonus", cr}},
                                          {{"attackName", "<special attack>"},
                                           {"attackDescription", "<flavor text>"},
                                           {"damageMin", base_damage},
                                           {"damageMax", base_damage + 5},
                                           {"hitBonus", cr - 1}}});
  shape["lootTable"] = ordered_json::array({{{"itemId", "<item_id>"}, {"dropChance", 0.3}}});
  write_format(oss, shape);
  return oss.str();
}

std::string item_prompt(const ItemSummary& item, int chapter_number) {
  std::ostringstream oss;
  oss << request_header("item", item.id);
  oss << "Generate a complete item JSON for: " << item.name << "\n";
  oss << "\n=== ITEM DETAILS ===\n";
  oss << "ID: " << item.id << "\n";
  oss << "Type: " << item.item_type << "\n";
  oss << "Approximate Value: " << item.value << " gold\n";
  oss << "Chapter: " << chapter_number << "\n";
  oss << "\n=== ITEM TYPES ===\n";
  oss << "- weapon: Damage effect on NPC target\n";
  oss << "- armor: AC bonus\n";
  oss << "- consumable: Heal, Bless, CurePoison effects on Self\n";
  oss << "- key: Open effect on Lock target\n";
  oss << "- quest: No combat use, story item\n";
  oss << "\neffectType values: " << contract::effect_type_legend() << "\n";
  oss << "target values: " << contract::item_target_legend() << "\n";
  oss << "Stackable items need maxStack of at least 1.\n";

  ordered_json shape;
  shape["itemId"] = item.id;
  shape["shortDescription"] = item.name;
  shape["description"] = "<flavor description>";
  shape["usageSuccess"] = "<message when used successfully>";
  shape["usageFail"] = "<message when use fails>";
  shape["category"] = alternatives(contract::item_categories());
  shape["effectType"] = 0;
  shape["effectAmount"] = 0;
  shape["target"] = 0;
  shape["stacking"] = false;
  shape["maxStack"] = 1;
  shape["buyPrice"] = item.value;
  shape["sellPrice"] = item.value / 2;
  shape["image"] = "item_default";
  shape["combatUsable"] = false;
  write_format(oss, shape);
  return oss.str();
}

} // namespace wgen::prompts
