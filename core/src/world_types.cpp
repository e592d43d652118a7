#include "wgen/world_types.h"

#include "wgen/json_fields.h"

#include <algorithm>
#include <chrono>
#include <ctime>

namespace wgen {

using json = nlohmann::json;

const char* to_string(RoomKind kind) {
  switch (kind) {
    case RoomKind::Navigation:
      return "crossroad";
    case RoomKind::Dialogue:
      return "interaction";
    case RoomKind::Combat:
      return "combat";
  }
  return "crossroad";
}

std::optional<RoomKind> room_kind_from_string(std::string_view text) {
  if (text == "crossroad" || text == "navigation") return RoomKind::Navigation;
  if (text == "interaction" || text == "dialogue") return RoomKind::Dialogue;
  if (text == "combat") return RoomKind::Combat;
  return std::nullopt;
}

int GenerationSettings::side_quests_per_chapter() const {
  return std::max(0, quests_per_chapter - main_quests_per_chapter);
}

const RoomNode* RoomGraph::find(std::string_view id) const {
  for (const auto& room : rooms) {
    if (room.id == id) return &room;
  }
  return nullptr;
}

RoomNode* RoomGraph::find(std::string_view id) {
  for (auto& room : rooms) {
    if (room.id == id) return &room;
  }
  return nullptr;
}

DifficultyBand difficulty_for_chapter(int chapter_number) {
  DifficultyBand band;
  band.base_difficulty = chapter_number * 2;
  band.min_enemy_cr = std::max(1, chapter_number - 1);
  band.max_enemy_cr = chapter_number + 2;
  return band;
}

std::string now_iso() {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return std::string(buf);
}

json to_json(const WorldBrief& brief) {
  json j;
  j["worldName"] = brief.world_name;
  j["theme"] = brief.theme;
  j["tone"] = brief.tone;
  j["era"] = brief.era;
  j["settingDescription"] = brief.setting_description;
  j["keyLocations"] = brief.key_locations;
  j["majorFactions"] = brief.major_factions;
  j["mainConflict"] = brief.main_conflict;
  j["protagonistRole"] = brief.protagonist_role;
  j["narrativeThemes"] = brief.narrative_themes;
  j["writingStyle"] = brief.writing_style;
  j["dialogueTone"] = brief.dialogue_tone;
  j["customParameters"] = json::array();
  for (const auto& kv : brief.custom_parameters) {
    j["customParameters"].push_back({{"key", kv.key}, {"value", kv.value}});
  }
  return j;
}

json to_json(const GenerationSettings& s) {
  json j;
  j["totalChapters"] = s.total_chapters;
  j["locationsPerChapter"] = s.locations_per_chapter;
  j["subLocationsPerMajor"] = s.sub_locations_per_major;
  j["questsPerChapter"] = s.quests_per_chapter;
  j["mainQuestsPerChapter"] = s.main_quests_per_chapter;
  j["enemyTypesPerChapter"] = s.enemy_types_per_chapter;
  j["itemsPerChapter"] = s.items_per_chapter;
  j["npcsPerChapter"] = s.npcs_per_chapter;
  j["difficultyVariance"] = s.difficulty_variance;
  j["allowHardSideQuests"] = s.allow_hard_side_quests;
  j["hardSideQuestChance"] = s.hard_side_quest_chance;
  j["hubLocationRatio"] = s.hub_location_ratio;
  j["questRevealedRatio"] = s.quest_revealed_ratio;
  return j;
}

json to_json(const ProviderConfig& p) {
  json j;
  j["provider"] = p.provider;
  j["model"] = p.model;
  if (!p.base_url.empty()) {
    j["baseUrl"] = p.base_url;
  }
  j["temperature"] = p.temperature;
  j["maxTokensPerRequest"] = p.max_tokens;
  j["requestDelayMs"] = p.request_delay_ms;
  j["maxRetries"] = p.max_retries;
  j["retryDelayMs"] = p.retry_delay_ms;
  j["timeoutSeconds"] = p.timeout_seconds;
  return j;
}

json to_json(const ChapterArtifact& c) {
  json j;
  j["chapterId"] = c.id;
  j["chapterName"] = c.name;
  j["chapterNumber"] = c.number;
  j["chapterDescription"] = c.description;
  j["chapterIntro"] = c.intro;
  j["unlockQuestId"] = c.unlock_quest_id;
  j["exitQuestId"] = c.exit_quest_id;
  j["baseDifficulty"] = c.difficulty.base_difficulty;
  j["minEnemyCR"] = c.difficulty.min_enemy_cr;
  j["maxEnemyCR"] = c.difficulty.max_enemy_cr;
  j["locationIds"] = c.location_ids;
  j["questIds"] = c.quest_ids;
  j["mainQuestIds"] = c.main_quest_ids;
  j["enemyIds"] = c.enemy_ids;
  j["itemIds"] = c.item_ids;
  j["npcIds"] = c.npc_ids;
  j["hubLocationId"] = c.hub_location_id;
  j["entryLocationId"] = c.entry_location_id;
  j["exitLocationId"] = c.exit_location_id;
  j["generatedAt"] = c.generated_at;
  j["isGenerated"] = c.is_generated;
  j["isValidated"] = c.is_validated;
  j["validationErrors"] = c.validation_errors;
  return j;
}

json to_json(const WorldManifest& m) {
  json j;
  j["configId"] = m.config_id;
  j["configName"] = m.config_name;
  j["storyId"] = m.story_id;
  j["storyName"] = m.story_name;
  j["createdAt"] = m.created_at;
  j["generatedBy"] = m.generated_by;
  j["worldPrompt"] = to_json(m.brief);
  j["settings"] = to_json(m.settings);
  j["apiConfig"] = to_json(m.provider);
  j["chapterIds"] = m.chapter_ids;
  j["startingRoom"] = m.starting_room;
  return j;
}

json to_json(const RoomGraph& graph) {
  json j;
  j["chapterId"] = graph.chapter_id;
  j["hubRoomId"] = graph.hub_id;
  j["entryRoomId"] = graph.entry_id;
  j["exitRoomId"] = graph.exit_id;
  j["rooms"] = json::array();
  for (const auto& room : graph.rooms) {
    json r;
    r["roomId"] = room.id;
    r["roomName"] = room.name;
    r["roomType"] = to_string(room.kind);
    r["description"] = room.description;
    r["connectsTo"] = room.neighbors;
    r["npcs"] = room.npcs;
    r["enemyId"] = room.enemy_id;
    r["isHub"] = room.is_hub;
    j["rooms"].push_back(std::move(r));
  }
  return j;
}

namespace {
bool finish(const std::vector<std::string>& errors, const char* what, std::string& error) {
  if (errors.empty()) {
    return true;
  }
  error = std::string(what) + ": " + fields::join(errors, "; ");
  return false;
}
} // namespace

bool brief_from_json(const json& j, WorldBrief& out, std::string& error) {
  if (!j.is_object()) {
    error = "world prompt must be an object";
    return false;
  }
  std::vector<std::string> errors;
  fields::read(j, "worldName", out.world_name, &errors);
  fields::read(j, "theme", out.theme, &errors);
  fields::read(j, "tone", out.tone, &errors);
  fields::read(j, "era", out.era, &errors);
  fields::read(j, "settingDescription", out.setting_description, &errors);
  fields::read(j, "keyLocations", out.key_locations, &errors);
  fields::read(j, "majorFactions", out.major_factions, &errors);
  fields::read(j, "mainConflict", out.main_conflict, &errors);
  fields::read(j, "protagonistRole", out.protagonist_role, &errors);
  fields::read(j, "narrativeThemes", out.narrative_themes, &errors);
  fields::read(j, "writingStyle", out.writing_style, &errors);
  fields::read(j, "dialogueTone", out.dialogue_tone, &errors);
  out.custom_parameters.clear();
  for (const auto& kv : fields::objects(j, "customParameters", &errors)) {
    KeyValue entry;
    fields::read(kv, "key", entry.key, &errors);
    fields::read(kv, "value", entry.value, &errors);
    out.custom_parameters.push_back(std::move(entry));
  }
  return finish(errors, "world prompt", error);
}

bool settings_from_json(const json& j, GenerationSettings& out, std::string& error) {
  if (!j.is_object()) {
    error = "settings must be an object";
    return false;
  }
  std::vector<std::string> errors;
  fields::read(j, "totalChapters", out.total_chapters, &errors);
  fields::read(j, "locationsPerChapter", out.locations_per_chapter, &errors);
  fields::read(j, "subLocationsPerMajor", out.sub_locations_per_major, &errors);
  fields::read(j, "questsPerChapter", out.quests_per_chapter, &errors);
  fields::read(j, "mainQuestsPerChapter", out.main_quests_per_chapter, &errors);
  fields::read(j, "enemyTypesPerChapter", out.enemy_types_per_chapter, &errors);
  fields::read(j, "itemsPerChapter", out.items_per_chapter, &errors);
  fields::read(j, "npcsPerChapter", out.npcs_per_chapter, &errors);
  fields::read(j, "difficultyVariance", out.difficulty_variance, &errors);
  fields::read(j, "allowHardSideQuests", out.allow_hard_side_quests, &errors);
  fields::read(j, "hardSideQuestChance", out.hard_side_quest_chance, &errors);
  fields::read(j, "hubLocationRatio", out.hub_location_ratio, &errors);
  fields::read(j, "questRevealedRatio", out.quest_revealed_ratio, &errors);
  return finish(errors, "settings", error);
}

bool provider_from_json(const json& j, ProviderConfig& out, std::string& error) {
  if (!j.is_object()) {
    error = "api config must be an object";
    return false;
  }
  std::vector<std::string> errors;
  fields::read(j, "provider", out.provider, &errors);
  fields::read(j, "model", out.model, &errors);
  fields::read(j, "baseUrl", out.base_url, &errors);
  fields::read(j, "temperature", out.temperature, &errors);
  fields::read(j, "maxTokensPerRequest", out.max_tokens, &errors);
  fields::read(j, "requestDelayMs", out.request_delay_ms, &errors);
  fields::read(j, "maxRetries", out.max_retries, &errors);
  fields::read(j, "retryDelayMs", out.retry_delay_ms, &errors);
  fields::read(j, "timeoutSeconds", out.timeout_seconds, &errors);
  return finish(errors, "api config", error);
}

bool chapter_from_json(const json& j, ChapterArtifact& out, std::string& error) {
  if (!j.is_object()) {
    error = "chapter must be an object";
    return false;
  }
  std::vector<std::string> errors;
  fields::read(j, "chapterId", out.id, &errors);
  fields::read(j, "chapterName", out.name, &errors);
  fields::read(j, "chapterNumber", out.number, &errors);
  fields::read(j, "chapterDescription", out.description, &errors);
  fields::read(j, "chapterIntro", out.intro, &errors);
  fields::read(j, "unlockQuestId", out.unlock_quest_id, &errors);
  fields::read(j, "exitQuestId", out.exit_quest_id, &errors);
  fields::read(j, "baseDifficulty", out.difficulty.base_difficulty, &errors);
  fields::read(j, "minEnemyCR", out.difficulty.min_enemy_cr, &errors);
  fields::read(j, "maxEnemyCR", out.difficulty.max_enemy_cr, &errors);
  fields::read(j, "locationIds", out.location_ids, &errors);
  fields::read(j, "questIds", out.quest_ids, &errors);
  fields::read(j, "mainQuestIds", out.main_quest_ids, &errors);
  fields::read(j, "enemyIds", out.enemy_ids, &errors);
  fields::read(j, "itemIds", out.item_ids, &errors);
  fields::read(j, "npcIds", out.npc_ids, &errors);
  fields::read(j, "hubLocationId", out.hub_location_id, &errors);
  fields::read(j, "entryLocationId", out.entry_location_id, &errors);
  fields::read(j, "exitLocationId", out.exit_location_id, &errors);
  fields::read(j, "generatedAt", out.generated_at, &errors);
  fields::read(j, "isGenerated", out.is_generated, &errors);
  fields::read(j, "isValidated", out.is_validated, &errors);
  fields::read(j, "validationErrors", out.validation_errors, &errors);
  if (out.id.empty()) {
    errors.push_back("chapterId missing");
  }
  return finish(errors, "chapter", error);
}

bool manifest_from_json(const json& j, WorldManifest& out, std::string& error) {
  if (!j.is_object()) {
    error = "manifest must be an object";
    return false;
  }
  std::vector<std::string> errors;
  fields::read(j, "configId", out.config_id, &errors);
  fields::read(j, "configName", out.config_name, &errors);
  fields::read(j, "storyId", out.story_id, &errors);
  fields::read(j, "storyName", out.story_name, &errors);
  fields::read(j, "createdAt", out.created_at, &errors);
  fields::read(j, "generatedBy", out.generated_by, &errors);
  fields::read(j, "chapterIds", out.chapter_ids, &errors);
  fields::read(j, "startingRoom", out.starting_room, &errors);
  if (!finish(errors, "manifest", error)) {
    return false;
  }
  if (j.contains("worldPrompt") && !brief_from_json(j["worldPrompt"], out.brief, error)) {
    return false;
  }
  if (j.contains("settings") && !settings_from_json(j["settings"], out.settings, error)) {
    return false;
  }
  if (j.contains("apiConfig") && !provider_from_json(j["apiConfig"], out.provider, error)) {
    return false;
  }
  return true;
}

} // namespace wgen
