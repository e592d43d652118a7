#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wgen {

enum class RoomKind {
  Navigation,
  Dialogue,
  Combat
};

// Wire names: "crossroad", "interaction", "combat".
const char* to_string(RoomKind kind);
std::optional<RoomKind> room_kind_from_string(std::string_view text);

struct KeyValue {
  std::string key;
  std::string value;
};

struct WorldBrief {
  std::string world_name;
  std::string theme;
  std::string tone;
  std::string era;
  std::string setting_description;
  std::vector<std::string> key_locations;
  std::vector<std::string> major_factions;
  std::string main_conflict;
  std::string protagonist_role;
  std::vector<std::string> narrative_themes;
  std::string writing_style;
  std::string dialogue_tone;
  std::vector<KeyValue> custom_parameters;
};

struct GenerationSettings {
  int total_chapters = 5;
  int locations_per_chapter = 10;
  int sub_locations_per_major = 2;
  int quests_per_chapter = 7;
  int main_quests_per_chapter = 2;
  int enemy_types_per_chapter = 5;
  int items_per_chapter = 10;
  int npcs_per_chapter = 8;
  float difficulty_variance = 0.3f;
  bool allow_hard_side_quests = true;
  int hard_side_quest_chance = 20;
  float hub_location_ratio = 0.2f;
  float quest_revealed_ratio = 0.6f;

  int side_quests_per_chapter() const;
};

// Never holds the credential; that is passed separately at call time.
struct ProviderConfig {
  std::string provider = "openai";
  std::string model = "gpt-4";
  std::string base_url;
  float temperature = 0.7f;
  int max_tokens = 4000;
  int request_delay_ms = 1000;
  int max_retries = 3;
  int retry_delay_ms = 2000;
  int timeout_seconds = 120;
};

struct GenerationConfig {
  std::string world_id;
  std::string world_name;
  WorldBrief brief;
  GenerationSettings settings;
  ProviderConfig provider;
  std::filesystem::path output_root = "worlds";
};

struct LocationSummary {
  std::string id;
  std::string name;
  std::string type;
  std::string description;
  bool always_visible = false;
  std::vector<std::string> connected_to;
};

struct QuestSummary {
  std::string id;
  std::string name;
  std::string description;
  std::string quest_giver;
  std::string task_location;
  int difficulty = 1;
  bool is_main = false;
};

struct NpcSummary {
  std::string id;
  std::string name;
  std::string role;
  std::string personality;
  std::string location_id;
};

struct EnemySummary {
  std::string id;
  std::string name;
  std::string enemy_type;
  std::string description;
  int challenge_rating = 1;
};

struct ItemSummary {
  std::string id;
  std::string name;
  std::string item_type;
  int value = 0;
};

struct ChapterOutline {
  std::string chapter_id;
  std::string chapter_name;
  std::string description;
  std::string intro;
  std::string hub_location_id;
  std::string entry_location_id;
  std::string exit_location_id;
  std::vector<LocationSummary> locations;
  std::vector<QuestSummary> main_quests;
  std::vector<QuestSummary> side_quests;
  std::vector<NpcSummary> key_npcs;
  std::vector<EnemySummary> enemies;
  std::vector<ItemSummary> items;
};

struct RoomNode {
  std::string id;
  std::string name;
  RoomKind kind = RoomKind::Navigation;
  std::string description;
  std::vector<std::string> neighbors;
  std::vector<std::string> npcs;
  std::string enemy_id;
  bool is_hub = false;
};

struct RoomGraph {
  std::string chapter_id;
  std::string hub_id;
  std::string entry_id;
  std::string exit_id;
  std::vector<RoomNode> rooms;

  const RoomNode* find(std::string_view id) const;
  RoomNode* find(std::string_view id);
};

struct DifficultyBand {
  int base_difficulty = 0;
  int min_enemy_cr = 1;
  int max_enemy_cr = 1;
};

DifficultyBand difficulty_for_chapter(int chapter_number);

struct ChapterArtifact {
  std::string id;
  std::string name;
  int number = 0;
  std::string description;
  std::string intro;
  // Last main quest of the previous chapter; empty for chapter 1.
  std::string unlock_quest_id;
  // Last main quest of this chapter.
  std::string exit_quest_id;
  DifficultyBand difficulty;
  std::vector<std::string> location_ids;
  std::vector<std::string> quest_ids;
  std::vector<std::string> main_quest_ids;
  std::vector<std::string> enemy_ids;
  std::vector<std::string> item_ids;
  std::vector<std::string> npc_ids;
  std::string hub_location_id;
  std::string entry_location_id;
  std::string exit_location_id;
  std::string generated_at;
  bool is_generated = false;
  bool is_validated = false;
  std::vector<std::string> validation_errors;
};

using ArtifactMap = std::map<std::string, nlohmann::json>;

// Everything one world holds in memory; keys are artifact ids.
struct WorldContent {
  std::vector<ChapterArtifact> chapters;
  ArtifactMap rooms;
  ArtifactMap quests;
  ArtifactMap enemies;
  ArtifactMap items;
};

struct WorldManifest {
  std::string config_id;
  std::string config_name;
  std::string story_id;
  std::string story_name;
  std::string created_at;
  std::string generated_by = "wgen";
  WorldBrief brief;
  GenerationSettings settings;
  ProviderConfig provider;
  std::vector<std::string> chapter_ids;
  std::string starting_room;
};

nlohmann::json to_json(const WorldBrief& brief);
nlohmann::json to_json(const GenerationSettings& settings);
nlohmann::json to_json(const ProviderConfig& provider);
nlohmann::json to_json(const ChapterArtifact& chapter);
nlohmann::json to_json(const WorldManifest& manifest);
nlohmann::json to_json(const RoomGraph& graph);

bool brief_from_json(const nlohmann::json& j, WorldBrief& out, std::string& error);
bool settings_from_json(const nlohmann::json& j, GenerationSettings& out, std::string& error);
bool provider_from_json(const nlohmann::json& j, ProviderConfig& out, std::string& error);
bool chapter_from_json(const nlohmann::json& j, ChapterArtifact& out, std::string& error);
bool manifest_from_json(const nlohmann::json& j, WorldManifest& out, std::string& error);

std::string now_iso();

} // namespace wgen
