#include "wgen_data/serialization.h"

#include "wgen/log.h"

namespace wgen::data {

namespace {
YAML::Node string_list(const std::vector<std::string>& values) {
  YAML::Node node(YAML::NodeType::Sequence);
  for (const auto& v : values) {
    node.push_back(v);
  }
  return node;
}
} // namespace

YAML::Node config_to_yaml(const GenerationConfig& cfg) {
  YAML::Node root;
  YAML::Node gen = root["generation"];
  gen["world"]["id"] = cfg.world_id;
  gen["world"]["name"] = cfg.world_name;

  const auto& b = cfg.brief;
  YAML::Node brief = gen["brief"];
  brief["world_name"] = b.world_name;
  brief["theme"] = b.theme;
  brief["tone"] = b.tone;
  brief["era"] = b.era;
  brief["setting"] = b.setting_description;
  brief["key_locations"] = string_list(b.key_locations);
  brief["major_factions"] = string_list(b.major_factions);
  brief["main_conflict"] = b.main_conflict;
  brief["protagonist_role"] = b.protagonist_role;
  brief["narrative_themes"] = string_list(b.narrative_themes);
  brief["writing_style"] = b.writing_style;
  brief["dialogue_tone"] = b.dialogue_tone;
  if (!b.custom_parameters.empty()) {
    YAML::Node custom(YAML::NodeType::Map);
    for (const auto& kv : b.custom_parameters) {
      custom[kv.key] = kv.value;
    }
    brief["custom_parameters"] = custom;
  }

  const auto& s = cfg.settings;
  YAML::Node settings = gen["settings"];
  settings["total_chapters"] = s.total_chapters;
  settings["locations_per_chapter"] = s.locations_per_chapter;
  settings["sub_locations_per_major"] = s.sub_locations_per_major;
  settings["quests_per_chapter"] = s.quests_per_chapter;
  settings["main_quests_per_chapter"] = s.main_quests_per_chapter;
  settings["enemy_types_per_chapter"] = s.enemy_types_per_chapter;
  settings["items_per_chapter"] = s.items_per_chapter;
  settings["npcs_per_chapter"] = s.npcs_per_chapter;
  settings["difficulty_variance"] = s.difficulty_variance;
  settings["allow_hard_side_quests"] = s.allow_hard_side_quests;
  settings["hard_side_quest_chance"] = s.hard_side_quest_chance;
  settings["hub_location_ratio"] = s.hub_location_ratio;
  settings["quest_revealed_ratio"] = s.quest_revealed_ratio;

  const auto& p = cfg.provider;
  YAML::Node provider = gen["provider"];
  provider["name"] = p.provider;
  provider["model"] = p.model;
  if (!p.base_url.empty()) {
    provider["base_url"] = p.base_url;
  }
  provider["temperature"] = p.temperature;
  provider["max_tokens"] = p.max_tokens;
  provider["request_delay_ms"] = p.request_delay_ms;
  provider["max_retries"] = p.max_retries;
  provider["retry_delay_ms"] = p.retry_delay_ms;
  provider["timeout_seconds"] = p.timeout_seconds;

  gen["output"]["root"] = cfg.output_root.string();
  return root;
}

bool save_yaml_file(const std::filesystem::path& path, const YAML::Node& node, std::string& error) {
  try {
    YAML::Emitter emitter;
    emitter << node;
    return write_text_file(path, std::string(emitter.c_str()) + "\n", error);
  } catch (const std::exception& e) {
    error = std::string("YAML save failed: ") + e.what();
    log::warn(error);
    return false;
  }
}

} // namespace wgen::data
