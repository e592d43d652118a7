#include "wgen/config.h"

#include "wgen/json_fields.h"
#include "wgen/log.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <fstream>

namespace wgen {

using json = nlohmann::json;

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

json scalar_to_json(const YAML::Node& node) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    return text;  // quoted in the source
  }
  long long integer = 0;
  if (YAML::convert<long long>::decode(node, integer)) {
    return integer;
  }
  double real = 0.0;
  if (YAML::convert<double>::decode(node, real)) {
    return real;
  }
  bool boolean = false;
  if (YAML::convert<bool>::decode(node, boolean)) {
    return boolean;
  }
  return text;
}

json yaml_to_json(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      json out = json::object();
      for (const auto& kv : node) {
        out[kv.first.as<std::string>()] = yaml_to_json(kv.second);
      }
      return out;
    }
    case YAML::NodeType::Sequence: {
      json out = json::array();
      for (const auto& item : node) {
        out.push_back(yaml_to_json(item));
      }
      return out;
    }
    case YAML::NodeType::Scalar:
      return scalar_to_json(node);
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return nullptr;
}

void apply_brief(const json& j, WorldBrief& brief, std::vector<std::string>& errors) {
  fields::read(j, "world_name", brief.world_name, &errors);
  fields::read(j, "theme", brief.theme, &errors);
  fields::read(j, "tone", brief.tone, &errors);
  fields::read(j, "era", brief.era, &errors);
  fields::read(j, "setting", brief.setting_description, &errors);
  fields::read(j, "setting_description", brief.setting_description, &errors);
  fields::read(j, "key_locations", brief.key_locations, &errors);
  fields::read(j, "major_factions", brief.major_factions, &errors);
  fields::read(j, "main_conflict", brief.main_conflict, &errors);
  fields::read(j, "protagonist_role", brief.protagonist_role, &errors);
  fields::read(j, "narrative_themes", brief.narrative_themes, &errors);
  fields::read(j, "writing_style", brief.writing_style, &errors);
  fields::read(j, "dialogue_tone", brief.dialogue_tone, &errors);
  if (j.contains("custom_parameters")) {
    const auto& custom = j["custom_parameters"];
    if (custom.is_object()) {
      for (auto it = custom.begin(); it != custom.end(); ++it) {
        KeyValue kv;
        kv.key = it.key();
        kv.value = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        brief.custom_parameters.push_back(std::move(kv));
      }
    } else if (!custom.is_null()) {
      errors.push_back("field 'custom_parameters' must be a map");
    }
  }
}

void apply_settings(const json& j, GenerationSettings& s, std::vector<std::string>& errors) {
  fields::read(j, "total_chapters", s.total_chapters, &errors);
  fields::read(j, "locations_per_chapter", s.locations_per_chapter, &errors);
  fields::read(j, "sub_locations_per_major", s.sub_locations_per_major, &errors);
  fields::read(j, "quests_per_chapter", s.quests_per_chapter, &errors);
  fields::read(j, "main_quests_per_chapter", s.main_quests_per_chapter, &errors);
  fields::read(j, "enemy_types_per_chapter", s.enemy_types_per_chapter, &errors);
  fields::read(j, "items_per_chapter", s.items_per_chapter, &errors);
  fields::read(j, "npcs_per_chapter", s.npcs_per_chapter, &errors);
  fields::read(j, "difficulty_variance", s.difficulty_variance, &errors);
  fields::read(j, "allow_hard_side_quests", s.allow_hard_side_quests, &errors);
  fields::read(j, "hard_side_quest_chance", s.hard_side_quest_chance, &errors);
  fields::read(j, "hub_location_ratio", s.hub_location_ratio, &errors);
  fields::read(j, "quest_revealed_ratio", s.quest_revealed_ratio, &errors);
}

void apply_provider(const json& j, ProviderConfig& p, std::vector<std::string>& errors) {
  fields::read(j, "name", p.provider, &errors);
  fields::read(j, "provider", p.provider, &errors);
  fields::read(j, "model", p.model, &errors);
  fields::read(j, "base_url", p.base_url, &errors);
  fields::read(j, "temperature", p.temperature, &errors);
  fields::read(j, "max_tokens", p.max_tokens, &errors);
  fields::read(j, "request_delay_ms", p.request_delay_ms, &errors);
  fields::read(j, "max_retries", p.max_retries, &errors);
  fields::read(j, "retry_delay_ms", p.retry_delay_ms, &errors);
  fields::read(j, "timeout_seconds", p.timeout_seconds, &errors);
  if (j.contains("api_key") || j.contains("credential")) {
    log::warn("config: credentials are not read from config files; use WGEN_API_KEY");
  }
}
} // namespace

std::string slugify(const std::string& text) {
  std::string out;
  bool pending_sep = false;
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      if (pending_sep && !out.empty()) out.push_back('_');
      pending_sep = false;
      out.push_back(static_cast<char>(std::tolower(c)));
    } else {
      pending_sep = true;
    }
  }
  if (!out.empty() && std::isdigit(static_cast<unsigned char>(out.front()))) {
    out.insert(0, "world_");
  }
  return out;
}

bool apply_generation_config(const json& doc, GenerationConfig& out, std::string& error) {
  if (!doc.is_object()) {
    error = "config root must be a map";
    return false;
  }
  const json& root = doc.contains("generation") ? doc["generation"] : doc;
  std::vector<std::string> errors;
  auto section = [&](const char* name) -> const json& {
    static const json kEmpty = json::object();
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) return kEmpty;
    if (!it->is_object()) {
      errors.push_back(std::string("section '") + name + "' must be a map");
      return kEmpty;
    }
    return *it;
  };

  const json& world = section("world");
  fields::read(world, "id", out.world_id, &errors);
  fields::read(world, "name", out.world_name, &errors);
  apply_brief(section("brief"), out.brief, errors);
  apply_settings(section("settings"), out.settings, errors);
  apply_provider(section("provider"), out.provider, errors);
  std::string output_root;
  fields::read(section("output"), "root", output_root, &errors);
  if (!output_root.empty()) {
    out.output_root = output_root;
  }

  if (!errors.empty()) {
    error = fields::join(errors, "; ");
    return false;
  }
  if (out.world_name.empty()) {
    out.world_name = out.brief.world_name;
  }
  if (out.brief.world_name.empty()) {
    out.brief.world_name = out.world_name;
  }
  if (out.world_id.empty()) {
    out.world_id = slugify(out.world_name);
  }
  return true;
}

bool load_generation_config(const std::filesystem::path& path, GenerationConfig& out, std::string& error) {
  if (!file_exists(path)) {
    error = "config not found: " + path.string();
    return false;
  }

  const auto ext = path.extension().string();
  json doc;
  if (ext == ".json") {
    std::ifstream in(path);
    if (!in) {
      error = "config read failed: " + path.string();
      return false;
    }
    try {
      in >> doc;
    } catch (const std::exception& e) {
      error = std::string("config parse failed: ") + e.what();
      return false;
    }
  } else if (ext == ".yaml" || ext == ".yml") {
    try {
      doc = yaml_to_json(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
      error = std::string("config parse failed: ") + e.what();
      return false;
    }
  } else {
    error = "unknown config extension: " + ext;
    return false;
  }

  if (!apply_generation_config(doc, out, error)) {
    error = path.filename().string() + ": " + error;
    return false;
  }
  log::info("config loaded: " + path.string() + " (world " + out.world_id + ")");
  return true;
}

bool check_generation_config(const GenerationConfig& cfg, std::string& error) {
  const auto& s = cfg.settings;
  const auto& p = cfg.provider;
  if (cfg.world_id.empty()) {
    error = "world id is empty (set world.id or world.name)";
  } else if (s.total_chapters < 1) {
    error = "settings.total_chapters must be at least 1";
  } else if (s.locations_per_chapter < 1) {
    error = "settings.locations_per_chapter must be at least 1";
  } else if (s.main_quests_per_chapter < 1) {
    error = "settings.main_quests_per_chapter must be at least 1";
  } else if (s.quests_per_chapter < s.main_quests_per_chapter) {
    error = "settings.quests_per_chapter must not be below main_quests_per_chapter";
  } else if (p.request_delay_ms < 0 || p.retry_delay_ms < 0) {
    error = "provider delays must not be negative";
  } else if (p.max_tokens < 1) {
    error = "provider.max_tokens must be positive";
  } else if (p.timeout_seconds < 1) {
    error = "provider.timeout_seconds must be positive";
  } else {
    return true;
  }
  return false;
}

} // namespace wgen
