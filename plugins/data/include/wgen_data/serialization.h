#pragma once

#include "wgen/world_types.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <string>

namespace wgen::data {

bool save_yaml_file(const std::filesystem::path& path, const YAML::Node& node, std::string& error);

// Snake_case layout accepted by load_generation_config(); never carries a credential.
YAML::Node config_to_yaml(const GenerationConfig& cfg);

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error);
// Creates missing parent directories; writes with a 2-space indent. Invalid
// UTF-8 in strings is written as U+FFFD.
bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node, std::string& error);

bool write_text_file(const std::filesystem::path& path, const std::string& contents, std::string& error);

bool ensure_directory(const std::filesystem::path& dir, std::string& error);

} // namespace wgen::data
