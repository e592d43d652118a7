#pragma once

#include "wgen/world_types.h"

#include <filesystem>
#include <string>

namespace wgen {

// Reads a generation config from .yaml/.yml or .json. Keys are snake_case and
// grouped under world / brief / settings / provider / output, optionally below
// a top-level "generation" key. Missing keys keep their defaults.
bool load_generation_config(const std::filesystem::path& path, GenerationConfig& out, std::string& error);

// Same as above for an in-memory JSON document.
bool apply_generation_config(const nlohmann::json& root, GenerationConfig& out, std::string& error);

// Range checks that make a run impossible (zero chapters, negative delays, ...).
bool check_generation_config(const GenerationConfig& cfg, std::string& error);

// "The Sunken Crown" -> "the_sunken_crown"
std::string slugify(const std::string& text);

} // namespace wgen
