#pragma once

#include "wgen/world_types.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace wgen {

enum class ArtifactKind {
  Room,
  Quest,
  Enemy,
  Item,
  Outline,
  Graph
};

const char* to_string(ArtifactKind kind);

struct ValidationResult {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  // Set whenever the text parsed as a JSON object, even if rule checks failed.
  nlohmann::json parsed;
  bool parse_failed = false;

  bool ok() const { return errors.empty(); }
  bool has_document() const { return !parse_failed && parsed.is_object(); }
};

struct ValidateOptions {
  // Id the document must carry (room_id / questId / enemyId / itemId / chapterId).
  std::string expected_id;
  std::optional<RoomKind> expected_room_kind;
  // When set, every room exit must lead to one of these ids.
  std::optional<std::set<std::string>> known_ids;
  // Graph neighbors of the room; exits outside this set are warned about.
  std::vector<std::string> allowed_exits;
};

// Removes a surrounding ``` / ```json fence and trims whitespace.
std::string clean_json(std::string_view raw);

ValidationResult validate(ArtifactKind kind, std::string_view raw, const ValidateOptions& options = {});

// Rule checks against an already-parsed document (used when re-checking a store).
ValidationResult validate_document(ArtifactKind kind, const nlohmann::json& doc,
                                   const ValidateOptions& options = {});

} // namespace wgen
