#pragma once

#include "wgen/run_report.h"
#include "wgen/world_types.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace wgen::runtime {

// One generated world on disk:
//   config.json, world_prompt.json, generation_report.json, journal.sqlite
//   Chapters/ Rooms/ Quests/ Enemies/ Items/  (one <id>.json per artifact)
class ContentStore {
 public:
  explicit ContentStore(std::filesystem::path root);

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path manifest_path() const;
  std::filesystem::path report_path() const;
  std::filesystem::path journal_path() const;
  bool exists() const;

  // Writes every artifact, the manifest and the run report. Stops at the
  // first failed write.
  bool save(const WorldManifest& manifest, const WorldContent& content, const RunReport& report,
            std::string& error) const;

  // Removes config.json and the artifact directories (not the journal) before a
  // fresh run rewrites the world. exists() is false afterwards.
  bool clear_artifacts(std::string& error) const;

  // Chapters are loaded in manifest order; other kinds by directory listing.
  bool load(WorldManifest& manifest, WorldContent& content, std::string& error) const;

  bool load_report(nlohmann::json& out, std::string& error) const;

 private:
  std::filesystem::path root_;
};

// Ids become file names, so they must not contain path separators or "..".
bool is_safe_artifact_id(std::string_view id);

// First chapter's hub room, else its first location.
std::string starting_room(const WorldContent& content);

} // namespace wgen::runtime
