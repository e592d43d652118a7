#include "wgen/content_store.h"

#include "wgen/log.h"
#include "wgen_data/serialization.h"

#include <algorithm>

namespace fs = std::filesystem;

namespace wgen::runtime {

using json = nlohmann::json;

namespace {
constexpr const char* kManifestFile = "config.json";
constexpr const char* kBriefFile = "world_prompt.json";
constexpr const char* kReportFile = "generation_report.json";
constexpr const char* kJournalFile = "journal.sqlite";

struct KindDir {
  const char* name;
  ArtifactMap WorldContent::*map;
};

const KindDir kKindDirs[] = {
    {"Rooms", &WorldContent::rooms},
    {"Quests", &WorldContent::quests},
    {"Enemies", &WorldContent::enemies},
    {"Items", &WorldContent::items},
};

bool save_map(const fs::path& dir, const ArtifactMap& artifacts, std::string& error) {
  if (!data::ensure_directory(dir, error)) {
    return false;
  }
  for (const auto& entry : artifacts) {
    if (!is_safe_artifact_id(entry.first)) {
      error = "refusing to write artifact with unsafe id '" + entry.first + "'";
      return false;
    }
    if (!data::save_json_file(dir / (entry.first + ".json"), entry.second, error)) {
      return false;
    }
  }
  return true;
}

bool load_map(const fs::path& dir, ArtifactMap& artifacts, std::string& error) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return true;
  }
  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (entry.is_regular_file(ec) && entry.path().extension() == ".json") {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    error = "failed to list " + dir.string() + ": " + ec.message();
    return false;
  }
  std::sort(files.begin(), files.end());
  for (const auto& file : files) {
    json doc;
    if (!data::load_json_file(file, doc, error)) {
      return false;
    }
    artifacts[file.stem().string()] = std::move(doc);
  }
  return true;
}
} // namespace

bool is_safe_artifact_id(std::string_view id) {
  if (id.empty() || id == "." || id == "..") {
    return false;
  }
  for (char c : id) {
    if (c == '/' || c == '\\' || c == ':' || static_cast<unsigned char>(c) < 0x20) {
      return false;
    }
  }
  return id.find("..") == std::string_view::npos;
}

std::string starting_room(const WorldContent& content) {
  if (content.chapters.empty()) {
    return {};
  }
  const auto& first = content.chapters.front();
  if (!first.hub_location_id.empty()) {
    return first.hub_location_id;
  }
  return first.location_ids.empty() ? std::string() : first.location_ids.front();
}

ContentStore::ContentStore(fs::path root) : root_(std::move(root)) {}

fs::path ContentStore::manifest_path() const {
  return root_ / kManifestFile;
}

fs::path ContentStore::report_path() const {
  return root_ / kReportFile;
}

fs::path ContentStore::journal_path() const {
  return root_ / kJournalFile;
}

bool ContentStore::exists() const {
  std::error_code ec;
  return fs::exists(manifest_path(), ec);
}

bool ContentStore::save(const WorldManifest& manifest, const WorldContent& content, const RunReport& report,
                        std::string& error) const {
  if (!data::ensure_directory(root_, error)) {
    return false;
  }

  const fs::path chapters_dir = root_ / "Chapters";
  if (!data::ensure_directory(chapters_dir, error)) {
    return false;
  }
  for (const auto& chapter : content.chapters) {
    if (!is_safe_artifact_id(chapter.id)) {
      error = "refusing to write chapter with unsafe id '" + chapter.id + "'";
      return false;
    }
    if (!data::save_json_file(chapters_dir / (chapter.id + ".json"), to_json(chapter), error)) {
      return false;
    }
  }
  for (const auto& kind : kKindDirs) {
    if (!save_map(root_ / kind.name, content.*(kind.map), error)) {
      return false;
    }
  }

  if (!data::save_json_file(root_ / kBriefFile, to_json(manifest.brief), error)) {
    return false;
  }
  if (!data::save_json_file(report_path(), to_json(report), error)) {
    return false;
  }
  // Manifest last: a store without config.json is treated as absent.
  if (!data::save_json_file(manifest_path(), to_json(manifest), error)) {
    return false;
  }
  log::info("content store written: " + root_.string() + " (" + std::to_string(content.chapters.size()) +
            " chapters, " + std::to_string(content.rooms.size()) + " rooms)");
  return true;
}

bool ContentStore::clear_artifacts(std::string& error) const {
  // Manifest first, so an interrupted rewrite leaves a store that reads as absent
  // rather than one listing chapters that are gone.
  std::error_code manifest_ec;
  fs::remove(manifest_path(), manifest_ec);
  if (manifest_ec) {
    error = "failed to remove " + manifest_path().string() + ": " + manifest_ec.message();
    return false;
  }
  std::vector<fs::path> dirs = {root_ / "Chapters"};
  for (const auto& kind : kKindDirs) {
    dirs.push_back(root_ / kind.name);
  }
  for (const auto& dir : dirs) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
      error = "failed to clear " + dir.string() + ": " + ec.message();
      return false;
    }
  }
  return true;
}

bool ContentStore::load(WorldManifest& manifest, WorldContent& content, std::string& error) const {
  json doc;
  if (!data::load_json_file(manifest_path(), doc, error)) {
    return false;
  }
  WorldManifest loaded;
  if (!manifest_from_json(doc, loaded, error)) {
    error = manifest_path().string() + ": " + error;
    return false;
  }

  WorldContent world;
  for (const auto& chapter_id : loaded.chapter_ids) {
    if (!is_safe_artifact_id(chapter_id)) {
      error = "manifest lists unsafe chapter id '" + chapter_id + "'";
      return false;
    }
    json chapter_doc;
    if (!data::load_json_file(root_ / "Chapters" / (chapter_id + ".json"), chapter_doc, error)) {
      return false;
    }
    ChapterArtifact chapter;
    if (!chapter_from_json(chapter_doc, chapter, error)) {
      error = chapter_id + ": " + error;
      return false;
    }
    world.chapters.push_back(std::move(chapter));
  }
  for (const auto& kind : kKindDirs) {
    if (!load_map(root_ / kind.name, world.*(kind.map), error)) {
      return false;
    }
  }

  manifest = std::move(loaded);
  content = std::move(world);
  return true;
}

bool ContentStore::load_report(json& out, std::string& error) const {
  return data::load_json_file(report_path(), out, error);
}

} // namespace wgen::runtime
