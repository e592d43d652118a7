#pragma once

#include "wgen/content_validation.h"
#include "wgen/event_bus.h"
#include "wgen/run_report.h"
#include "wgen/schema_validator.h"
#include "wgen/world_types.h"
#include "wgen_llm/llm.h"

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace wgen::runtime {

enum class GenerationStage {
  Idle,
  Outline,
  Graph,
  Locations,
  Quests,
  Enemies,
  Items,
  Validate,
  Persist,
  Done,
  Aborted
};

const char* to_string(GenerationStage stage);

// Everything a run reads, passed down the call chain instead of globals.
struct GenerationContext {
  WorldBrief brief;
  GenerationSettings settings;
  ProviderConfig provider;
  std::string credential;
  std::shared_ptr<std::atomic<bool>> cancel;

  bool cancelled() const { return cancel && cancel->load(); }
};

// Drives Outline -> Graph -> Locations -> Quests -> Enemies -> Items ->
// Validate -> Persist per run. Requests go through the model client one at a
// time; cancellation is checked after every chapter and every artifact.
class WorldGenerator {
 public:
  WorldGenerator(llm::IModelClient& client, EventBus& bus);
  ~WorldGenerator();

  WorldGenerator(const WorldGenerator&) = delete;
  WorldGenerator& operator=(const WorldGenerator&) = delete;

  // Background variants; the outcome arrives through GenerationCompleteEvent
  // and last_report(). Fail immediately when a run is already active.
  bool start_generation(const GenerationConfig& config, const std::string& credential, std::string& error);
  bool generate_next_chapter(const std::string& credential, std::string& error);
  void cancel();
  void wait();
  bool is_generating() const { return generating_.load(); }
  RunReport last_report() const;

  // Blocking variants used by the CLI and tests.
  RunReport run_generation(const GenerationConfig& config, const std::string& credential);
  // Appends chapter N+1 to the current world (loaded or just generated).
  RunReport run_next_chapter(const std::string& credential);

  bool load_world(const std::filesystem::path& world_dir, std::string& error);

  // Stable only while no run is active.
  const WorldContent& content() const { return content_; }
  const WorldManifest& manifest() const { return manifest_; }
  const std::filesystem::path& world_dir() const { return world_dir_; }
  bool has_world() const { return has_world_.load(); }
  GenerationStage stage() const { return stage_.load(); }

 private:
  struct RunState;
  enum class ChapterOutcome {
    Completed,
    Aborted,
    Cancelled
  };

  std::unique_ptr<RunState> prepare_generation(const GenerationConfig& config, const std::string& credential);
  std::unique_ptr<RunState> prepare_next_chapter(const std::string& credential);
  RunReport execute(RunState& run);
  RunReport finish(RunState& run, bool success);
  ChapterOutcome generate_chapter(RunState& run, int chapter_number);
  void validate_all(RunState& run);
  bool persist(RunState& run);

  llm::ModelResponse request(RunState& run, const char* kind, const std::string& id, const std::string& prompt);
  // Sends, parses and returns the document for one room/quest/enemy/item;
  // null on transport or parse failure (already reported).
  nlohmann::json generate_artifact(RunState& run, ArtifactKind kind, const std::string& id,
                                   const std::string& prompt, const ValidateOptions& options);

  void record_issue(RunState& run, IssueKind kind, const std::string& artifact_id, const std::string& message,
                    bool fatal = false);
  void status(const std::string& message);
  void progress(RunState& run, int chapter_number, int step, int steps);
  void set_stage(GenerationStage stage);
  void store_artifact(RunState& run, ArtifactMap& target, ArtifactKind kind, const std::string& id,
                      nlohmann::json doc);
  void launch(std::unique_ptr<RunState> run);

  llm::IModelClient& client_;
  EventBus& bus_;

  mutable std::mutex mutex_;
  std::shared_ptr<std::atomic<bool>> cancel_;
  RunReport last_report_;
  std::thread worker_;
  std::atomic<bool> generating_{false};
  std::atomic<GenerationStage> stage_{GenerationStage::Idle};

  std::atomic<bool> has_world_{false};
  std::filesystem::path world_dir_;
  WorldManifest manifest_;
  WorldContent content_;
  std::map<std::string, RoomPlan> room_plans_;
};

} // namespace wgen::runtime
