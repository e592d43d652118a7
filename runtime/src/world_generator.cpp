#include "wgen/world_generator.h"

#include "wgen/config.h"
#include "wgen/content_store.h"
#include "wgen/documents.h"
#include "wgen/generation_events.h"
#include "wgen/json_fields.h"
#include "wgen/log.h"
#include "wgen/prompt_builder.h"
#include "wgen/room_graph.h"
#include "wgen_data/journal.h"

#include <algorithm>
#include <set>

namespace wgen::runtime {

using json = nlohmann::json;

struct WorldGenerator::RunState {
  GenerationContext ctx;
  RunReport report;
  WorldManifest manifest;
  WorldContent work;
  std::map<std::string, RoomPlan> plans;
  std::filesystem::path world_dir;
  std::string system_prompt;
  int first_chapter = 1;
  int last_chapter = 1;
  // Set when the run cannot start (bad config, no world loaded).
  std::string setup_error;
};

const char* to_string(GenerationStage stage) {
  switch (stage) {
    case GenerationStage::Idle:
      return "idle";
    case GenerationStage::Outline:
      return "outline";
    case GenerationStage::Graph:
      return "graph";
    case GenerationStage::Locations:
      return "locations";
    case GenerationStage::Quests:
      return "quests";
    case GenerationStage::Enemies:
      return "enemies";
    case GenerationStage::Items:
      return "items";
    case GenerationStage::Validate:
      return "validate";
    case GenerationStage::Persist:
      return "persist";
    case GenerationStage::Done:
      return "done";
    case GenerationStage::Aborted:
      return "aborted";
  }
  return "unknown";
}

namespace {
template <typename Summary>
std::vector<Summary> take_usable(const std::vector<Summary>& all, int limit, std::vector<std::string>& rejected) {
  std::vector<Summary> out;
  std::set<std::string> seen;
  for (const auto& entry : all) {
    if (static_cast<int>(out.size()) >= limit) {
      break;
    }
    if (!is_safe_artifact_id(entry.id) || !seen.insert(entry.id).second) {
      rejected.push_back(entry.id);
      continue;
    }
    out.push_back(entry);
  }
  return out;
}

template <typename Summary>
std::vector<std::string> ids_of(const std::vector<Summary>& entries) {
  std::vector<std::string> ids;
  ids.reserve(entries.size());
  for (const auto& entry : entries) {
    ids.push_back(entry.id);
  }
  return ids;
}

void fix_anchor(std::string& anchor, const RoomGraph& graph, const std::string& preferred,
                const std::string& fallback) {
  if (graph.find(anchor)) {
    return;
  }
  anchor = graph.find(preferred) ? preferred : fallback;
}
} // namespace

WorldGenerator::WorldGenerator(llm::IModelClient& client, EventBus& bus) : client_(client), bus_(bus) {}

WorldGenerator::~WorldGenerator() {
  cancel();
  wait();
}

bool WorldGenerator::start_generation(const GenerationConfig& config, const std::string& credential,
                                      std::string& error) {
  if (!check_generation_config(config, error)) {
    return false;
  }
  bool expected = false;
  if (!generating_.compare_exchange_strong(expected, true)) {
    error = "generation already running";
    return false;
  }
  launch(prepare_generation(config, credential));
  return true;
}

bool WorldGenerator::generate_next_chapter(const std::string& credential, std::string& error) {
  bool expected = false;
  if (!generating_.compare_exchange_strong(expected, true)) {
    error = "generation already running";
    return false;
  }
  if (!has_world_.load()) {
    generating_.store(false);
    error = "no world loaded; generate or load one first";
    return false;
  }
  launch(prepare_next_chapter(credential));
  return true;
}

void WorldGenerator::launch(std::unique_ptr<RunState> run) {
  if (worker_.joinable()) {
    worker_.join();
  }
  worker_ = std::thread([this, run = std::move(run)]() {
    execute(*run);
    generating_.store(false);
  });
}

void WorldGenerator::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancel_) {
    cancel_->store(true);
  }
}

void WorldGenerator::wait() {
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

RunReport WorldGenerator::last_report() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_report_;
}

RunReport WorldGenerator::run_generation(const GenerationConfig& config, const std::string& credential) {
  auto run = prepare_generation(config, credential);
  return execute(*run);
}

RunReport WorldGenerator::run_next_chapter(const std::string& credential) {
  auto run = prepare_next_chapter(credential);
  return execute(*run);
}

bool WorldGenerator::load_world(const std::filesystem::path& world_dir, std::string& error) {
  if (generating_.load()) {
    error = "cannot load a world while generation is running";
    return false;
  }
  ContentStore store(world_dir);
  if (!store.exists()) {
    error = "no generated world at " + world_dir.string();
    return false;
  }
  WorldManifest manifest;
  WorldContent content;
  if (!store.load(manifest, content, error)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    world_dir_ = world_dir;
    manifest_ = std::move(manifest);
    content_ = std::move(content);
    room_plans_.clear();
  }
  has_world_.store(true);
  log::info("world loaded: " + world_dir.string() + " (" + std::to_string(content_.chapters.size()) +
            " chapters)");
  return true;
}

std::unique_ptr<WorldGenerator::RunState> WorldGenerator::prepare_generation(const GenerationConfig& config,
                                                                             const std::string& credential) {
  auto run = std::make_unique<RunState>();
  run->ctx.brief = config.brief;
  run->ctx.settings = config.settings;
  run->ctx.provider = config.provider;
  run->ctx.credential = credential;
  run->ctx.cancel = std::make_shared<std::atomic<bool>>(false);

  run->report.mode = "generate";
  run->report.world_id = config.world_id;

  run->manifest.config_id = config.world_id;
  run->manifest.config_name = config.world_name;
  run->manifest.story_id = config.world_id;
  run->manifest.story_name = config.brief.world_name.empty() ? config.world_name : config.brief.world_name;
  run->manifest.created_at = now_iso();
  run->manifest.brief = config.brief;
  run->manifest.settings = config.settings;
  run->manifest.provider = config.provider;

  run->world_dir = config.output_root / config.world_id;
  run->first_chapter = 1;
  run->last_chapter = config.settings.total_chapters;

  std::string error;
  if (!check_generation_config(config, error)) {
    run->setup_error = error;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  cancel_ = run->ctx.cancel;
  return run;
}

std::unique_ptr<WorldGenerator::RunState> WorldGenerator::prepare_next_chapter(const std::string& credential) {
  auto run = std::make_unique<RunState>();
  run->ctx.credential = credential;
  run->ctx.cancel = std::make_shared<std::atomic<bool>>(false);
  run->report.mode = "next_chapter";

  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_world_.load()) {
    run->setup_error = "no world loaded; generate or load one first";
  } else {
    const int next = static_cast<int>(content_.chapters.size()) + 1;
    run->manifest = manifest_;
    run->manifest.settings.total_chapters = std::max(run->manifest.settings.total_chapters, next);
    run->ctx.brief = manifest_.brief;
    run->ctx.settings = run->manifest.settings;
    run->ctx.provider = manifest_.provider;
    run->work = content_;
    run->plans = room_plans_;
    run->world_dir = world_dir_;
    run->first_chapter = next;
    run->last_chapter = next;
    run->report.world_id = manifest_.config_id;
  }
  cancel_ = run->ctx.cancel;
  return run;
}

RunReport WorldGenerator::execute(RunState& run) {
  run.report.run_id = make_run_id();
  run.report.started_at = now_iso();
  set_stage(GenerationStage::Idle);

  if (!run.setup_error.empty()) {
    record_issue(run, IssueKind::Persist, "", run.setup_error, true);
    return finish(run, false);
  }

  std::string error;
  if (!client_.initialize(run.ctx.provider, run.ctx.credential, error)) {
    record_issue(run, IssueKind::Transport, "", "model client: " + error, true);
    return finish(run, false);
  }
  run.system_prompt = prompts::system_prompt(run.ctx.brief);

  status("generating " + run.report.world_id + ": chapters " + std::to_string(run.first_chapter) + ".." +
         std::to_string(run.last_chapter));

  ChapterOutcome outcome = ChapterOutcome::Completed;
  for (int n = run.first_chapter; n <= run.last_chapter; ++n) {
    if (run.ctx.cancelled()) {
      outcome = ChapterOutcome::Cancelled;
      break;
    }
    outcome = generate_chapter(run, n);
    if (outcome == ChapterOutcome::Completed && run.ctx.cancelled()) {
      outcome = ChapterOutcome::Cancelled;
    }
    if (outcome != ChapterOutcome::Completed) {
      break;
    }
  }

  if (outcome == ChapterOutcome::Cancelled) {
    run.report.cancelled = true;
    record_issue(run, IssueKind::Cancelled, "", "generation cancelled; nothing was written", true);
    return finish(run, false);
  }
  if (outcome == ChapterOutcome::Aborted) {
    return finish(run, false);
  }

  validate_all(run);
  run.report.completed = true;
  const bool persisted = persist(run);
  if (persisted) {
    std::lock_guard<std::mutex> lock(mutex_);
    content_ = run.work;
    manifest_ = run.manifest;
    room_plans_ = run.plans;
    world_dir_ = run.world_dir;
    has_world_.store(true);
  }
  return finish(run, persisted);
}

RunReport WorldGenerator::finish(RunState& run, bool success) {
  if (run.report.finished_at.empty()) {
    run.report.finished_at = now_iso();
  }
  set_stage(success ? GenerationStage::Done : GenerationStage::Aborted);

  const auto& r = run.report;
  std::string summary = "run " + r.run_id + " ";
  if (r.cancelled) {
    summary += "cancelled";
  } else if (r.aborted) {
    summary += "aborted: " + r.abort_reason;
  } else {
    summary += "finished: " + std::to_string(r.generated.chapters) + " chapters, " +
               std::to_string(r.generated.rooms) + " rooms, " + std::to_string(r.generated.quests) +
               " quests, " + std::to_string(r.errors.size()) + " errors, " + std::to_string(r.warnings.size()) +
               " warnings, " + std::to_string(r.total_tokens) + " tokens";
  }
  if (success) {
    status(summary);
  } else {
    log::error(summary);
    bus_.emit(StatusEvent{summary});
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_report_ = run.report;
  }
  GenerationCompleteEvent done;
  done.success = success;
  done.persisted = run.report.persisted;
  done.run_id = run.report.run_id;
  done.world_dir = run.world_dir;
  bus_.emit(done);
  return run.report;
}

WorldGenerator::ChapterOutcome WorldGenerator::generate_chapter(RunState& run, int chapter_number) {
  const GenerationContext& ctx = run.ctx;
  const std::string chapter_id = prompts::chapter_id_for(chapter_number);
  const ChapterArtifact* previous = run.work.chapters.empty() ? nullptr : &run.work.chapters.back();
  const DifficultyBand band = difficulty_for_chapter(chapter_number);

  // Outline
  set_stage(GenerationStage::Outline);
  status("chapter " + std::to_string(chapter_number) + ": generating outline");
  auto response = request(run, "outline", chapter_id,
                          prompts::outline_prompt(ctx.brief, ctx.settings, chapter_number, previous));
  if (!response.ok) {
    record_issue(run, IssueKind::Transport, chapter_id, "outline request failed: " + response.error, true);
    return ChapterOutcome::Aborted;
  }
  ValidateOptions outline_options;
  outline_options.expected_id = chapter_id;
  const ValidationResult outline_result = validate(ArtifactKind::Outline, response.content, outline_options);
  if (outline_result.parse_failed) {
    record_issue(run, IssueKind::Parse, chapter_id,
                 "outline is not valid JSON: " + fields::join(outline_result.errors, "; "), true);
    return ChapterOutcome::Aborted;
  }
  for (const auto& err : outline_result.errors) {
    record_issue(run, IssueKind::Schema, chapter_id, "outline: " + err);
  }
  for (const auto& warning : outline_result.warnings) {
    run.report.add_warning(chapter_id + " outline: " + warning);
  }
  ChapterOutline outline;
  std::vector<std::string> read_errors;
  read_outline(outline_result.parsed, outline, read_errors);
  outline.chapter_id = chapter_id;

  OutlineGeneratedEvent outline_event;
  outline_event.chapter_number = chapter_number;
  outline_event.chapter_id = chapter_id;
  outline_event.chapter_name = outline.chapter_name;
  outline_event.locations = outline.locations.size();
  outline_event.main_quests = outline.main_quests.size();
  outline_event.side_quests = outline.side_quests.size();
  bus_.emit(outline_event);
  if (ctx.cancelled()) {
    return ChapterOutcome::Cancelled;
  }

  // Graph
  set_stage(GenerationStage::Graph);
  status("chapter " + std::to_string(chapter_number) + ": generating room graph");
  response = request(run, "graph", chapter_id, prompts::room_graph_prompt(ctx.brief, ctx.settings, outline));
  if (!response.ok) {
    record_issue(run, IssueKind::Transport, chapter_id, "room graph request failed: " + response.error, true);
    return ChapterOutcome::Aborted;
  }
  ValidateOptions graph_options;
  graph_options.expected_id = chapter_id;
  const ValidationResult graph_result = validate(ArtifactKind::Graph, response.content, graph_options);
  if (graph_result.parse_failed) {
    record_issue(run, IssueKind::Parse, chapter_id,
                 "room graph is not valid JSON: " + fields::join(graph_result.errors, "; "), true);
    return ChapterOutcome::Aborted;
  }
  for (const auto& err : graph_result.errors) {
    record_issue(run, IssueKind::Schema, chapter_id, "room graph: " + err);
  }
  for (const auto& warning : graph_result.warnings) {
    run.report.add_warning(chapter_id + " room graph: " + warning);
  }
  RoomGraph graph;
  std::vector<std::string> graph_warnings;
  read_graph(graph_result.parsed, graph, read_errors, graph_warnings);
  graph.chapter_id = chapter_id;

  std::set<std::string> seen_rooms;
  auto unusable = [&](const RoomNode& room) {
    if (is_safe_artifact_id(room.id) && seen_rooms.insert(room.id).second) {
      return false;
    }
    record_issue(run, IssueKind::Schema, chapter_id, "room graph: dropped unusable room id '" + room.id + "'");
    return true;
  };
  graph.rooms.erase(std::remove_if(graph.rooms.begin(), graph.rooms.end(), unusable), graph.rooms.end());
  if (graph.rooms.empty()) {
    record_issue(run, IssueKind::Schema, chapter_id, "room graph has no usable rooms", true);
    return ChapterOutcome::Aborted;
  }

  for (const auto& message : drop_dangling_edges(graph)) {
    run.report.add_warning(chapter_id + ": " + message);
  }
  const int added = ensure_bidirectional(graph);
  if (added > 0) {
    log::info(chapter_id + ": added " + std::to_string(added) + " reverse edges");
  }
  for (const auto& warning : exit_budget_warnings(graph)) {
    run.report.add_warning(chapter_id + ": " + warning);
  }
  fix_anchor(graph.hub_id, graph, outline.hub_location_id, graph.rooms.front().id);
  fix_anchor(graph.entry_id, graph, outline.entry_location_id, graph.hub_id);
  fix_anchor(graph.exit_id, graph, outline.exit_location_id, graph.rooms.back().id);
  if (ctx.cancelled()) {
    return ChapterOutcome::Cancelled;
  }

  // Planned content, bounded by the settings.
  std::vector<std::string> rejected;
  const auto main_quests = take_usable(outline.main_quests, ctx.settings.main_quests_per_chapter, rejected);
  const auto side_quests = take_usable(outline.side_quests, ctx.settings.side_quests_per_chapter(), rejected);
  const auto enemies = take_usable(outline.enemies, ctx.settings.enemy_types_per_chapter, rejected);
  const auto items = take_usable(outline.items, ctx.settings.items_per_chapter, rejected);
  for (const auto& id : rejected) {
    record_issue(run, IssueKind::Schema, chapter_id, "outline: skipped unusable or repeated id '" + id + "'");
  }

  ChapterArtifact chapter;
  chapter.id = chapter_id;
  chapter.name = outline.chapter_name;
  chapter.number = chapter_number;
  chapter.description = outline.description;
  chapter.intro = outline.intro;
  chapter.difficulty = band;
  for (const auto& room : graph.rooms) {
    chapter.location_ids.push_back(room.id);
  }
  chapter.main_quest_ids = ids_of(main_quests);
  chapter.quest_ids = chapter.main_quest_ids;
  for (const auto& id : ids_of(side_quests)) {
    chapter.quest_ids.push_back(id);
  }
  chapter.enemy_ids = ids_of(enemies);
  chapter.item_ids = ids_of(items);
  for (const auto& npc : outline.key_npcs) {
    if (!npc.id.empty()) {
      chapter.npc_ids.push_back(npc.id);
    }
  }
  chapter.hub_location_id = graph.hub_id;
  chapter.entry_location_id = graph.entry_id;
  chapter.exit_location_id = graph.exit_id;
  if (previous && !previous->main_quest_ids.empty()) {
    chapter.unlock_quest_id = previous->main_quest_ids.back();
  }
  if (!chapter.main_quest_ids.empty()) {
    chapter.exit_quest_id = chapter.main_quest_ids.back();
  }

  const int steps = 2 + static_cast<int>(graph.rooms.size() + main_quests.size() + side_quests.size() +
                                         enemies.size() + items.size());
  int step = 2;
  progress(run, chapter_number, step, steps);

  // Locations
  set_stage(GenerationStage::Locations);
  status("chapter " + std::to_string(chapter_number) + ": generating " + std::to_string(graph.rooms.size()) +
         " rooms");
  const std::set<std::string> graph_ids = room_ids(graph);
  for (const auto& room : graph.rooms) {
    ValidateOptions options;
    options.expected_id = room.id;
    options.expected_room_kind = room.kind;
    options.known_ids = graph_ids;
    options.allowed_exits = room.neighbors;
    json doc = generate_artifact(run, ArtifactKind::Room, room.id,
                                 prompts::room_prompt(room, graph, outline, chapter_number), options);
    if (!doc.is_null()) {
      store_artifact(run, run.work.rooms, ArtifactKind::Room, room.id, std::move(doc));
    }
    run.plans[room.id] = RoomPlan{chapter_id, room.kind, room.neighbors};
    progress(run, chapter_number, ++step, steps);
    if (ctx.cancelled()) {
      return ChapterOutcome::Cancelled;
    }
  }

  // Quests: main first so side quests may depend on them.
  set_stage(GenerationStage::Quests);
  status("chapter " + std::to_string(chapter_number) + ": generating " +
         std::to_string(main_quests.size() + side_quests.size()) + " quests");
  std::vector<std::string> earlier_main;
  for (const auto& done : run.work.chapters) {
    earlier_main.insert(earlier_main.end(), done.main_quest_ids.begin(), done.main_quest_ids.end());
  }
  std::vector<const QuestSummary*> quest_order;
  for (const auto& quest : main_quests) {
    quest_order.push_back(&quest);
  }
  for (const auto& quest : side_quests) {
    quest_order.push_back(&quest);
  }
  std::vector<std::string> prerequisites = earlier_main;
  for (size_t i = 0; i < quest_order.size(); ++i) {
    const QuestSummary& quest = *quest_order[i];
    if (i == main_quests.size()) {
      prerequisites = earlier_main;
      prerequisites.insert(prerequisites.end(), chapter.main_quest_ids.begin(), chapter.main_quest_ids.end());
    }
    ValidateOptions options;
    options.expected_id = quest.id;
    json doc = generate_artifact(run, ArtifactKind::Quest, quest.id,
                                 prompts::quest_prompt(quest, outline, graph, chapter_number, prerequisites),
                                 options);
    if (!doc.is_null()) {
      store_artifact(run, run.work.quests, ArtifactKind::Quest, quest.id, std::move(doc));
    }
    if (quest.is_main) {
      prerequisites.push_back(quest.id);
    }
    progress(run, chapter_number, ++step, steps);
    if (ctx.cancelled()) {
      return ChapterOutcome::Cancelled;
    }
  }

  // Enemies
  set_stage(GenerationStage::Enemies);
  for (const auto& enemy : enemies) {
    ValidateOptions options;
    options.expected_id = enemy.id;
    json doc = generate_artifact(run, ArtifactKind::Enemy, enemy.id,
                                 prompts::enemy_prompt(enemy, band, chapter_number), options);
    if (!doc.is_null()) {
      store_artifact(run, run.work.enemies, ArtifactKind::Enemy, enemy.id, std::move(doc));
    }
    progress(run, chapter_number, ++step, steps);
    if (ctx.cancelled()) {
      return ChapterOutcome::Cancelled;
    }
  }

  // Items
  set_stage(GenerationStage::Items);
  for (const auto& item : items) {
    ValidateOptions options;
    options.expected_id = item.id;
    json doc = generate_artifact(run, ArtifactKind::Item, item.id, prompts::item_prompt(item, chapter_number),
                                 options);
    if (!doc.is_null()) {
      store_artifact(run, run.work.items, ArtifactKind::Item, item.id, std::move(doc));
    }
    progress(run, chapter_number, ++step, steps);
    if (ctx.cancelled()) {
      return ChapterOutcome::Cancelled;
    }
  }

  chapter.generated_at = now_iso();
  chapter.is_generated = true;

  ChapterCompletedEvent completed;
  completed.chapter_number = chapter_number;
  completed.chapter_id = chapter_id;
  completed.rooms = chapter.location_ids.size();
  completed.quests = chapter.quest_ids.size();
  completed.enemies = chapter.enemy_ids.size();
  completed.items = chapter.item_ids.size();

  run.work.chapters.push_back(std::move(chapter));
  ++run.report.generated.chapters;
  status("chapter " + std::to_string(chapter_number) + " complete");
  bus_.emit(completed);
  return ChapterOutcome::Completed;
}

void WorldGenerator::validate_all(RunState& run) {
  set_stage(GenerationStage::Validate);
  status("validating " + std::to_string(run.work.chapters.size()) + " chapters");

  const size_t first_new = run.report.errors.size();
  const ValidationSummary summary = validate_content(run.work, run.plans, run.report);
  for (size_t i = first_new; i < run.report.errors.size(); ++i) {
    const auto& issue = run.report.errors[i];
    log::warn(std::string(to_string(issue.kind)) + ": " + issue.message);
    bus_.emit(RunErrorEvent{issue.kind, issue.artifact_id, issue.message, false});
  }

  ValidationReportEvent event;
  event.schema_errors = summary.schema_errors;
  event.integrity_errors = summary.integrity_errors;
  event.warnings = summary.warnings;
  bus_.emit(event);
  status("validation: " + std::to_string(summary.schema_errors) + " schema errors, " +
         std::to_string(summary.integrity_errors.size()) + " integrity errors, " +
         std::to_string(summary.warnings.size()) + " warnings");
}

bool WorldGenerator::persist(RunState& run) {
  set_stage(GenerationStage::Persist);
  run.manifest.chapter_ids.clear();
  for (const auto& chapter : run.work.chapters) {
    run.manifest.chapter_ids.push_back(chapter.id);
  }
  run.manifest.starting_room = starting_room(run.work);

  ContentStore store(run.world_dir);
  status("writing content store: " + run.world_dir.string());
  std::string error;
  if (run.report.mode == "generate" && store.exists() && !store.clear_artifacts(error)) {
    record_issue(run, IssueKind::Persist, "", error);
    return false;
  }
  run.report.persisted = true;
  run.report.finished_at = now_iso();
  if (!store.save(run.manifest, run.work, run.report, error)) {
    run.report.persisted = false;
    record_issue(run, IssueKind::Persist, "", "content store write failed: " + error);
    return false;
  }

  data::RunJournal journal;
  std::string journal_error;
  if (!journal.open(store.journal_path(), journal_error) ||
      !journal.record_run(run.report, static_cast<int>(run.work.chapters.size()), journal_error)) {
    run.report.add_warning("run journal not updated: " + journal_error);
  }
  return true;
}

llm::ModelResponse WorldGenerator::request(RunState& run, const char* kind, const std::string& id,
                                           const std::string& prompt) {
  if (log::verbose()) {
    log::debug(std::string("request ") + kind + " " + id + " (" + std::to_string(prompt.size()) + " chars)");
  }
  llm::ModelResponse response = client_.send(prompt, run.system_prompt);

  RequestRecord record;
  record.artifact_kind = kind;
  record.artifact_id = id;
  record.ok = response.ok;
  record.tokens_used = response.tokens_used;
  record.attempts = response.attempts;
  record.error = response.error;
  run.report.requests.push_back(std::move(record));
  run.report.total_tokens += response.tokens_used;
  return response;
}

json WorldGenerator::generate_artifact(RunState& run, ArtifactKind kind, const std::string& id,
                                       const std::string& prompt, const ValidateOptions& options) {
  const std::string label = std::string(to_string(kind)) + " '" + id + "'";
  const llm::ModelResponse response = request(run, to_string(kind), id, prompt);
  if (!response.ok) {
    record_issue(run, IssueKind::Transport, id, label + " request failed: " + response.error);
    return json();
  }
  ValidationResult result = validate(kind, response.content, options);
  if (result.parse_failed) {
    record_issue(run, IssueKind::Parse, id, label + " skipped: " + fields::join(result.errors, "; "));
    return json();
  }
  // Schema problems are reported once, by the Validate stage.
  for (const auto& err : result.errors) {
    log::warn(label + ": " + err);
  }
  return std::move(result.parsed);
}

void WorldGenerator::store_artifact(RunState& run, ArtifactMap& target, ArtifactKind kind, const std::string& id,
                                    json doc) {
  if (target.count(id) != 0) {
    run.report.add_warning(std::string(to_string(kind)) + " id '" + id +
                           "' was generated before; the newer document replaces it");
  }
  target[id] = std::move(doc);
  switch (kind) {
    case ArtifactKind::Room:
      ++run.report.generated.rooms;
      break;
    case ArtifactKind::Quest:
      ++run.report.generated.quests;
      break;
    case ArtifactKind::Enemy:
      ++run.report.generated.enemies;
      break;
    case ArtifactKind::Item:
      ++run.report.generated.items;
      break;
    case ArtifactKind::Outline:
    case ArtifactKind::Graph:
      break;
  }
}

void WorldGenerator::record_issue(RunState& run, IssueKind kind, const std::string& artifact_id,
                                  const std::string& message, bool fatal) {
  run.report.add_error(kind, artifact_id, message);
  if (fatal) {
    run.report.aborted = true;
    if (run.report.abort_reason.empty()) {
      run.report.abort_reason = message;
    }
    log::error(message);
  } else {
    log::warn(message);
  }
  bus_.emit(RunErrorEvent{kind, artifact_id, message, fatal});
}

void WorldGenerator::status(const std::string& message) {
  log::info(message);
  bus_.emit(StatusEvent{message});
}

void WorldGenerator::progress(RunState& run, int chapter_number, int step, int steps) {
  const int chapters = std::max(1, run.last_chapter - run.first_chapter + 1);
  const float within = steps > 0 ? static_cast<float>(step) / static_cast<float>(steps) : 1.0f;
  ProgressEvent event;
  event.fraction = (static_cast<float>(chapter_number - run.first_chapter) + within) / static_cast<float>(chapters);
  event.stage = to_string(stage_.load());
  bus_.emit(event);
}

void WorldGenerator::set_stage(GenerationStage stage) {
  stage_.store(stage);
}

} // namespace wgen::runtime
