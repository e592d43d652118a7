#include "wgen/config.h"
#include "wgen/event_bus.h"
#include "wgen/integrity.h"
#include "wgen/json_fields.h"
#include "wgen/log.h"
#include "wgen/prompt_builder.h"
#include "wgen/room_graph.h"
#include "wgen/run_report.h"
#include "wgen/schema_validator.h"
#include "wgen/world_types.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace wgen;

namespace {

bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return true;
}

bool mentions(const std::vector<std::string>& messages, const std::string& needle) {
  return std::any_of(messages.begin(), messages.end(),
                     [&](const std::string& m) { return m.find(needle) != std::string::npos; });
}

void dump(const char* what, const std::vector<std::string>& messages) {
  for (const auto& m : messages) {
    std::cerr << "  " << what << ": " << m << "\n";
  }
}

json dialogue_room() {
  return json{
      {"room_id", "elder_hut"},
      {"room_type", "interaction"},
      {"description", "Smoke curls from a low hearth."},
      {"npcs", {"elder_maren"}},
      {"items", json::array()},
      {"actions", {{{"action_id", "elder_maren"}, {"action_description", "Speak with the elder"}}}},
      {"dialogues",
       {{{"npc_name", "elder_maren"},
         {"dialogue_image", ""},
         {"dialogues",
          {{{"message", "You came back."},
            {"responses", {{{"text", "Farewell"}, {"next_step", -1}}}}}}}}}},
      {"exits", {{{"exit_name", "Back to the square"}, {"leads_to", "vale_square"},
                  {"conditions", json::array()}, {"conditions_not", json::array()}}}},
      {"combat", nullptr}};
}

RoomNode node(const std::string& id, RoomKind kind, std::vector<std::string> neighbors) {
  RoomNode n;
  n.id = id;
  n.name = id;
  n.kind = kind;
  n.neighbors = std::move(neighbors);
  return n;
}

json quest_doc(const std::string& id, std::vector<std::string> prerequisites,
               const std::string& objective_type = "GoToRoom", const std::string& target = "vale_square") {
  return json{{"questId", id},
              {"questName", id},
              {"questType", "Main"},
              {"difficulty", 2},
              {"prerequisiteQuests", prerequisites},
              {"objectives", {{{"objectiveId", id + "_o1"}, {"description", "go"}, {"type", objective_type},
                               {"targetId", target}, {"targetCount", 1}}}},
              {"rewards", {{"experiencePoints", 10}, {"gold", 5}}}};
}

json simple_room(const std::string& id, const std::vector<std::string>& exits) {
  json j{{"room_id", id}, {"room_type", "crossroad"}, {"description", "A quiet place."},
         {"npcs", json::array()}, {"actions", json::array()}, {"dialogues", json::array()},
         {"exits", json::array()}};
  for (const auto& e : exits) {
    j["exits"].push_back({{"exit_name", "to " + e}, {"leads_to", e}});
  }
  return j;
}

// One consistent chapter: two rooms, two main quests (q2 after q1).
WorldContent small_world() {
  WorldContent world;
  world.rooms["vale_square"] = simple_room("vale_square", {"old_mill"});
  world.rooms["old_mill"] = simple_room("old_mill", {"vale_square"});
  world.quests["q1"] = quest_doc("q1", {});
  world.quests["q2"] = quest_doc("q2", {"q1"}, "GoToRoom", "old_mill");

  ChapterArtifact chapter;
  chapter.id = "chapter_1";
  chapter.number = 1;
  chapter.difficulty = difficulty_for_chapter(1);
  chapter.location_ids = {"vale_square", "old_mill"};
  chapter.quest_ids = {"q1", "q2"};
  chapter.main_quest_ids = {"q1", "q2"};
  chapter.hub_location_id = "vale_square";
  chapter.exit_quest_id = "q2";
  world.chapters.push_back(chapter);
  return world;
}

} // namespace

int main() {
  log::set_console(false);

  int failures = 0;
  const fs::path temp_root =
      fs::temp_directory_path() /
      ("wgen_smoke_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

  // Test: fence stripping.
  {
    if (clean_json("```json\n{\"a\": 1}\n```") != "{\"a\": 1}") {
      std::cerr << "clean_json did not strip a json fence\n";
      ++failures;
    }
    if (clean_json("  {\"a\": 1}  ") != "{\"a\": 1}") {
      std::cerr << "clean_json did not trim whitespace\n";
      ++failures;
    }
    if (clean_json("```{\"a\": 1}```") != "{\"a\": 1}") {
      std::cerr << "clean_json did not strip a single-line fence\n";
      ++failures;
    }
  }

  // Test: parse failures are fatal and diagnose leftover fencing.
  {
    const auto empty = validate(ArtifactKind::Room, "   ");
    if (!empty.parse_failed || empty.errors.empty() || empty.errors.front() != "JSON is empty") {
      std::cerr << "empty input not reported as 'JSON is empty'\n";
      ++failures;
    }
    const auto fenced = validate(ArtifactKind::Room, "Here you go:\n```json\n{\"room_id\": \"a\"}\n```");
    if (!fenced.parse_failed || !mentions(fenced.errors, "fencing")) {
      std::cerr << "leftover fencing not diagnosed\n";
      dump("error", fenced.errors);
      ++failures;
    }
    const auto array_root = validate(ArtifactKind::Quest, "[1, 2]");
    if (!array_root.parse_failed) {
      std::cerr << "non-object root accepted\n";
      ++failures;
    }
  }

  // Test: dialogue rooms need action ids and speakers to match exactly.
  {
    ValidateOptions options;
    options.expected_id = "elder_hut";
    options.expected_room_kind = RoomKind::Dialogue;
    options.known_ids = std::set<std::string>{"elder_hut", "vale_square"};

    const auto ok = validate(ArtifactKind::Room, dialogue_room().dump(), options);
    if (!ok.ok()) {
      std::cerr << "valid dialogue room rejected\n";
      dump("error", ok.errors);
      ++failures;
    }

    json extra_action = dialogue_room();
    extra_action["actions"].push_back({{"action_id", "merchant"}, {"action_description", "Trade"}});
    const auto missing_speaker = validate_document(ArtifactKind::Room, extra_action, options);
    if (missing_speaker.ok() || !mentions(missing_speaker.errors, "merchant")) {
      std::cerr << "action without matching dialogue not rejected\n";
      ++failures;
    }

    json extra_speaker = dialogue_room();
    extra_speaker["dialogues"].push_back(
        {{"npc_name", "guard"},
         {"dialogues", {{{"message", "Halt."}, {"responses", {{{"text", "Ok"}, {"next_step", -1}}}}}}}});
    const auto missing_action = validate_document(ArtifactKind::Room, extra_speaker, options);
    if (missing_action.ok() || !mentions(missing_action.errors, "guard")) {
      std::cerr << "dialogue without matching action not rejected\n";
      ++failures;
    }

    json bad_step = dialogue_room();
    bad_step["dialogues"][0]["dialogues"][0]["responses"][0]["next_step"] = 4;
    if (validate_document(ArtifactKind::Room, bad_step, options).ok()) {
      std::cerr << "dangling next_step accepted\n";
      ++failures;
    }

    json wrong_id = dialogue_room();
    wrong_id["room_id"] = "other_room";
    if (validate_document(ArtifactKind::Room, wrong_id, options).ok()) {
      std::cerr << "room id mismatch accepted\n";
      ++failures;
    }
  }

  // Test: navigation, combat and exit rules.
  {
    ValidateOptions nav;
    nav.expected_room_kind = RoomKind::Navigation;
    json crowded = simple_room("vale_square", {"old_mill"});
    crowded["npcs"] = {"elder_maren"};
    const auto crowded_result = validate_document(ArtifactKind::Room, crowded, nav);
    if (crowded_result.ok() || !mentions(crowded_result.errors, "empty npcs")) {
      std::cerr << "crossroad room with npcs accepted\n";
      ++failures;
    }

    ValidateOptions combat;
    combat.expected_room_kind = RoomKind::Combat;
    json arena = simple_room("old_mine", {"vale_square"});
    arena["room_type"] = "combat";
    const auto no_enemy = validate_document(ArtifactKind::Room, arena, combat);
    if (no_enemy.ok() || !mentions(no_enemy.errors, "combat.enemyId")) {
      std::cerr << "combat room without enemy accepted\n";
      ++failures;
    }
    arena["combat"] = {{"enemyId", "mine_rat"}, {"isBoss", false}};
    if (!validate_document(ArtifactKind::Room, arena, combat).ok()) {
      std::cerr << "combat room with enemy rejected\n";
      ++failures;
    }

    ValidateOptions resolved;
    resolved.known_ids = std::set<std::string>{"vale_square"};
    const auto unknown_exit = validate_document(ArtifactKind::Room, simple_room("vale_square", {"nowhere"}), resolved);
    if (unknown_exit.ok() || !mentions(unknown_exit.errors, "nowhere")) {
      std::cerr << "exit to unknown room accepted with known ids\n";
      ++failures;
    }
    if (!validate_document(ArtifactKind::Room, simple_room("vale_square", {"nowhere"})).ok()) {
      std::cerr << "exit check ran without known ids\n";
      ++failures;
    }

    ValidateOptions scoped;
    scoped.allowed_exits = {"old_mill"};
    const auto off_graph = validate_document(ArtifactKind::Room, simple_room("vale_square", {"far_tower"}), scoped);
    if (!off_graph.ok() || !mentions(off_graph.warnings, "not a graph neighbor")) {
      std::cerr << "exit outside graph neighbors not warned\n";
      ++failures;
    }
  }

  // Test: quest, enemy and item ranges.
  {
    json quest = quest_doc("q_rescue", {});
    quest["objectives"][0]["type"] = "Teleport";
    quest.erase("rewards");
    const auto q = validate_document(ArtifactKind::Quest, quest);
    if (q.ok() || !mentions(q.errors, "Teleport") || !mentions(q.warnings, "no rewards")) {
      std::cerr << "quest objective type / rewards rules not applied\n";
      ++failures;
    }

    json enemy{{"enemyId", "mine_rat"}, {"enemyName", "Mine Rat"}, {"maxHitPoints", 10},
               {"attacks", {{{"attackName", "Bite"}, {"damageMin", 6}, {"damageMax", 2}}}},
               {"lootTable", {{{"itemId", "lantern"}, {"dropChance", 1.5}}}}};
    const auto e = validate_document(ArtifactKind::Enemy, enemy);
    if (!mentions(e.errors, "damageMax") || !mentions(e.errors, "dropChance")) {
      std::cerr << "enemy damage/loot ranges not checked\n";
      dump("error", e.errors);
      ++failures;
    }

    json item{{"itemId", "lantern"}, {"shortDescription", "A lantern"}, {"effectType", 7}, {"target", 1},
              {"stacking", true}, {"maxStack", 0}};
    const auto i = validate_document(ArtifactKind::Item, item);
    if (!mentions(i.errors, "effectType") || !mentions(i.errors, "maxStack")) {
      std::cerr << "item effect/stack rules not checked\n";
      ++failures;
    }
  }

  // Test: integers outside 32-bit range are type errors, not wrapped values.
  {
    json enemy{{"enemyId", "mine_rat"}, {"enemyName", "Mine Rat"}, {"maxHitPoints", 10},
               {"attacks", {{{"attackName", "Bite"}, {"damageMin", 1}, {"damageMax", 4294967297ULL}}}}};
    const auto e = validate_document(ArtifactKind::Enemy, enemy);
    if (e.ok() || !mentions(e.errors, "damageMax") || !mentions(e.errors, "32-bit")) {
      std::cerr << "oversized damageMax accepted\n";
      dump("error", e.errors);
      ++failures;
    }

    int value = 7;
    std::vector<std::string> errors;
    const json doc{{"low", -10000000000LL}, {"fine", -12}};
    if (fields::read(doc, "low", value, &errors) || value != 7 || errors.size() != 1) {
      std::cerr << "negative overflow not reported (value " << value << ")\n";
      ++failures;
    }
    if (!fields::read(doc, "fine", value, &errors) || value != -12) {
      std::cerr << "in-range negative integer rejected\n";
      ++failures;
    }
  }

  // Test: parse diagnostics for curly-quoted replies stay valid UTF-8.
  {
    const auto result = validate(ArtifactKind::Room, "{\"room_id\": \xE2\x80\x9Chut\xE2\x80\x9D}");
    if (!result.parse_failed || !mentions(result.errors, "JSON parse error")) {
      std::cerr << "curly-quoted reply not reported as a parse failure\n";
      ++failures;
    }
    RunReport report;
    report.add_error(IssueKind::Parse, "hut", fields::join(result.errors, "; "));
    try {
      const std::string text = to_json(report).dump(2);
      if (text.find("hut") == std::string::npos) {
        std::cerr << "parse issue missing from report json\n";
        ++failures;
      }
    } catch (const json::type_error& e) {
      std::cerr << "parse diagnostic is not valid UTF-8: " << e.what() << "\n";
      ++failures;
    }
  }

  // Test: bidirectional repair is idempotent.
  {
    RoomGraph graph;
    graph.rooms = {node("a", RoomKind::Navigation, {"b", "c"}), node("b", RoomKind::Dialogue, {"c"}),
                   node("c", RoomKind::Combat, {})};
    const int added = ensure_bidirectional(graph);
    const auto once = edge_set(graph);
    const int again = ensure_bidirectional(graph);
    if (added != 3 || again != 0 || edge_set(graph) != once) {
      std::cerr << "ensure_bidirectional not idempotent (added " << added << ", then " << again << ")\n";
      ++failures;
    }
    for (const auto& edge : once) {
      if (once.count({edge.second, edge.first}) == 0) {
        std::cerr << "edge " << edge.first << "->" << edge.second << " has no reverse\n";
        ++failures;
      }
    }
  }

  // Test: dangling edges are dropped before repair.
  {
    RoomGraph graph;
    graph.rooms = {node("a", RoomKind::Navigation, {"a", "b", "b", "ghost"}), node("b", RoomKind::Navigation, {"a"})};
    const auto dropped = drop_dangling_edges(graph);
    const auto* a = graph.find("a");
    if (dropped.size() != 3 || !a || a->neighbors != std::vector<std::string>{"b"}) {
      std::cerr << "drop_dangling_edges removed " << dropped.size() << " edges\n";
      ++failures;
    }
  }

  // Test: exit budget warnings after repair.
  {
    RoomGraph graph;
    graph.rooms = {node("hub", RoomKind::Navigation, {"r1", "r2", "r3", "r4", "r5"}),
                   node("r1", RoomKind::Dialogue, {}), node("r2", RoomKind::Navigation, {}),
                   node("r3", RoomKind::Navigation, {}), node("r4", RoomKind::Navigation, {}),
                   node("r5", RoomKind::Navigation, {})};
    ensure_bidirectional(graph);
    const auto warnings = exit_budget_warnings(graph);
    if (warnings.size() != 1 || warnings.front().find("hub") == std::string::npos) {
      std::cerr << "exit budget warning missing for oversized hub\n";
      dump("warning", warnings);
      ++failures;
    }
  }

  // Test: cycle detection tracks the active path.
  {
    const auto cycles = find_prerequisite_cycles({{"q1", {"q2"}}, {"q2", {"q1"}}});
    if (cycles.size() != 1 || cycles.front().size() != 3 || cycles.front().front() != cycles.front().back()) {
      std::cerr << "Q1 <-> Q2 cycle not detected\n";
      ++failures;
    }
    // Diamond: q4 is reached twice through unrelated branches.
    const auto diamond = find_prerequisite_cycles(
        {{"q1", {"q2", "q3"}}, {"q2", {"q4"}}, {"q3", {"q4"}}, {"q4", {}}});
    if (!diamond.empty()) {
      std::cerr << "diamond prerequisites reported as a cycle\n";
      ++failures;
    }
    WorldContent world = small_world();
    world.quests["q1"]["prerequisiteQuests"] = {"q2"};
    const auto errors = check_prerequisite_cycles(world);
    if (errors.size() != 1 || errors.front().find("q1 -> q2 -> q1") == std::string::npos) {
      std::cerr << "cycle message not reported\n";
      dump("error", errors);
      ++failures;
    }
    if (check_reachability(world).empty()) {
      std::cerr << "chapter with no accessible main quest passed reachability\n";
      ++failures;
    }
  }

  // Test: integrity of a consistent world.
  {
    const auto report = check_integrity(small_world());
    if (!report.ok()) {
      std::cerr << "consistent world failed integrity\n";
      dump("error", report.errors);
      ++failures;
    }
  }

  // Test: sequencing, unlock chain and references.
  {
    WorldContent world = small_world();
    ChapterArtifact second = world.chapters.front();
    second.id = "chapter_2";
    second.number = 3;
    second.unlock_quest_id = "q_missing";
    world.chapters.push_back(second);
    if (check_sequencing(world).size() != 1) {
      std::cerr << "chapter numbering gap not reported\n";
      ++failures;
    }
    const auto chain = check_unlock_chain(world);
    if (chain.size() != 2) {
      std::cerr << "unlock quest outside previous chapter not reported twice\n";
      dump("error", chain);
      ++failures;
    }
    world.chapters[1].unlock_quest_id = "q2";
    if (!check_unlock_chain(world).empty()) {
      std::cerr << "valid unlock edge rejected\n";
      ++failures;
    }

    world.quests["q2"]["objectives"][0]["targetId"] = "sunken_vault";
    world.chapters[0].location_ids.push_back("lost_room");
    const auto refs = check_references(world);
    if (!mentions(refs, "sunken_vault") || !mentions(refs, "lost_room")) {
      std::cerr << "unresolved references not reported\n";
      dump("error", refs);
      ++failures;
    }
  }

  // Test: chapter content rules.
  {
    WorldContent world = small_world();
    world.chapters[0].main_quest_ids.clear();
    world.chapters[0].hub_location_id = "elsewhere";
    const auto errors = check_chapter_contents(world);
    if (!mentions(errors, "no main quests") || !mentions(errors, "hub 'elsewhere'")) {
      std::cerr << "chapter content rules not applied\n";
      dump("error", errors);
      ++failures;
    }
  }

  // Test: difficulty band.
  {
    const auto one = difficulty_for_chapter(1);
    const auto three = difficulty_for_chapter(3);
    if (one.base_difficulty != 2 || one.min_enemy_cr != 1 || one.max_enemy_cr != 3 ||
        three.base_difficulty != 6 || three.min_enemy_cr != 2 || three.max_enemy_cr != 5) {
      std::cerr << "difficulty band formula changed\n";
      ++failures;
    }
  }

  // Test: prompts are deterministic and scope exits to graph neighbors.
  {
    WorldBrief brief;
    brief.world_name = "Vale";
    brief.theme = "pastoral dread";
    GenerationSettings settings;
    ChapterOutline outline;
    outline.chapter_id = "chapter_1";
    outline.chapter_name = "The Quiet Vale";

    RoomGraph graph;
    graph.chapter_id = "chapter_1";
    graph.rooms = {node("elder_hut", RoomKind::Dialogue, {"vale_square", "herb_garden"}),
                   node("vale_square", RoomKind::Navigation, {"elder_hut"}),
                   node("herb_garden", RoomKind::Navigation, {"elder_hut"}),
                   node("far_tower", RoomKind::Navigation, {})};
    const RoomNode& hut = graph.rooms.front();
    const std::string first = prompts::room_prompt(hut, graph, outline, 1);
    const std::string second = prompts::room_prompt(hut, graph, outline, 1);
    if (first != second) {
      std::cerr << "room prompt is not deterministic\n";
      ++failures;
    }
    if (first.rfind("### Request: room elder_hut\n", 0) != 0) {
      std::cerr << "room prompt missing request header\n";
      ++failures;
    }
    if (first.find("- vale_square") == std::string::npos || first.find("- herb_garden") == std::string::npos ||
        first.find("- far_tower") != std::string::npos) {
      std::cerr << "dialogue room prompt does not list exactly its neighbors\n";
      ++failures;
    }
    if (prompts::outline_prompt(brief, settings, 2, nullptr) != prompts::outline_prompt(brief, settings, 2, nullptr)) {
      std::cerr << "outline prompt is not deterministic\n";
      ++failures;
    }
    if (prompts::system_prompt(brief).find("Vale") == std::string::npos) {
      std::cerr << "system prompt missing world name\n";
      ++failures;
    }
  }

  // Test: YAML and JSON generation config.
  {
    const fs::path yaml_path = temp_root / "world.yaml";
    write_text(yaml_path,
               "generation:\n"
               "  world:\n"
               "    name: The Sunken Crown\n"
               "  brief:\n"
               "    theme: drowned kingdom\n"
               "    tone: somber\n"
               "    setting: A coastal realm swallowed by the sea.\n"
               "    key_locations: [Tidewall, Saltmarsh]\n"
               "    custom_parameters:\n"
               "      magic_level: low\n"
               "  settings:\n"
               "    total_chapters: 3\n"
               "    main_quests_per_chapter: 1\n"
               "  provider:\n"
               "    name: anthropic\n"
               "    model: claude-test\n"
               "    request_delay_ms: 250\n");
    GenerationConfig cfg;
    std::string error;
    if (!load_generation_config(yaml_path, cfg, error)) {
      std::cerr << "yaml config failed to load: " << error << "\n";
      ++failures;
    } else {
      if (cfg.world_id != "the_sunken_crown" || cfg.brief.world_name != "The Sunken Crown" ||
          cfg.brief.key_locations.size() != 2 || cfg.settings.total_chapters != 3 ||
          cfg.settings.quests_per_chapter != 7 || cfg.provider.provider != "anthropic" ||
          cfg.provider.request_delay_ms != 250 || cfg.provider.max_retries != 3) {
        std::cerr << "yaml config values not applied\n";
        ++failures;
      }
      if (cfg.brief.custom_parameters.size() != 1 || cfg.brief.custom_parameters[0].value != "low") {
        std::cerr << "custom parameters not read\n";
        ++failures;
      }
      if (!check_generation_config(cfg, error)) {
        std::cerr << "valid config rejected: " << error << "\n";
        ++failures;
      }
    }

    const fs::path json_path = temp_root / "world.json";
    write_text(json_path, R"({"world": {"id": "vale"}, "settings": {"total_chapters": 0}})");
    GenerationConfig zero;
    if (!load_generation_config(json_path, zero, error) || zero.world_id != "vale") {
      std::cerr << "json config failed to load: " << error << "\n";
      ++failures;
    } else if (check_generation_config(zero, error)) {
      std::cerr << "zero chapters accepted\n";
      ++failures;
    }

    write_text(temp_root / "bad.yaml", "generation:\n  settings:\n    total_chapters: [1, 2]\n");
    GenerationConfig bad;
    if (load_generation_config(temp_root / "bad.yaml", bad, error) || error.find("total_chapters") == std::string::npos) {
      std::cerr << "type error in config not reported\n";
      ++failures;
    }
    if (load_generation_config(temp_root / "world.toml", bad, error)) {
      std::cerr << "missing config accepted\n";
      ++failures;
    }
  }

  // Test: manifest codec keeps secrets out and reads back.
  {
    WorldManifest manifest;
    manifest.config_id = "vale";
    manifest.chapter_ids = {"chapter_1"};
    manifest.provider.model = "gpt-test";
    manifest.starting_room = "vale_square";
    const json j = to_json(manifest);
    if (j.dump().find("apiKey") != std::string::npos || j["chapterIds"].size() != 1) {
      std::cerr << "manifest json malformed\n";
      ++failures;
    }
    WorldManifest back;
    std::string error;
    if (!manifest_from_json(j, back, error) || back.provider.model != "gpt-test" ||
        back.starting_room != "vale_square") {
      std::cerr << "manifest round trip failed: " << error << "\n";
      ++failures;
    }
    ChapterArtifact chapter;
    if (chapter_from_json(json::object(), chapter, error)) {
      std::cerr << "chapter without chapterId accepted\n";
      ++failures;
    }
  }

  // Test: event bus delivery.
  {
    struct Ping {
      int value = 0;
    };
    EventBus bus;
    int total = 0;
    bus.subscribe<Ping>([&](const Ping& p) { total += p.value; });
    bus.subscribe<Ping>([&](const Ping& p) { total += p.value * 10; });
    bus.emit(Ping{2});
    bus.emit(std::string("ignored"));
    if (total != 22 || bus.subscriber_count<Ping>() != 2) {
      std::cerr << "event bus delivered " << total << "\n";
      ++failures;
    }
  }

  // Test: run report bookkeeping.
  {
    RunReport report;
    report.run_id = make_run_id();
    report.add_error(IssueKind::Parse, "elder_hut", "bad json");
    report.add_error(IssueKind::Schema, "q1", "missing objective");
    report.add_warning("room has no exits defined");
    if (report.run_id.find(':') != std::string::npos || report.count(IssueKind::Parse) != 1 ||
        report.issues(IssueKind::Schema).front().artifact_id != "q1") {
      std::cerr << "run report bookkeeping wrong\n";
      ++failures;
    }
    const std::string text = format_content_report(small_world(), &report);
    if (text.find("[parse] elder_hut") == std::string::npos || text.find("Chapter 1") == std::string::npos) {
      std::cerr << "content report missing sections\n";
      ++failures;
    }
    if (to_json(report)["errors"].size() != 2) {
      std::cerr << "report json missing errors\n";
      ++failures;
    }
  }

  // Test: log ring buffer.
  {
    log::info("ring check");
    const auto lines = log::recent(1);
    if (lines.size() != 1 || lines.front().find("ring check") == std::string::npos) {
      std::cerr << "log ring buffer missing latest line\n";
      ++failures;
    }
  }

  std::error_code ec;
  fs::remove_all(temp_root, ec);

  if (failures == 0) {
    std::cout << "wgen_tests: all passed\n";
  }
  return failures == 0 ? 0 : 1;
}
