#include "wgen/config.h"
#include "wgen/content_store.h"
#include "wgen/event_bus.h"
#include "wgen/generation_events.h"
#include "wgen/log.h"
#include "wgen/world_generator.h"
#include "wgen_data/journal.h"
#include "wgen_data/serialization.h"
#include "wgen_llm/model_client.h"
#include "wgen_llm/providers.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace wgen;

namespace {

using Clock = std::chrono::steady_clock;

// Replays queued HTTP responses and records when each call started.
class ScriptedTransport final : public llm::IHttpTransport {
 public:
  explicit ScriptedTransport(int sleep_ms = 0) : sleep_ms_(sleep_ms) {}

  void push(llm::HttpResponse response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push_back(std::move(response));
  }

  llm::HttpResponse post(const llm::HttpRequest& request) override {
    const int now_in_flight = ++in_flight_;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      starts_.push_back(Clock::now());
      requests_.push_back(request);
      max_in_flight_ = std::max(max_in_flight_, now_in_flight);
    }
    if (sleep_ms_ > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms_));
    }
    llm::HttpResponse response;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (responses_.empty()) {
        response.status = 500;
        response.body = "{}";
      } else {
        response = responses_.front();
        if (responses_.size() > 1) {
          responses_.pop_front();
        }
      }
    }
    --in_flight_;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ends_.push_back(Clock::now());
    }
    return response;
  }

  size_t calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return starts_.size();
  }

  long long gap_ms(size_t i) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(starts_[i] - starts_[i - 1]).count();
  }

  // From the return of call i-1 to the start of call i.
  long long idle_ms(size_t i) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(starts_[i] - ends_[i - 1]).count();
  }

  int max_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_in_flight_;
  }

 private:
  int sleep_ms_ = 0;
  mutable std::mutex mutex_;
  std::deque<llm::HttpResponse> responses_;
  std::vector<Clock::time_point> starts_;
  std::vector<Clock::time_point> ends_;
  std::vector<llm::HttpRequest> requests_;
  std::atomic<int> in_flight_{0};
  int max_in_flight_ = 0;
};

llm::HttpResponse openai_reply(const std::string& content, int tokens = 12) {
  llm::HttpResponse response;
  response.status = 200;
  response.body = json{{"choices", {{{"message", {{"role", "assistant"}, {"content", content}}}}}},
                       {"usage", {{"total_tokens", tokens}}}}
                      .dump();
  return response;
}

llm::HttpResponse status_reply(int status, const std::string& body) {
  llm::HttpResponse response;
  response.status = status;
  response.body = body;
  return response;
}

ProviderConfig fast_provider(const std::string& name = "openai") {
  ProviderConfig provider;
  provider.provider = name;
  provider.model = "test-model";
  provider.request_delay_ms = 0;
  provider.retry_delay_ms = 0;
  provider.max_retries = 1;
  provider.timeout_seconds = 5;
  return provider;
}

std::string header_value(const llm::HttpRequest& request, const std::string& name) {
  for (const auto& header : request.headers) {
    if (header.first == name) return header.second;
  }
  return {};
}

// Answers prompts by their "### Request: <kind> <id>" first line.
class ScriptedModelClient final : public llm::IModelClient {
 public:
  bool initialize(const ProviderConfig&, const std::string& credential, std::string& error) override {
    if (credential.empty()) {
      error = "credential missing";
      return false;
    }
    return true;
  }

  llm::ModelResponse send(const std::string& prompt, const std::string&) override {
    const std::string key = request_key(prompt);
    llm::ModelResponse response;
    response.attempts = 1;
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.push_back(key);
    auto it = replies_.find(key);
    if (it == replies_.end()) {
      response.error = "no scripted reply for '" + key + "'";
      return response;
    }
    response.ok = true;
    response.content = it->second;
    response.tokens_used = 10;
    return response;
  }

  void set(const std::string& key, const std::string& reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    replies_[key] = reply;
  }

  void erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    replies_.erase(key);
  }

  std::vector<std::string> seen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_;
  }

  static std::string request_key(const std::string& prompt) {
    const std::string prefix = "### Request: ";
    if (prompt.compare(0, prefix.size(), prefix) != 0) {
      return {};
    }
    const auto newline = prompt.find('\n');
    return prompt.substr(prefix.size(), newline == std::string::npos ? std::string::npos : newline - prefix.size());
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> replies_;
  std::vector<std::string> seen_;
};

// A three-room chapter: a crossroad hub with an elder's hut and a rat-infested mine.
void script_chapter(ScriptedModelClient& client, int n) {
  const std::string s = std::to_string(n);
  const std::string chapter = "chapter_" + s;
  const std::string square = "square_" + s;
  const std::string hut = "hut_" + s;
  const std::string mine = "mine_" + s;
  const std::string elder = "elder_" + s;
  const std::string rat = "rat_" + s;
  const std::string lantern = "lantern_" + s;
  const std::string quest = "find_elder_" + s;

  json outline{{"chapterId", chapter},
               {"chapterName", "Chapter " + s},
               {"chapterDescription", "The village wakes."},
               {"hubLocationId", square},
               {"entryLocationId", square},
               {"exitLocationId", mine},
               {"locations",
                {{{"locationId", square}, {"locationName", "Square"}},
                 {{"locationId", hut}, {"locationName", "Hut"}},
                 {{"locationId", mine}, {"locationName", "Mine"}}}},
               {"mainQuests",
                {{{"questId", quest}, {"questName", "Find the elder"}, {"taskLocation", hut}, {"difficulty", 2 * n}}}},
               {"sideQuests", json::array()},
               {"keyNPCs", {{{"npcId", elder}, {"npcName", "Elder"}, {"role", "quest_giver"}, {"locationId", hut}}}},
               {"enemies", {{{"enemyId", rat}, {"enemyName", "Mine Rat"}, {"challengeRating", n}}}},
               {"items", {{{"itemId", lantern}, {"itemName", "Lantern"}, {"itemType", "key"}}}}};
  client.set("outline " + chapter, outline.dump());

  // The mine lists no connections; the generator repairs the missing edge.
  json graph{{"chapterId", chapter},
             {"hubRoomId", square},
             {"entryRoomId", square},
             {"exitRoomId", mine},
             {"rooms",
              {{{"roomId", square}, {"roomName", "Square"}, {"roomType", "crossroad"},
                {"connectsTo", {hut, mine}}, {"isHub", true}},
               {{"roomId", hut}, {"roomName", "Hut"}, {"roomType", "interaction"},
                {"connectsTo", {square}}, {"npcs", {elder}}},
               {{"roomId", mine}, {"roomName", "Mine"}, {"roomType", "combat"},
                {"connectsTo", json::array()}, {"enemyId", rat}}}}};
  client.set("graph " + chapter, "```json\n" + graph.dump(2) + "\n```");

  json square_room{{"room_id", square},
                   {"room_type", "crossroad"},
                   {"description", "A muddy square."},
                   {"npcs", json::array()},
                   {"actions", json::array()},
                   {"dialogues", json::array()},
                   {"exits", {{{"exit_name", "To the hut"}, {"leads_to", hut}},
                              {{"exit_name", "To the mine"}, {"leads_to", mine}}}}};
  client.set("room " + square, square_room.dump());

  json hut_room{{"room_id", hut},
                {"room_type", "interaction"},
                {"description", "A warm hut."},
                {"npcs", {elder}},
                {"actions", {{{"action_id", elder}, {"action_description", "Talk to the elder"}}}},
                {"dialogues",
                 {{{"npc_name", elder},
                   {"dialogues", {{{"message", "Welcome."}, {"responses", {{{"text", "Bye"}, {"next_step", -1}}}}}}}}}},
                {"exits", {{{"exit_name", "Outside"}, {"leads_to", square}}}}};
  client.set("room " + hut, hut_room.dump());

  json mine_room{{"room_id", mine},
                 {"room_type", "combat"},
                 {"description", "Dripping tunnels."},
                 {"npcs", json::array()},
                 {"actions", json::array()},
                 {"dialogues", json::array()},
                 {"exits", {{{"exit_name", "Back up"}, {"leads_to", square}}}},
                 {"combat", {{"enemyId", rat}, {"isBoss", false}}}};
  client.set("room " + mine, mine_room.dump());

  json quest_doc{{"questId", quest},
                 {"questName", "Find the elder"},
                 {"questType", "Main"},
                 {"questGiverLocation", square},
                 {"chapterNumber", n},
                 {"difficulty", 2 * n},
                 {"prerequisiteQuests", n > 1 ? json::array({"find_elder_" + std::to_string(n - 1)}) : json::array()},
                 {"objectives",
                  {{{"objectiveId", quest + "_talk"}, {"description", "Speak with the elder"}, {"type", "TalkToNPC"},
                    {"targetId", elder}, {"targetCount", 1}}}},
                 {"rewards", {{"experiencePoints", 50}, {"gold", 10}}}};
  client.set("quest " + quest, quest_doc.dump());

  json enemy{{"enemyId", rat},
             {"enemyName", "Mine Rat"},
             {"maxHitPoints", 8},
             {"armorClass", 10},
             {"attacks", {{{"attackName", "Bite"}, {"damageMin", 1}, {"damageMax", 3}}}},
             {"lootTable", json::array()}};
  client.set("enemy " + rat, enemy.dump());

  json item{{"itemId", lantern},
            {"shortDescription", "A dented lantern"},
            {"category", "key"},
            {"effectType", 4},
            {"target", 2},
            {"stacking", false}};
  client.set("item " + lantern, item.dump());
}

GenerationConfig small_config(const fs::path& root, const std::string& world_id) {
  GenerationConfig config;
  config.world_id = world_id;
  config.world_name = "Test Vale";
  config.brief.world_name = "Test Vale";
  config.brief.theme = "quiet dread";
  config.settings.total_chapters = 1;
  config.settings.locations_per_chapter = 3;
  config.settings.main_quests_per_chapter = 1;
  config.settings.quests_per_chapter = 1;
  config.settings.enemy_types_per_chapter = 1;
  config.settings.items_per_chapter = 1;
  config.settings.npcs_per_chapter = 1;
  config.provider = fast_provider();
  config.output_root = root;
  return config;
}

size_t count_json_files(const fs::path& dir) {
  std::error_code ec;
  size_t count = 0;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().extension() == ".json") ++count;
  }
  return count;
}

void dump_errors(const RunReport& report) {
  for (const auto& issue : report.errors) {
    std::cerr << "  [" << to_string(issue.kind) << "] " << issue.artifact_id << ": " << issue.message << "\n";
  }
}

} // namespace

int main() {
  log::set_console(false);

  int failures = 0;
  const fs::path temp_root =
      fs::temp_directory_path() /
      ("wgen_generation_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

  // Test: the next request starts request_delay_ms after the previous one returned.
  {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push(openai_reply("ok"));
    llm::QueuedModelClient client(transport);
    ProviderConfig provider = fast_provider();
    provider.request_delay_ms = 150;
    std::string error;
    if (!client.initialize(provider, "test-key", error)) {
      std::cerr << "client init failed: " << error << "\n";
      ++failures;
    } else {
      client.send("first", "");
      client.send("second", "");
      if (transport->calls() != 2 || transport->idle_ms(1) < 150) {
        std::cerr << "request delay not honored (idle " << transport->idle_ms(1) << "ms)\n";
        ++failures;
      }
    }
  }

  // Test: a slow request does not eat into the delay.
  {
    auto transport = std::make_shared<ScriptedTransport>(200);
    transport->push(openai_reply("ok"));
    llm::QueuedModelClient client(transport);
    ProviderConfig provider = fast_provider();
    provider.request_delay_ms = 150;
    std::string error;
    client.initialize(provider, "test-key", error);
    client.send("first", "");
    client.send("second", "");
    if (transport->calls() != 2 || transport->idle_ms(1) < 150 || transport->gap_ms(1) < 350) {
      std::cerr << "delay counted from request start (idle " << transport->idle_ms(1) << "ms, gap "
                << transport->gap_ms(1) << "ms)\n";
      ++failures;
    }
  }

  // Test: retries are bounded by max_retries.
  {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push(status_reply(500, R"({"error": {"message": "overloaded"}})"));
    llm::QueuedModelClient client(transport);
    ProviderConfig provider = fast_provider();
    provider.max_retries = 3;
    std::vector<std::string> notices;
    client.set_observer([&](const std::string& status) { notices.push_back(status); });
    std::string error;
    client.initialize(provider, "test-key", error);
    const auto response = client.send("prompt", "");
    if (response.ok || transport->calls() != 3 || response.attempts != 3 ||
        response.error.find("after 3 attempts") == std::string::npos ||
        response.error.find("provider unavailable (HTTP 500): overloaded") == std::string::npos) {
      std::cerr << "retry bound wrong: calls=" << transport->calls() << " error=" << response.error << "\n";
      ++failures;
    }
    if (notices.empty()) {
      std::cerr << "observer saw no retry notices\n";
      ++failures;
    }
  }

  // Test: a transport failure is retried and the later success is returned.
  {
    auto transport = std::make_shared<ScriptedTransport>();
    llm::HttpResponse down;
    down.transport_error = "curl error: Couldn't resolve host name";
    transport->push(down);
    transport->push(openai_reply("{\"ok\": true}", 33));
    llm::QueuedModelClient client(transport);
    ProviderConfig provider = fast_provider();
    provider.max_retries = 3;
    std::string error;
    client.initialize(provider, "test-key", error);
    const auto response = client.send("prompt", "system");
    if (!response.ok || response.attempts != 2 || response.tokens_used != 33 || response.content != "{\"ok\": true}") {
      std::cerr << "retry after transport error failed: " << response.error << "\n";
      ++failures;
    }
  }

  // Test: a usage block of the wrong type does not take the client down.
  {
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push(status_reply(200, R"({"choices": [{"message": {"content": "{}"}}], "usage": {"total_tokens": "12"}})"));
    llm::QueuedModelClient client(transport);
    ProviderConfig provider = fast_provider();
    provider.max_retries = 3;
    std::string error;
    client.initialize(provider, "test-key", error);
    const auto response = client.send("prompt", "");
    if (!response.ok || response.content != "{}" || response.tokens_used != 0 || transport->calls() != 1) {
      std::cerr << "string usage count broke the request: " << response.error << "\n";
      ++failures;
    }
  }

  // Test: initialization and pre-initialization failures.
  {
    auto transport = std::make_shared<ScriptedTransport>();
    llm::QueuedModelClient client(transport);
    const auto early = client.send("prompt", "");
    if (early.ok || early.attempts != 0 || transport->calls() != 0) {
      std::cerr << "send before initialize reached the transport\n";
      ++failures;
    }
    std::string error;
    if (client.initialize(fast_provider("llama-local"), "key", error) ||
        error.find("unknown provider") == std::string::npos) {
      std::cerr << "unknown provider accepted\n";
      ++failures;
    }
    if (client.initialize(fast_provider(), "", error) || error.find("credential") == std::string::npos) {
      std::cerr << "empty credential accepted\n";
      ++failures;
    }
  }

  // Test: queued requests are dispatched one at a time.
  {
    auto transport = std::make_shared<ScriptedTransport>(20);
    transport->push(openai_reply("ok"));
    llm::QueuedModelClient client(transport);
    std::string error;
    client.initialize(fast_provider(), "test-key", error);
    std::vector<std::future<llm::ModelResponse>> futures;
    for (int i = 0; i < 4; ++i) {
      futures.push_back(client.enqueue(llm::LlmRequest{"", "prompt " + std::to_string(i)}));
    }
    int ok = 0;
    for (auto& f : futures) {
      if (f.get().ok) ++ok;
    }
    if (ok != 4 || transport->max_in_flight() != 1) {
      std::cerr << "queue dispatched concurrently (max in flight " << transport->max_in_flight() << ")\n";
      ++failures;
    }
  }

  // Test: provider request shapes and error messages.
  {
    llm::OpenAiProvider openai;
    ProviderConfig config = fast_provider();
    const auto req = openai.build_request(llm::LlmRequest{"be terse", "hello"}, config, "sk-test");
    const json body = json::parse(req.body, nullptr, false);
    if (req.url != "https://api.openai.com/v1/chat/completions" || header_value(req, "Authorization") != "Bearer sk-test" ||
        body.is_discarded() || body["messages"].size() != 2 || body["messages"][0]["role"] != "system" ||
        body["model"] != "test-model") {
      std::cerr << "openai request malformed\n";
      ++failures;
    }
    llm::ModelResponse out;
    if (openai.parse_response(status_reply(401, R"({"error": {"message": "bad key"}})"), out) ||
        out.error.find("authentication failed (HTTP 401)") == std::string::npos) {
      std::cerr << "openai 401 not described: " << out.error << "\n";
      ++failures;
    }
    out = llm::ModelResponse{};
    if (openai.parse_response(status_reply(429, "slow down"), out) ||
        out.error.find("rate limit") == std::string::npos) {
      std::cerr << "openai 429 not described: " << out.error << "\n";
      ++failures;
    }
    out = llm::ModelResponse{};
    if (openai.parse_response(status_reply(200, R"({"choices": [{"message": {"content": ""}}]})"), out)) {
      std::cerr << "openai empty content accepted\n";
      ++failures;
    }

    out = llm::ModelResponse{};
    if (openai.parse_response(status_reply(200, R"({"choices": ["text"], "usage": {"total_tokens": 3}})"), out) ||
        out.error.find("no message content") == std::string::npos) {
      std::cerr << "openai non-object choice accepted: " << out.error << "\n";
      ++failures;
    }
    out = llm::ModelResponse{};
    if (openai.parse_response(status_reply(200, R"({"error": "quota"})"), out) ||
        out.error.find("quota") == std::string::npos) {
      std::cerr << "openai string error not described: " << out.error << "\n";
      ++failures;
    }

    llm::AnthropicProvider anthropic;
    config.provider = "anthropic";
    const auto areq = anthropic.build_request(llm::LlmRequest{"be terse", "hello"}, config, "ak-test");
    const json abody = json::parse(areq.body, nullptr, false);
    if (areq.url != "https://api.anthropic.com/v1/messages" || header_value(areq, "x-api-key") != "ak-test" ||
        header_value(areq, "anthropic-version").empty() || abody.is_discarded() || abody["system"] != "be terse" ||
        abody["messages"].size() != 1) {
      std::cerr << "anthropic request malformed\n";
      ++failures;
    }
    out = llm::ModelResponse{};
    const auto areply = status_reply(
        200, R"({"content": [{"type": "text", "text": "{\"a\":"}, {"type": "text", "text": " 1}"}],
                 "usage": {"input_tokens": 5, "output_tokens": 7}})");
    if (!anthropic.parse_response(areply, out) || out.content != "{\"a\": 1}" || out.tokens_used != 12) {
      std::cerr << "anthropic reply not parsed: " << out.error << "\n";
      ++failures;
    }
    out = llm::ModelResponse{};
    const auto odd_usage = status_reply(
        200, R"({"type": 7, "content": [{"type": "text", "text": "{}"}, {"type": ["x"]}, "loose"],
                 "usage": {"input_tokens": "5", "output_tokens": 7}})");
    if (!anthropic.parse_response(odd_usage, out) || out.content != "{}" || out.tokens_used != 0) {
      std::cerr << "anthropic odd payload not tolerated: " << out.error << "\n";
      ++failures;
    }
    if (llm::make_provider("claude") == nullptr || llm::make_provider("gemini") != nullptr) {
      std::cerr << "provider factory names wrong\n";
      ++failures;
    }
  }

  // Test: end-to-end generation writes a consistent store.
  {
    ScriptedModelClient client;
    script_chapter(client, 1);
    EventBus bus;
    int completed_chapters = 0;
    bus.subscribe<runtime::ChapterCompletedEvent>([&](const runtime::ChapterCompletedEvent&) { ++completed_chapters; });
    runtime::WorldGenerator generator(client, bus);
    const auto config = small_config(temp_root / "e2e", "vale");
    const RunReport report = generator.run_generation(config, "test-key");
    const fs::path world = temp_root / "e2e" / "vale";
    if (!report.completed || !report.persisted || !report.errors.empty()) {
      std::cerr << "end-to-end run reported errors\n";
      dump_errors(report);
      ++failures;
    }
    if (count_json_files(world / "Rooms") != 3 || count_json_files(world / "Quests") != 1 ||
        count_json_files(world / "Enemies") != 1 || count_json_files(world / "Items") != 1 ||
        completed_chapters != 1) {
      std::cerr << "end-to-end store layout wrong\n";
      ++failures;
    }
    json manifest;
    std::string error;
    if (!data::load_json_file(world / "config.json", manifest, error) || manifest["chapterIds"].size() != 1 ||
        manifest["startingRoom"] != "square_1" || manifest.dump().find("test-key") != std::string::npos) {
      std::cerr << "manifest wrong: " << error << "\n";
      ++failures;
    }
    json mine;
    if (!data::load_json_file(world / "Rooms" / "mine_1.json", mine, error) ||
        mine["exits"][0]["leads_to"] != "square_1") {
      std::cerr << "repaired room not stored\n";
      ++failures;
    }
    runtime::ContentStore store(world);
    WorldManifest loaded;
    WorldContent content;
    if (!store.load(loaded, content, error) || content.chapters.size() != 1 || content.rooms.size() != 3 ||
        content.chapters[0].exit_quest_id != "find_elder_1" || !content.chapters[0].is_validated) {
      std::cerr << "store reload failed: " << error << "\n";
      ++failures;
    }

    // Test: the journal holds one clean run with every request.
    data::RunJournal journal;
    if (!journal.open(store.journal_path(), error)) {
      std::cerr << "journal open failed: " << error << "\n";
      ++failures;
    } else {
      const auto runs = journal.recent_runs(10, error);
      if (runs.size() != 1 || runs[0].status != "ok" || runs[0].chapters != 1 || runs[0].total_tokens != 80) {
        std::cerr << "journal run row wrong\n";
        ++failures;
      } else if (journal.requests_for_run(runs[0].run_id, error).size() != 8) {
        std::cerr << "journal request rows wrong\n";
        ++failures;
      }
    }

    // Test: next chapter on a reloaded world chains the unlock quest.
    script_chapter(client, 2);
    runtime::WorldGenerator second(client, bus);
    if (!second.load_world(world, error)) {
      std::cerr << "load_world failed: " << error << "\n";
      ++failures;
    } else {
      const RunReport next = second.run_next_chapter("test-key");
      const auto& chapters = second.content().chapters;
      if (!next.persisted || !next.errors.empty() || chapters.size() != 2 ||
          chapters[1].unlock_quest_id != "find_elder_1" || chapters[1].exit_quest_id != "find_elder_2") {
        std::cerr << "next chapter not chained\n";
        dump_errors(next);
        ++failures;
      }
      json manifest2;
      if (!data::load_json_file(world / "config.json", manifest2, error) || manifest2["chapterIds"].size() != 2 ||
          count_json_files(world / "Rooms") != 6) {
        std::cerr << "next chapter not persisted\n";
        ++failures;
      }
      if (journal.is_open() && journal.recent_runs(10, error).size() != 2) {
        std::cerr << "next chapter run not journaled\n";
        ++failures;
      }
    }
  }

  // Test: one malformed room is skipped and reported once.
  {
    ScriptedModelClient client;
    script_chapter(client, 1);
    client.set("room hut_1", "{\"room_id\": \"hut_1\", ");
    EventBus bus;
    runtime::WorldGenerator generator(client, bus);
    const RunReport report = generator.run_generation(small_config(temp_root / "malformed", "vale"), "test-key");
    const auto parse_issues = report.issues(IssueKind::Parse);
    if (parse_issues.size() != 1 || parse_issues[0].artifact_id != "hut_1") {
      std::cerr << "malformed room not reported as one parse issue\n";
      dump_errors(report);
      ++failures;
    }
    if (!report.persisted || report.aborted ||
        count_json_files(temp_root / "malformed" / "vale" / "Rooms") != 2) {
      std::cerr << "run did not continue past the malformed room\n";
      ++failures;
    }
    if (report.count(IssueKind::Integrity) == 0) {
      std::cerr << "missing room not caught by integrity\n";
      ++failures;
    }
  }

  // Test: a curly-quoted room reply is a parse issue and the report still persists.
  {
    ScriptedModelClient client;
    script_chapter(client, 1);
    client.set("room hut_1", "{\"room_id\": \xE2\x80\x9Chut\xE2\x80\x9D}");
    EventBus bus;
    runtime::WorldGenerator generator(client, bus);
    const RunReport report = generator.run_generation(small_config(temp_root / "curly", "vale"), "test-key");
    const fs::path world = temp_root / "curly" / "vale";
    const auto parse_issues = report.issues(IssueKind::Parse);
    json saved_report;
    std::string error;
    if (parse_issues.size() != 1 || parse_issues[0].artifact_id != "hut_1" || !report.persisted ||
        !fs::exists(world / "config.json") || !data::load_json_file(world / "generation_report.json", saved_report, error)) {
      std::cerr << "curly-quoted room broke persistence: " << error << "\n";
      dump_errors(report);
      ++failures;
    }
  }

  // Test: cancellation after the outline writes nothing.
  {
    ScriptedModelClient client;
    script_chapter(client, 1);
    EventBus bus;
    runtime::WorldGenerator generator(client, bus);
    bus.subscribe<runtime::OutlineGeneratedEvent>([&](const runtime::OutlineGeneratedEvent&) { generator.cancel(); });
    const RunReport report = generator.run_generation(small_config(temp_root / "cancel", "vale"), "test-key");
    if (!report.cancelled || report.persisted || report.count(IssueKind::Cancelled) != 1 ||
        fs::exists(temp_root / "cancel" / "vale" / "config.json") || client.seen().size() != 1 ||
        generator.stage() != runtime::GenerationStage::Aborted) {
      std::cerr << "cancelled run left output or kept going\n";
      ++failures;
    }
  }

  // Test: outline transport failure aborts the run.
  {
    ScriptedModelClient client;
    script_chapter(client, 1);
    client.erase("outline chapter_1");
    EventBus bus;
    std::vector<runtime::RunErrorEvent> errors;
    bus.subscribe<runtime::RunErrorEvent>([&](const runtime::RunErrorEvent& ev) { errors.push_back(ev); });
    runtime::WorldGenerator generator(client, bus);
    const RunReport report = generator.run_generation(small_config(temp_root / "abort", "vale"), "test-key");
    if (!report.aborted || report.persisted || report.count(IssueKind::Transport) != 1 || errors.size() != 1 ||
        !errors[0].fatal || fs::exists(temp_root / "abort" / "vale")) {
      std::cerr << "outline failure did not abort cleanly\n";
      dump_errors(report);
      ++failures;
    }
  }

  // Test: a missing room graph aborts the run.
  {
    ScriptedModelClient client;
    script_chapter(client, 1);
    client.erase("graph chapter_1");
    EventBus bus;
    runtime::WorldGenerator generator(client, bus);
    const RunReport report = generator.run_generation(small_config(temp_root / "no_graph", "vale"), "test-key");
    if (!report.aborted || report.persisted || report.count(IssueKind::Transport) != 1 ||
        fs::exists(temp_root / "no_graph" / "vale")) {
      std::cerr << "graph transport failure did not abort cleanly\n";
      dump_errors(report);
      ++failures;
    }
  }

  // Test: an unparseable room graph aborts the run.
  {
    ScriptedModelClient client;
    script_chapter(client, 1);
    client.set("graph chapter_1", "rooms: square, hut, mine");
    EventBus bus;
    runtime::WorldGenerator generator(client, bus);
    const RunReport report = generator.run_generation(small_config(temp_root / "bad_graph", "vale"), "test-key");
    const auto parse_issues = report.issues(IssueKind::Parse);
    if (!report.aborted || report.persisted || parse_issues.size() != 1 || parse_issues[0].artifact_id != "chapter_1" ||
        fs::exists(temp_root / "bad_graph" / "vale")) {
      std::cerr << "graph parse failure did not abort cleanly\n";
      dump_errors(report);
      ++failures;
    }
  }

  // Test: a room graph with no rooms aborts the run.
  {
    ScriptedModelClient client;
    script_chapter(client, 1);
    client.set("graph chapter_1", R"({"chapterId": "chapter_1", "rooms": []})");
    EventBus bus;
    runtime::WorldGenerator generator(client, bus);
    const RunReport report = generator.run_generation(small_config(temp_root / "empty_graph", "vale"), "test-key");
    if (!report.aborted || report.persisted || fs::exists(temp_root / "empty_graph" / "vale") ||
        client.seen().size() != 2) {
      std::cerr << "empty room graph did not abort cleanly\n";
      dump_errors(report);
      ++failures;
    }
  }

  // Test: clearing a store for a rewrite removes the manifest first.
  {
    const fs::path world = temp_root / "rewrite" / "vale";
    runtime::ContentStore store(world);
    WorldManifest manifest;
    manifest.config_id = "vale";
    manifest.chapter_ids = {"chapter_1"};
    WorldContent content;
    ChapterArtifact chapter;
    chapter.id = "chapter_1";
    chapter.number = 1;
    content.chapters.push_back(chapter);
    content.rooms["square_1"] = json{{"room_id", "square_1"}};
    RunReport report;
    std::string error;
    if (!store.save(manifest, content, report, error) || !store.exists()) {
      std::cerr << "store save failed: " << error << "\n";
      ++failures;
    }
    if (!store.clear_artifacts(error) || store.exists() || fs::exists(world / "Rooms")) {
      std::cerr << "cleared store still reads as present\n";
      ++failures;
    }
    content.rooms["../escape"] = json::object();
    WorldManifest loaded;
    WorldContent loaded_content;
    if (store.save(manifest, content, report, error) || store.exists() ||
        store.load(loaded, loaded_content, error)) {
      std::cerr << "failed rewrite left a loadable manifest\n";
      ++failures;
    }
  }

  // Test: background generation reports through the event bus.
  {
    ScriptedModelClient client;
    script_chapter(client, 1);
    EventBus bus;
    std::atomic<int> done_events{0};
    std::atomic<bool> done_success{false};
    bus.subscribe<runtime::GenerationCompleteEvent>([&](const runtime::GenerationCompleteEvent& ev) {
      done_success.store(ev.success && ev.persisted);
      ++done_events;
    });
    runtime::WorldGenerator generator(client, bus);
    std::string error;
    if (generator.generate_next_chapter("test-key", error) || error.find("no world") == std::string::npos ||
        generator.is_generating()) {
      std::cerr << "next chapter without a world was accepted or left the generator busy\n";
      ++failures;
    }
    if (!generator.start_generation(small_config(temp_root / "async", "vale"), "test-key", error)) {
      std::cerr << "start_generation failed: " << error << "\n";
      ++failures;
    } else {
      generator.wait();
      if (done_events.load() != 1 || !done_success.load() || !generator.has_world() || generator.is_generating() ||
          generator.last_report().generated.rooms != 3) {
        std::cerr << "background run did not complete\n";
        ++failures;
      }
    }
    GenerationConfig bad = small_config(temp_root / "async", "");
    if (generator.start_generation(bad, "test-key", error)) {
      std::cerr << "invalid config started a run\n";
      ++failures;
    }
  }

  // Test: exported YAML loads back as the same config.
  {
    GenerationConfig config = small_config(temp_root / "yaml", "sunken_crown");
    config.brief.key_locations = {"Tidewall", "Saltmarsh"};
    config.brief.custom_parameters.push_back(KeyValue{"magic_level", "low"});
    config.provider.model = "claude-test";
    config.provider.provider = "anthropic";
    const fs::path out = temp_root / "yaml" / "world.yaml";
    std::string error;
    GenerationConfig back;
    if (!data::save_yaml_file(out, data::config_to_yaml(config), error) ||
        !load_generation_config(out, back, error)) {
      std::cerr << "yaml export failed: " << error << "\n";
      ++failures;
    } else if (back.world_id != "sunken_crown" || back.provider.provider != "anthropic" ||
               back.provider.model != "claude-test" || back.settings.locations_per_chapter != 3 ||
               back.brief.key_locations.size() != 2 || back.brief.custom_parameters.size() != 1 ||
               back.output_root != config.output_root) {
      std::cerr << "yaml export did not round trip\n";
      ++failures;
    }
  }

  std::error_code ec;
  fs::remove_all(temp_root, ec);

  if (failures == 0) {
    std::cout << "wgen_generation_tests: all passed\n";
  }
  return failures == 0 ? 0 : 1;
}
