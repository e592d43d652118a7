#include "wgen/run_report.h"

#include <sstream>

namespace wgen {

using json = nlohmann::json;

const char* to_string(IssueKind kind) {
  switch (kind) {
    case IssueKind::Transport:
      return "transport";
    case IssueKind::Parse:
      return "parse";
    case IssueKind::Schema:
      return "schema";
    case IssueKind::Integrity:
      return "integrity";
    case IssueKind::Persist:
      return "persist";
    case IssueKind::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

void RunReport::add_error(IssueKind kind, const std::string& artifact_id, const std::string& message) {
  errors.push_back(ReportIssue{kind, artifact_id, message});
}

void RunReport::add_warning(const std::string& message) {
  warnings.push_back(message);
}

size_t RunReport::count(IssueKind kind) const {
  size_t n = 0;
  for (const auto& issue : errors) {
    if (issue.kind == kind) ++n;
  }
  return n;
}

std::vector<ReportIssue> RunReport::issues(IssueKind kind) const {
  std::vector<ReportIssue> out;
  for (const auto& issue : errors) {
    if (issue.kind == kind) out.push_back(issue);
  }
  return out;
}

json to_json(const RunReport& report) {
  json j;
  j["runId"] = report.run_id;
  j["worldId"] = report.world_id;
  j["mode"] = report.mode;
  j["startedAt"] = report.started_at;
  j["finishedAt"] = report.finished_at;
  j["completed"] = report.completed;
  j["aborted"] = report.aborted;
  j["cancelled"] = report.cancelled;
  j["abortReason"] = report.abort_reason;
  j["totalTokens"] = report.total_tokens;
  j["generated"] = {
      {"chapters", report.generated.chapters},
      {"rooms", report.generated.rooms},
      {"quests", report.generated.quests},
      {"enemies", report.generated.enemies},
      {"items", report.generated.items},
  };
  j["errors"] = json::array();
  for (const auto& issue : report.errors) {
    j["errors"].push_back({{"kind", to_string(issue.kind)},
                           {"artifactId", issue.artifact_id},
                           {"message", issue.message}});
  }
  j["warnings"] = report.warnings;
  j["requests"] = json::array();
  for (const auto& req : report.requests) {
    j["requests"].push_back({{"kind", req.artifact_kind},
                             {"artifactId", req.artifact_id},
                             {"ok", req.ok},
                             {"tokensUsed", req.tokens_used},
                             {"attempts", req.attempts},
                             {"error", req.error}});
  }
  return j;
}

std::string make_run_id() {
  std::string id = now_iso();
  for (auto& c : id) {
    if (c == ':' || c == 'T') c = '_';
  }
  return id;
}

std::string format_content_report(const WorldContent& content, const RunReport* report) {
  std::ostringstream oss;
  oss << "=== World Content Report ===\n";
  oss << "Chapters: " << content.chapters.size() << "\n";
  oss << "Rooms: " << content.rooms.size() << "\n";
  oss << "Quests: " << content.quests.size() << "\n";
  oss << "Enemies: " << content.enemies.size() << "\n";
  oss << "Items: " << content.items.size() << "\n";

  for (const auto& chapter : content.chapters) {
    oss << "\n--- Chapter " << chapter.number << ": " << chapter.name << " ---\n";
    oss << "  Locations: " << chapter.location_ids.size() << "\n";
    oss << "  Quests: " << chapter.quest_ids.size() << " (" << chapter.main_quest_ids.size() << " main)\n";
    oss << "  Enemies: " << chapter.enemy_ids.size() << "\n";
    oss << "  Items: " << chapter.item_ids.size() << "\n";
    oss << "  Difficulty: " << chapter.difficulty.base_difficulty << " (CR " << chapter.difficulty.min_enemy_cr
        << "-" << chapter.difficulty.max_enemy_cr << ")\n";
    if (!chapter.unlock_quest_id.empty()) {
      oss << "  Unlocked by: " << chapter.unlock_quest_id << "\n";
    }
    if (!chapter.exit_quest_id.empty()) {
      oss << "  Completed by: " << chapter.exit_quest_id << "\n";
    }
    if (!chapter.validation_errors.empty()) {
      oss << "  Validation errors: " << chapter.validation_errors.size() << "\n";
    }
  }

  if (report) {
    oss << "\n--- Run " << report->run_id << " ---\n";
    oss << "Requests: " << report->requests.size() << ", tokens: " << report->total_tokens << "\n";
    if (report->aborted) {
      oss << "Aborted: " << report->abort_reason << "\n";
    }
    oss << "Errors: " << report->errors.size() << "\n";
    for (const auto& issue : report->errors) {
      oss << "  [" << to_string(issue.kind) << "]";
      if (!issue.artifact_id.empty()) {
        oss << " " << issue.artifact_id << ":";
      }
      oss << " " << issue.message << "\n";
    }
    oss << "Warnings: " << report->warnings.size() << "\n";
    for (const auto& warning : report->warnings) {
      oss << "  " << warning << "\n";
    }
  }
  return oss.str();
}

} // namespace wgen
