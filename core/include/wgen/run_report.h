#pragma once

#include "wgen/world_types.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace wgen {

enum class IssueKind {
  Transport,
  Parse,
  Schema,
  Integrity,
  Persist,
  Cancelled
};

const char* to_string(IssueKind kind);

struct ReportIssue {
  IssueKind kind = IssueKind::Transport;
  std::string artifact_id;
  std::string message;
};

struct RequestRecord {
  std::string artifact_kind;
  std::string artifact_id;
  bool ok = false;
  int tokens_used = 0;
  int attempts = 0;
  std::string error;
};

struct ArtifactCounts {
  int chapters = 0;
  int rooms = 0;
  int quests = 0;
  int enemies = 0;
  int items = 0;
};

struct RunReport {
  std::string run_id;
  std::string world_id;
  std::string mode;
  std::string started_at;
  std::string finished_at;
  bool completed = false;
  bool aborted = false;
  bool cancelled = false;
  bool persisted = false;
  std::string abort_reason;
  std::vector<ReportIssue> errors;
  std::vector<std::string> warnings;
  std::vector<RequestRecord> requests;
  ArtifactCounts generated;
  int total_tokens = 0;

  void add_error(IssueKind kind, const std::string& artifact_id, const std::string& message);
  void add_warning(const std::string& message);
  size_t count(IssueKind kind) const;
  std::vector<ReportIssue> issues(IssueKind kind) const;
};

nlohmann::json to_json(const RunReport& report);

std::string make_run_id();

// Operator-facing summary of a world: totals, per-chapter counts, difficulty
// band and any recorded issues.
std::string format_content_report(const WorldContent& content, const RunReport* report);

} // namespace wgen
