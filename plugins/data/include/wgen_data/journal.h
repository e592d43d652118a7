#pragma once

#include "wgen/run_report.h"

#include <filesystem>
#include <string>
#include <vector>

struct sqlite3;

namespace wgen::data {

struct JournalRun {
  std::string run_id;
  std::string mode;
  std::string world_id;
  std::string status;
  std::string started_at;
  std::string finished_at;
  int chapters = 0;
  int total_tokens = 0;
  int error_count = 0;
  int warning_count = 0;
};

struct JournalRequest {
  std::string artifact_kind;
  std::string artifact_id;
  bool ok = false;
  int tokens_used = 0;
  int attempts = 0;
  std::string error;
};

// Append-only SQLite log of generation runs kept next to the content store.
class RunJournal {
 public:
  RunJournal() = default;
  ~RunJournal();

  RunJournal(const RunJournal&) = delete;
  RunJournal& operator=(const RunJournal&) = delete;

  // Creates the file and tables when missing.
  bool open(const std::filesystem::path& path, std::string& error);
  void close();
  bool is_open() const { return db_ != nullptr; }

  // One transaction: the run row, its request rows and its issue rows.
  bool record_run(const RunReport& report, int chapter_count, std::string& error);

  // Newest first.
  std::vector<JournalRun> recent_runs(int limit, std::string& error) const;
  std::vector<JournalRequest> requests_for_run(const std::string& run_id, std::string& error) const;
  std::vector<ReportIssue> issues_for_run(const std::string& run_id, std::string& error) const;

 private:
  bool exec(const char* sql, std::string& error);

  sqlite3* db_ = nullptr;
};

std::string run_status(const RunReport& report);

} // namespace wgen::data
