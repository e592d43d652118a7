#include "wgen_data/journal.h"

#include "wgen/log.h"

#include <sqlite3.h>

namespace wgen::data {

namespace {
constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS runs (
  run_id TEXT PRIMARY KEY,
  mode TEXT NOT NULL,
  world_id TEXT NOT NULL,
  status TEXT NOT NULL,
  started_at TEXT,
  finished_at TEXT,
  chapters INTEGER NOT NULL DEFAULT 0,
  total_tokens INTEGER NOT NULL DEFAULT 0,
  error_count INTEGER NOT NULL DEFAULT 0,
  warning_count INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS requests (
  run_id TEXT NOT NULL,
  seq INTEGER NOT NULL,
  artifact_kind TEXT NOT NULL,
  artifact_id TEXT NOT NULL,
  ok INTEGER NOT NULL,
  tokens INTEGER NOT NULL,
  attempts INTEGER NOT NULL,
  error TEXT
);
CREATE TABLE IF NOT EXISTS issues (
  run_id TEXT NOT NULL,
  seq INTEGER NOT NULL,
  kind TEXT NOT NULL,
  artifact_id TEXT,
  message TEXT NOT NULL
);
)sql";

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }
  explicit operator bool() const { return stmt_ != nullptr; }

  void bind(int idx, const std::string& value) {
    sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  }
  void bind(int idx, int value) { sqlite3_bind_int(stmt_, idx, value); }

  std::string text(int col) const {
    const unsigned char* v = sqlite3_column_text(stmt_, col);
    return v ? reinterpret_cast<const char*>(v) : std::string();
  }
  int integer(int col) const { return sqlite3_column_int(stmt_, col); }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

std::string db_error(sqlite3* db) {
  return db ? sqlite3_errmsg(db) : "database not open";
}
} // namespace

std::string run_status(const RunReport& report) {
  if (report.cancelled) return "cancelled";
  if (report.aborted) return "aborted";
  if (!report.completed) return "incomplete";
  return report.errors.empty() ? "ok" : "completed_with_errors";
}

RunJournal::~RunJournal() {
  close();
}

void RunJournal::close() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool RunJournal::exec(const char* sql, std::string& error) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    error = std::string("sqlite exec error: ") + (err_msg ? err_msg : db_error(db_));
    if (err_msg) sqlite3_free(err_msg);
    log::warn(error);
    return false;
  }
  return true;
}

bool RunJournal::open(const std::filesystem::path& path, std::string& error) {
  close();
  if (sqlite3_open(path.string().c_str(), &db_) != SQLITE_OK) {
    error = "sqlite open failed (" + path.string() + "): " + db_error(db_);
    log::warn(error);
    close();
    return false;
  }
  if (!exec(kSchema, error)) {
    close();
    return false;
  }
  return true;
}

bool RunJournal::record_run(const RunReport& report, int chapter_count, std::string& error) {
  if (!db_) {
    error = "journal not open";
    return false;
  }
  if (!exec("BEGIN", error)) {
    return false;
  }

  auto fail = [&](const std::string& what) {
    error = what + ": " + db_error(db_);
    log::warn(error);
    std::string ignored;
    exec("ROLLBACK", ignored);
    return false;
  };

  {
    Statement stmt(db_,
                   "INSERT OR REPLACE INTO runs (run_id, mode, world_id, status, started_at, finished_at, "
                   "chapters, total_tokens, error_count, warning_count) VALUES (?,?,?,?,?,?,?,?,?,?)");
    if (!stmt) return fail("prepare runs insert");
    stmt.bind(1, report.run_id);
    stmt.bind(2, report.mode);
    stmt.bind(3, report.world_id);
    stmt.bind(4, run_status(report));
    stmt.bind(5, report.started_at);
    stmt.bind(6, report.finished_at);
    stmt.bind(7, chapter_count);
    stmt.bind(8, report.total_tokens);
    stmt.bind(9, static_cast<int>(report.errors.size()));
    stmt.bind(10, static_cast<int>(report.warnings.size()));
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) return fail("insert run");
  }

  {
    Statement stmt(db_,
                   "INSERT INTO requests (run_id, seq, artifact_kind, artifact_id, ok, tokens, attempts, error) "
                   "VALUES (?,?,?,?,?,?,?,?)");
    if (!stmt) return fail("prepare requests insert");
    int seq = 0;
    for (const auto& req : report.requests) {
      sqlite3_reset(stmt.get());
      stmt.bind(1, report.run_id);
      stmt.bind(2, seq++);
      stmt.bind(3, req.artifact_kind);
      stmt.bind(4, req.artifact_id);
      stmt.bind(5, req.ok ? 1 : 0);
      stmt.bind(6, req.tokens_used);
      stmt.bind(7, req.attempts);
      stmt.bind(8, req.error);
      if (sqlite3_step(stmt.get()) != SQLITE_DONE) return fail("insert request");
    }
  }

  {
    Statement stmt(db_, "INSERT INTO issues (run_id, seq, kind, artifact_id, message) VALUES (?,?,?,?,?)");
    if (!stmt) return fail("prepare issues insert");
    int seq = 0;
    for (const auto& issue : report.errors) {
      sqlite3_reset(stmt.get());
      stmt.bind(1, report.run_id);
      stmt.bind(2, seq++);
      stmt.bind(3, std::string(to_string(issue.kind)));
      stmt.bind(4, issue.artifact_id);
      stmt.bind(5, issue.message);
      if (sqlite3_step(stmt.get()) != SQLITE_DONE) return fail("insert issue");
    }
  }

  return exec("COMMIT", error);
}

std::vector<JournalRun> RunJournal::recent_runs(int limit, std::string& error) const {
  std::vector<JournalRun> out;
  if (!db_) {
    error = "journal not open";
    return out;
  }
  Statement stmt(db_,
                 "SELECT run_id, mode, world_id, status, started_at, finished_at, chapters, total_tokens, "
                 "error_count, warning_count FROM runs ORDER BY started_at DESC, run_id DESC LIMIT ?");
  if (!stmt) {
    error = "prepare runs query: " + db_error(db_);
    return out;
  }
  stmt.bind(1, limit);
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    JournalRun run;
    run.run_id = stmt.text(0);
    run.mode = stmt.text(1);
    run.world_id = stmt.text(2);
    run.status = stmt.text(3);
    run.started_at = stmt.text(4);
    run.finished_at = stmt.text(5);
    run.chapters = stmt.integer(6);
    run.total_tokens = stmt.integer(7);
    run.error_count = stmt.integer(8);
    run.warning_count = stmt.integer(9);
    out.push_back(std::move(run));
  }
  return out;
}

std::vector<JournalRequest> RunJournal::requests_for_run(const std::string& run_id, std::string& error) const {
  std::vector<JournalRequest> out;
  if (!db_) {
    error = "journal not open";
    return out;
  }
  Statement stmt(db_,
                 "SELECT artifact_kind, artifact_id, ok, tokens, attempts, error FROM requests "
                 "WHERE run_id = ? ORDER BY seq");
  if (!stmt) {
    error = "prepare requests query: " + db_error(db_);
    return out;
  }
  stmt.bind(1, run_id);
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    JournalRequest req;
    req.artifact_kind = stmt.text(0);
    req.artifact_id = stmt.text(1);
    req.ok = stmt.integer(2) != 0;
    req.tokens_used = stmt.integer(3);
    req.attempts = stmt.integer(4);
    req.error = stmt.text(5);
    out.push_back(std::move(req));
  }
  return out;
}

std::vector<ReportIssue> RunJournal::issues_for_run(const std::string& run_id, std::string& error) const {
  std::vector<ReportIssue> out;
  if (!db_) {
    error = "journal not open";
    return out;
  }
  Statement stmt(db_, "SELECT kind, artifact_id, message FROM issues WHERE run_id = ? ORDER BY seq");
  if (!stmt) {
    error = "prepare issues query: " + db_error(db_);
    return out;
  }
  stmt.bind(1, run_id);
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ReportIssue issue;
    const std::string kind = stmt.text(0);
    for (auto k : {IssueKind::Transport, IssueKind::Parse, IssueKind::Schema, IssueKind::Integrity,
                   IssueKind::Persist, IssueKind::Cancelled}) {
      if (kind == to_string(k)) issue.kind = k;
    }
    issue.artifact_id = stmt.text(1);
    issue.message = stmt.text(2);
    out.push_back(std::move(issue));
  }
  return out;
}

} // namespace wgen::data
