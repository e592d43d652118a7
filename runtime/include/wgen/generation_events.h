#pragma once

#include "wgen/run_report.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Observer payloads published on the EventBus by WorldGenerator. Delivery is
// advisory: a run behaves the same with or without subscribers.
namespace wgen::runtime {

struct StatusEvent {
  std::string message;
};

struct ProgressEvent {
  float fraction = 0.0f;
  std::string stage;
};

struct OutlineGeneratedEvent {
  int chapter_number = 0;
  std::string chapter_id;
  std::string chapter_name;
  size_t locations = 0;
  size_t main_quests = 0;
  size_t side_quests = 0;
};

struct ChapterCompletedEvent {
  int chapter_number = 0;
  std::string chapter_id;
  size_t rooms = 0;
  size_t quests = 0;
  size_t enemies = 0;
  size_t items = 0;
};

struct RunErrorEvent {
  IssueKind kind = IssueKind::Transport;
  std::string artifact_id;
  std::string message;
  // True when the run stops because of this error.
  bool fatal = false;
};

struct ValidationReportEvent {
  size_t schema_errors = 0;
  std::vector<std::string> integrity_errors;
  std::vector<std::string> warnings;
};

struct GenerationCompleteEvent {
  bool success = false;
  bool persisted = false;
  std::string run_id;
  std::filesystem::path world_dir;
};

} // namespace wgen::runtime
