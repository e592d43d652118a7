#pragma once

#include "wgen/world_types.h"

#include <map>
#include <string>
#include <vector>

namespace wgen {

struct IntegrityReport {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  bool ok() const { return errors.empty(); }
};

// Runs every check below and concatenates their output.
IntegrityReport check_integrity(const WorldContent& content);

std::vector<std::string> check_sequencing(const WorldContent& content);
std::vector<std::string> check_chapter_contents(const WorldContent& content);
std::vector<std::string> check_unlock_chain(const WorldContent& content);
std::vector<std::string> check_references(const WorldContent& content);
std::vector<std::string> check_prerequisite_cycles(const WorldContent& content);
std::vector<std::string> check_reachability(const WorldContent& content);

std::vector<std::string> difficulty_warnings(const WorldContent& content);
std::vector<std::string> room_exit_budget_warnings(const WorldContent& content);

// Path-tracking depth-first walk. Each returned cycle starts and ends with the
// same quest id, e.g. {"q1", "q2", "q1"}. Unknown prerequisite ids are ignored.
std::vector<std::vector<std::string>> find_prerequisite_cycles(
    const std::map<std::string, std::vector<std::string>>& prerequisites);

} // namespace wgen
