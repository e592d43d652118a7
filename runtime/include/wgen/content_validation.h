#pragma once

#include "wgen/run_report.h"
#include "wgen/world_types.h"

#include <map>
#include <string>
#include <vector>

namespace wgen::runtime {

// Graph data kept per generated room so re-validation can apply the
// kind-specific rules and the neighbor-only exit check.
struct RoomPlan {
  std::string chapter_id;
  RoomKind kind = RoomKind::Navigation;
  std::vector<std::string> neighbors;
};

struct ValidationSummary {
  size_t schema_errors = 0;
  std::vector<std::string> integrity_errors;
  std::vector<std::string> warnings;

  bool ok() const { return schema_errors == 0 && integrity_errors.empty(); }
};

// Re-checks every stored artifact against its schema, then the whole set for
// integrity. Appends Schema/Integrity issues and warnings to `report` and
// refreshes each chapter's validationErrors / isValidated. Rooms without a
// plan are checked against their own room_type.
ValidationSummary validate_content(WorldContent& content, const std::map<std::string, RoomPlan>& plans,
                                   RunReport& report);

} // namespace wgen::runtime
