#include "wgen/content_validation.h"

#include "wgen/integrity.h"
#include "wgen/schema_validator.h"

#include <set>

namespace wgen::runtime {

namespace {
void collect_owners(const std::vector<std::string>& ids, size_t chapter_index,
                    std::map<std::string, size_t>& owners) {
  for (const auto& id : ids) {
    owners[id] = chapter_index;
  }
}
} // namespace

ValidationSummary validate_content(WorldContent& content, const std::map<std::string, RoomPlan>& plans,
                                   RunReport& report) {
  ValidationSummary summary;

  // Later chapters win when an id was reused.
  std::map<std::string, size_t> owners;
  for (size_t i = 0; i < content.chapters.size(); ++i) {
    auto& chapter = content.chapters[i];
    chapter.validation_errors.clear();
    collect_owners(chapter.location_ids, i, owners);
    collect_owners(chapter.quest_ids, i, owners);
    collect_owners(chapter.enemy_ids, i, owners);
    collect_owners(chapter.item_ids, i, owners);
  }

  std::set<std::string> known_rooms;
  for (const auto& entry : content.rooms) {
    known_rooms.insert(entry.first);
  }

  auto check = [&](ArtifactKind kind, const ArtifactMap& artifacts) {
    for (const auto& entry : artifacts) {
      const std::string& id = entry.first;
      ValidateOptions options;
      options.expected_id = id;
      if (kind == ArtifactKind::Room) {
        options.known_ids = known_rooms;
        const auto plan = plans.find(id);
        if (plan != plans.end()) {
          options.expected_room_kind = plan->second.kind;
          options.allowed_exits = plan->second.neighbors;
        }
      }
      const ValidationResult result = validate_document(kind, entry.second, options);
      const std::string label = std::string(to_string(kind)) + " '" + id + "': ";
      const auto owner = owners.find(id);
      for (const auto& err : result.errors) {
        report.add_error(IssueKind::Schema, id, label + err);
        ++summary.schema_errors;
        if (owner != owners.end()) {
          content.chapters[owner->second].validation_errors.push_back(id + ": " + err);
        }
      }
      for (const auto& warning : result.warnings) {
        summary.warnings.push_back(label + warning);
      }
    }
  };

  check(ArtifactKind::Room, content.rooms);
  check(ArtifactKind::Quest, content.quests);
  check(ArtifactKind::Enemy, content.enemies);
  check(ArtifactKind::Item, content.items);

  const IntegrityReport integrity = check_integrity(content);
  for (const auto& err : integrity.errors) {
    report.add_error(IssueKind::Integrity, "", err);
    summary.integrity_errors.push_back(err);
  }
  summary.warnings.insert(summary.warnings.end(), integrity.warnings.begin(), integrity.warnings.end());
  for (const auto& warning : summary.warnings) {
    report.add_warning(warning);
  }

  for (auto& chapter : content.chapters) {
    chapter.is_validated = chapter.validation_errors.empty();
  }
  return summary;
}

} // namespace wgen::runtime
