#include "wgen/integrity.h"

#include "wgen/documents.h"
#include "wgen/json_fields.h"
#include "wgen/schema_contract.h"

#include <algorithm>
#include <functional>
#include <set>

namespace wgen {

namespace {
std::string chapter_label(const ChapterArtifact& chapter) {
  return "chapter '" + chapter.id + "'";
}

bool has(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

std::set<std::string> keys(const ArtifactMap& map) {
  std::set<std::string> out;
  for (const auto& entry : map) {
    out.insert(entry.first);
  }
  return out;
}

std::set<std::string> known_npcs(const WorldContent& content) {
  std::set<std::string> npcs;
  for (const auto& chapter : content.chapters) {
    npcs.insert(chapter.npc_ids.begin(), chapter.npc_ids.end());
  }
  for (const auto& entry : content.rooms) {
    const auto room = room_view(entry.second);
    npcs.insert(room.npcs.begin(), room.npcs.end());
  }
  return npcs;
}

void append(std::vector<std::string>& out, std::vector<std::string> more) {
  out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}
} // namespace

std::vector<std::string> check_sequencing(const WorldContent& content) {
  std::vector<std::string> errors;
  for (size_t i = 0; i < content.chapters.size(); ++i) {
    const auto& chapter = content.chapters[i];
    const int expected = static_cast<int>(i) + 1;
    if (chapter.number != expected) {
      errors.push_back(chapter_label(chapter) + " has number " + std::to_string(chapter.number) + ", expected " +
                       std::to_string(expected));
    }
  }
  return errors;
}

std::vector<std::string> check_chapter_contents(const WorldContent& content) {
  std::vector<std::string> errors;
  for (const auto& chapter : content.chapters) {
    const auto label = chapter_label(chapter);
    if (chapter.location_ids.empty()) {
      errors.push_back(label + " has no locations");
    }
    if (chapter.quest_ids.empty()) {
      errors.push_back(label + " has no quests");
    }
    if (chapter.main_quest_ids.empty()) {
      errors.push_back(label + " has no main quests (progression blocked)");
    }
    for (const auto& main_id : chapter.main_quest_ids) {
      if (!has(chapter.quest_ids, main_id)) {
        errors.push_back(label + " main quest '" + main_id + "' not in quest list");
      }
    }
    auto check_anchor = [&](const char* what, const std::string& id) {
      if (!id.empty() && !has(chapter.location_ids, id)) {
        errors.push_back(label + " " + what + " '" + id + "' not in location list");
      }
    };
    check_anchor("hub", chapter.hub_location_id);
    check_anchor("entry", chapter.entry_location_id);
    check_anchor("exit", chapter.exit_location_id);
  }
  return errors;
}

std::vector<std::string> check_unlock_chain(const WorldContent& content) {
  std::vector<std::string> errors;
  for (size_t i = 1; i < content.chapters.size(); ++i) {
    const auto& chapter = content.chapters[i];
    const auto& previous = content.chapters[i - 1];
    const auto label = chapter_label(chapter);
    if (chapter.unlock_quest_id.empty()) {
      errors.push_back(label + " has no unlock quest defined");
      continue;
    }
    if (!has(previous.main_quest_ids, chapter.unlock_quest_id)) {
      errors.push_back(label + " unlock quest '" + chapter.unlock_quest_id +
                       "' is not a main quest of " + chapter_label(previous));
    }
    if (content.quests.count(chapter.unlock_quest_id) == 0) {
      errors.push_back(label + " unlock quest '" + chapter.unlock_quest_id + "' not found");
    }
  }
  return errors;
}

std::vector<std::string> check_references(const WorldContent& content) {
  std::vector<std::string> errors;
  const auto room_ids = keys(content.rooms);
  const auto enemy_ids = keys(content.enemies);
  const auto item_ids = keys(content.items);
  const auto npc_ids = known_npcs(content);

  for (const auto& chapter : content.chapters) {
    const auto label = chapter_label(chapter);
    for (const auto& id : chapter.location_ids) {
      if (room_ids.count(id) == 0) {
        errors.push_back(label + " references missing location '" + id + "'");
      }
    }
    auto check_anchor = [&](const char* what, const std::string& id) {
      if (!id.empty() && room_ids.count(id) == 0) {
        errors.push_back(label + " " + what + " location '" + id + "' not found");
      }
    };
    check_anchor("hub", chapter.hub_location_id);
    check_anchor("entry", chapter.entry_location_id);
    check_anchor("exit", chapter.exit_location_id);
    for (const auto& id : chapter.quest_ids) {
      if (content.quests.count(id) == 0) {
        errors.push_back(label + " references missing quest '" + id + "'");
      }
    }
    for (const auto& id : chapter.enemy_ids) {
      if (enemy_ids.count(id) == 0) {
        errors.push_back(label + " references missing enemy '" + id + "'");
      }
    }
    for (const auto& id : chapter.item_ids) {
      if (item_ids.count(id) == 0) {
        errors.push_back(label + " references missing item '" + id + "'");
      }
    }
  }

  for (const auto& entry : content.rooms) {
    const auto room = room_view(entry.second);
    for (const auto& exit : room.exits) {
      if (!exit.leads_to.empty() && room_ids.count(exit.leads_to) == 0) {
        errors.push_back("room '" + entry.first + "' exit leads to missing room '" + exit.leads_to + "'");
      }
    }
    if (room.combat && !room.combat->enemy_id.empty() && enemy_ids.count(room.combat->enemy_id) == 0) {
      errors.push_back("room '" + entry.first + "' combat references missing enemy '" + room.combat->enemy_id + "'");
    }
  }

  for (const auto& entry : content.quests) {
    const auto quest = quest_view(entry.second);
    const std::string label = "quest '" + entry.first + "'";
    if (!quest.giver_location.empty() && room_ids.count(quest.giver_location) == 0) {
      errors.push_back(label + " giver location '" + quest.giver_location + "' not found");
    }
    for (const auto& objective : quest.objectives) {
      const auto& target = objective.target_id;
      if (target.empty()) continue;
      switch (contract::objective_target_kind(objective.type)) {
        case contract::TargetKind::Room:
          if (room_ids.count(target) == 0) {
            errors.push_back(label + " objective references invalid room: " + target);
          }
          break;
        case contract::TargetKind::Npc:
          if (!npc_ids.empty() && npc_ids.count(target) == 0) {
            errors.push_back(label + " objective references unknown NPC: " + target);
          }
          break;
        case contract::TargetKind::Enemy:
          if (enemy_ids.count(target) == 0) {
            errors.push_back(label + " objective references invalid enemy: " + target);
          }
          break;
        case contract::TargetKind::Item:
          if (!item_ids.empty() && item_ids.count(target) == 0) {
            errors.push_back(label + " objective references unknown item: " + target);
          }
          break;
        case contract::TargetKind::None:
          break;
      }
    }
    for (const auto& id : quest.reveals_on_accept) {
      if (room_ids.count(id) == 0) {
        errors.push_back(label + " revealsOnAccept references invalid location: " + id);
      }
    }
    for (const auto& id : quest.reveals_on_complete) {
      if (room_ids.count(id) == 0) {
        errors.push_back(label + " revealsOnComplete references invalid location: " + id);
      }
    }
    for (const auto& id : quest.prerequisite_quests) {
      if (content.quests.count(id) == 0) {
        errors.push_back(label + " prerequisite quest not found: " + id);
      }
    }
  }
  return errors;
}

std::vector<std::vector<std::string>> find_prerequisite_cycles(
    const std::map<std::string, std::vector<std::string>>& prerequisites) {
  enum class Mark { Fresh, OnPath, Done };
  std::map<std::string, Mark> marks;
  std::vector<std::string> path;
  std::vector<std::vector<std::string>> cycles;

  std::function<void(const std::string&)> visit = [&](const std::string& id) {
    marks[id] = Mark::OnPath;
    path.push_back(id);
    auto it = prerequisites.find(id);
    if (it != prerequisites.end()) {
      for (const auto& next : it->second) {
        if (prerequisites.count(next) == 0) {
          continue;
        }
        const Mark mark = marks.count(next) ? marks[next] : Mark::Fresh;
        if (mark == Mark::OnPath) {
          auto start = std::find(path.begin(), path.end(), next);
          std::vector<std::string> cycle(start, path.end());
          cycle.push_back(next);
          cycles.push_back(std::move(cycle));
        } else if (mark == Mark::Fresh) {
          visit(next);
        }
      }
    }
    path.pop_back();
    marks[id] = Mark::Done;
  };

  for (const auto& entry : prerequisites) {
    if (!marks.count(entry.first)) {
      visit(entry.first);
    }
  }
  return cycles;
}

std::vector<std::string> check_prerequisite_cycles(const WorldContent& content) {
  std::map<std::string, std::vector<std::string>> prerequisites;
  for (const auto& entry : content.quests) {
    prerequisites[entry.first] = quest_view(entry.second).prerequisite_quests;
  }
  std::vector<std::string> errors;
  for (const auto& cycle : find_prerequisite_cycles(prerequisites)) {
    errors.push_back("quest prerequisite cycle: " + fields::join(cycle, " -> "));
  }
  return errors;
}

std::vector<std::string> check_reachability(const WorldContent& content) {
  std::vector<std::string> errors;
  for (const auto& chapter : content.chapters) {
    bool any_present = false;
    bool accessible = false;
    for (const auto& main_id : chapter.main_quest_ids) {
      auto it = content.quests.find(main_id);
      if (it == content.quests.end()) {
        continue;
      }
      any_present = true;
      const auto quest = quest_view(it->second);
      const bool blocked = std::any_of(quest.prerequisite_quests.begin(), quest.prerequisite_quests.end(),
                                       [&](const std::string& p) { return has(chapter.quest_ids, p); });
      if (!blocked) {
        accessible = true;
        break;
      }
    }
    // Missing main quest documents are reported by the reference check.
    if (any_present && !accessible) {
      errors.push_back(chapter_label(chapter) + " has no initially accessible main quest");
    }
  }
  return errors;
}

std::vector<std::string> difficulty_warnings(const WorldContent& content) {
  std::vector<std::string> warnings;
  for (const auto& chapter : content.chapters) {
    const int expected_min = chapter.difficulty.base_difficulty - 2;
    const int expected_max = chapter.difficulty.base_difficulty + 3;
    for (const auto& quest_id : chapter.quest_ids) {
      auto it = content.quests.find(quest_id);
      if (it == content.quests.end()) continue;
      const auto quest = quest_view(it->second);
      if (quest.difficulty < expected_min) {
        warnings.push_back("quest '" + quest_id + "' difficulty " + std::to_string(quest.difficulty) +
                           " is below chapter " + std::to_string(chapter.number) + " minimum (" +
                           std::to_string(expected_min) + ")");
      }
      if (quest.difficulty > expected_max && has(chapter.main_quest_ids, quest_id)) {
        warnings.push_back("main quest '" + quest_id + "' difficulty " + std::to_string(quest.difficulty) +
                           " exceeds chapter " + std::to_string(chapter.number) + " maximum (" +
                           std::to_string(expected_max) + ")");
      }
    }
  }
  return warnings;
}

std::vector<std::string> room_exit_budget_warnings(const WorldContent& content) {
  std::vector<std::string> warnings;
  for (const auto& entry : content.rooms) {
    const auto room = room_view(entry.second);
    const auto kind = room_kind_from_string(room.type).value_or(RoomKind::Navigation);
    const int limit = kind == RoomKind::Navigation ? contract::kMaxNavigationExits : contract::kMaxScopedExits;
    const int count = static_cast<int>(room.exits.size());
    if (count > limit) {
      warnings.push_back(std::string(to_string(kind)) + " room '" + entry.first + "' has " + std::to_string(count) +
                         " exits (budget " + std::to_string(limit) + ")");
    }
  }
  return warnings;
}

IntegrityReport check_integrity(const WorldContent& content) {
  IntegrityReport report;
  append(report.errors, check_sequencing(content));
  append(report.errors, check_chapter_contents(content));
  append(report.errors, check_unlock_chain(content));
  append(report.errors, check_references(content));
  append(report.errors, check_prerequisite_cycles(content));
  append(report.errors, check_reachability(content));
  append(report.warnings, difficulty_warnings(content));
  append(report.warnings, room_exit_budget_warnings(content));
  return report;
}

} // namespace wgen
