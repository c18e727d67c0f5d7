#include "makemeld/meld.hpp"

#include "makemeld/util.hpp"

namespace makemeld {

bool DiffResult::empty() const {
  return new_targets.empty() && modified_targets.empty() && removed_targets.empty() &&
         new_variables.empty() && changed_variables.empty() && new_phony.empty() &&
         help_changes.empty() && !default_goal;
}

namespace {

// Comments are not part of a target's identity.
bool same_rule(const Target &a, const Target &b) {
  return a.prerequisites == b.prerequisites && a.recipe == b.recipe;
}

bool same_assignment(const Variable &a, const Variable &b) {
  return a.op == b.op && strutil::trim(a.value) == strutil::trim(b.value);
}

} // namespace

DiffResult compare(const Document &source, const Document &target) {
  DiffResult out;

  for (const auto &t : source.targets()) {
    const std::string key = t.key();
    const Target *other = target.find_target(key);
    if (!other)
      out.new_targets.push_back(key);
    else if (!same_rule(t, *other))
      out.modified_targets.push_back(key);
  }
  for (const auto &t : target.targets()) {
    std::string key = t.key();
    if (!source.find_target(key))
      out.removed_targets.push_back(std::move(key));
  }

  for (const auto &v : source.variables()) {
    const Variable *other = target.find_variable(v.name);
    if (!other)
      out.new_variables.push_back(v);
    else if (!same_assignment(v, *other))
      out.changed_variables.push_back(VariableChange{.name = v.name, .before = *other, .after = v});
  }

  for (const auto &name : source.phony()) {
    if (!target.is_phony(name))
      out.new_phony.push_back(name);
  }

  // Direction is source -> target: help only the target has is not reported.
  for (const auto &entry : source.help_entries()) {
    const std::string *theirs = target.help_for(entry.target);
    if (!theirs) {
      out.help_changes.push_back(
          HelpChange{.target = entry.target, .before = std::nullopt, .after = entry.description});
    } else if (*theirs != entry.description) {
      out.help_changes.push_back(
          HelpChange{.target = entry.target, .before = *theirs, .after = entry.description});
    }
  }

  if (source.default_goal() && source.default_goal() != target.default_goal())
    out.default_goal = GoalChange{.before = target.default_goal(), .after = *source.default_goal()};

  return out;
}

} // namespace makemeld
