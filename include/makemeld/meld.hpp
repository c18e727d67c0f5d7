#pragma once
#include "makemeld/document.hpp"

#include <optional>
#include <string>
#include <vector>

namespace makemeld {

// A variable present in both documents with a different operator or value.
struct VariableChange {
  std::string name;
  Variable before; // target's
  Variable after;  // source's
};

// Help text the target lacks (`before` empty) or carries a stale version of.
struct HelpChange {
  std::string target;
  std::optional<std::string> before;
  std::string after;
};

struct GoalChange {
  std::optional<std::string> before;
  std::string after;
};

// What the source Makefile has that the target is missing or has differently.
// Target collections hold name keys (Target::key()). Every sequence follows
// source file order, except removed_targets which follows target file order.
struct DiffResult {
  std::vector<std::string> new_targets;
  std::vector<std::string> modified_targets;
  std::vector<std::string> removed_targets;
  std::vector<Variable> new_variables;
  std::vector<VariableChange> changed_variables;
  std::vector<std::string> new_phony;
  std::vector<HelpChange> help_changes;

  // Not part of the seven reported collections; set when the source declares a
  // .DEFAULT_GOAL the target does not share.
  std::optional<GoalChange> default_goal;

  [[nodiscard]] auto empty() const -> bool;
};

// Structural comparison of `source` against `target`. Pure; never throws on
// well-formed documents.
[[nodiscard]] auto compare(const Document& source, const Document& target) -> DiffResult;

} // namespace makemeld
