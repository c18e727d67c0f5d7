#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace makemeld {

// Assignment flavours recognized in a Makefile.
enum class AssignOp : std::uint8_t {
  Recursive,   // =
  Immediate,   // := or ::=
  Conditional, // ?=
  Append,      // +=
  Shell        // !=
};

// Canonical spelling ("=", ":=", ...) and a short human description.
auto op_spelling(AssignOp op) -> std::string_view;
auto op_description(AssignOp op) -> std::string_view;

struct Variable {
  std::string name;
  AssignOp op = AssignOp::Recursive;
  std::string op_text;               // operator as written (keeps "::=" distinct from ":=")
  std::string value;                 // continuation-joined, trimmed
  std::vector<std::string> comments; // comment block directly above the assignment
};

struct Target {
  std::vector<std::string> names; // composite key, order as written
  std::vector<std::string> prerequisites;
  std::vector<std::string> recipe; // leading tab removed
  std::vector<std::string> comments;

  // Name key as printed everywhere: names joined by a single space.
  [[nodiscard]] auto key() const -> std::string;
};

struct HelpEntry {
  std::string target;
  std::string description;
};

class Parser; // fwd, the only writer of a Document

// Parsed form of one Makefile. Built once by parse() and read-only afterwards.
// All collections iterate in file order (first appearance).
class Document {
public:
  [[nodiscard]] const std::vector<Target> &targets() const { return targets_; }
  [[nodiscard]] const std::vector<Variable> &variables() const { return variables_; }
  [[nodiscard]] const std::vector<std::string> &phony() const { return phony_; }
  [[nodiscard]] const std::vector<HelpEntry> &help_entries() const { return help_; }
  [[nodiscard]] const std::optional<std::string> &default_goal() const { return default_goal_; }

  [[nodiscard]] auto find_target(std::string_view key) const -> const Target *;
  [[nodiscard]] auto find_variable(std::string_view name) const -> const Variable *;
  [[nodiscard]] auto help_for(std::string_view target) const -> const std::string *;

  [[nodiscard]] auto is_phony(std::string_view name) const -> bool;
  // True iff any of the target's names was declared .PHONY.
  [[nodiscard]] auto is_phony(const Target &target) const -> bool;

private:
  friend class Parser;

  // Returns the index of the target with this key, creating it when absent.
  // `created` reports whether a new entry was appended.
  auto open_target(const std::vector<std::string> &names, bool &created) -> std::size_t;
  void set_variable(Variable var);
  void add_phony(std::string name);
  void set_help(std::string target, std::string description);
  void set_default_goal(std::string goal) { default_goal_ = std::move(goal); }

  std::vector<Target> targets_;
  std::vector<Variable> variables_;
  std::vector<std::string> phony_;
  std::vector<HelpEntry> help_;
  std::optional<std::string> default_goal_;

  // name/key -> position in the vectors above
  std::map<std::string, std::size_t, std::less<>> target_index_;
  std::map<std::string, std::size_t, std::less<>> variable_index_;
  std::map<std::string, std::size_t, std::less<>> phony_index_;
  std::map<std::string, std::size_t, std::less<>> help_index_;
};

// One-line count summary, e.g. "5 targets (3 phony), 2 variables, 4 help entries".
auto summarize(const Document &doc) -> std::string;

} // namespace makemeld
