#include "makemeld/document.hpp"

#include <algorithm>

namespace makemeld {

std::string_view op_spelling(AssignOp op) {
  switch (op) {
  case AssignOp::Recursive:
    return "=";
  case AssignOp::Immediate:
    return ":=";
  case AssignOp::Conditional:
    return "?=";
  case AssignOp::Append:
    return "+=";
  case AssignOp::Shell:
    return "!=";
  }
  return "=";
}

std::string_view op_description(AssignOp op) {
  switch (op) {
  case AssignOp::Recursive:
    return "recursive expansion";
  case AssignOp::Immediate:
    return "immediate expansion";
  case AssignOp::Conditional:
    return "conditional assignment";
  case AssignOp::Append:
    return "append";
  case AssignOp::Shell:
    return "shell assignment";
  }
  return "assignment";
}

std::string Target::key() const {
  std::string out;
  for (const auto &n : names) {
    if (!out.empty())
      out.push_back(' ');
    out += n;
  }
  return out;
}

const Target *Document::find_target(std::string_view key) const {
  const auto it = target_index_.find(key);
  return it == target_index_.end() ? nullptr : &targets_[it->second];
}

const Variable *Document::find_variable(std::string_view name) const {
  const auto it = variable_index_.find(name);
  return it == variable_index_.end() ? nullptr : &variables_[it->second];
}

const std::string *Document::help_for(std::string_view target) const {
  const auto it = help_index_.find(target);
  return it == help_index_.end() ? nullptr : &help_[it->second].description;
}

bool Document::is_phony(std::string_view name) const { return phony_index_.contains(name); }

bool Document::is_phony(const Target &target) const {
  return std::ranges::any_of(target.names,
                             [this](const std::string &n) { return is_phony(n); });
}

std::size_t Document::open_target(const std::vector<std::string> &names, bool &created) {
  Target fresh;
  fresh.names = names;
  std::string key = fresh.key();
  if (const auto it = target_index_.find(key); it != target_index_.end()) {
    created = false;
    return it->second;
  }
  created = true;
  targets_.push_back(std::move(fresh));
  target_index_.emplace(std::move(key), targets_.size() - 1);
  return targets_.size() - 1;
}

// Last write wins, but the entry keeps the position of its first assignment.
void Document::set_variable(Variable var) {
  if (const auto it = variable_index_.find(var.name); it != variable_index_.end()) {
    variables_[it->second] = std::move(var);
    return;
  }
  variable_index_.emplace(var.name, variables_.size());
  variables_.push_back(std::move(var));
}

void Document::add_phony(std::string name) {
  if (phony_index_.contains(name))
    return;
  phony_index_.emplace(name, phony_.size());
  phony_.push_back(std::move(name));
}

void Document::set_help(std::string target, std::string description) {
  if (const auto it = help_index_.find(target); it != help_index_.end()) {
    help_[it->second].description = std::move(description);
    return;
  }
  help_index_.emplace(target, help_.size());
  help_.push_back(HelpEntry{.target = std::move(target), .description = std::move(description)});
}

std::string summarize(const Document &doc) {
  const auto phony = std::ranges::count_if(
      doc.targets(), [&doc](const Target &t) { return doc.is_phony(t); });
  std::string out = std::to_string(doc.targets().size()) + " targets (" + std::to_string(phony) +
                    " phony), " + std::to_string(doc.variables().size()) + " variables, " +
                    std::to_string(doc.help_entries().size()) + " help entries";
  if (doc.default_goal())
    out += ", default goal " + *doc.default_goal();
  return out;
}

} // namespace makemeld
