#include "cli/registry.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace makemeld::cli {

static std::vector<Command> &table() {
  static std::vector<Command> t;
  return t;
}

void register_command(Command cmd) {
  auto &t = table();
  const auto it =
      std::ranges::find_if(t, [&cmd](const Command &c) { return c.name == cmd.name; });
  if (it != t.end())
    *it = std::move(cmd);
  else
    t.push_back(std::move(cmd));
}

const Command *find_command(std::string_view name) {
  const auto &t = table();
  const auto it = std::ranges::find_if(t, [name](const Command &c) { return c.name == name; });
  return it == t.end() ? nullptr : &*it;
}

void print_usage(std::ostream &out) {
  std::size_t width = 0;
  for (const auto &c : table())
    width = std::max(width, c.name.size());

  out << "usage: makemeld <command> [args]\n\n";
  out << "commands:\n";
  for (const auto &c : table())
    out << "  " << c.name << std::string(width - c.name.size() + 2, ' ') << c.summary << "\n";
  out << "\nRun 'makemeld help <command>' for the options of one command.\n";
}

} // namespace makemeld::cli
