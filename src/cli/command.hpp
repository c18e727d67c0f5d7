#pragma once
#include <string>

namespace makemeld::cli {

// Handler receives argv starting at the subcommand name; returns the exit code.
using command_fn = int (*)(int argc, char **argv);

struct Command {
  std::string name;
  command_fn fn = nullptr;
  std::string summary; // one line for the command list
  std::string usage;   // full synopsis, printed by `help <name>` and on bad arguments
};

} // namespace makemeld::cli
