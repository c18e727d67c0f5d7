#include "cli/registry.hpp"

#include <iostream>

int cmd_help(int argc, char **argv) {
  if (argc < 2) {
    makemeld::cli::print_usage(std::cout);
    return 0;
  }
  const auto *cmd = makemeld::cli::find_command(argv[1]);
  if (!cmd) {
    std::cerr << "help: unknown command: " << argv[1] << "\n";
    return 2;
  }
  std::cout << cmd->usage;
  return 0;
}
