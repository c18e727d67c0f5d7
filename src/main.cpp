#include "cli/registry.hpp"

#include <iostream>
#include <string_view>

int main(int argc, char **argv) {
  makemeld::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    makemeld::cli::print_usage(std::cerr);
    return 2;
  }
  const std::string_view name = argv[1];
  if (name == "-h" || name == "--help") {
    makemeld::cli::print_usage(std::cout);
    return 0;
  }

  const auto *cmd = makemeld::cli::find_command(name);
  if (!cmd) {
    std::cerr << "makemeld: unknown command: " << name << "\n";
    makemeld::cli::print_usage(std::cerr);
    return 2;
  }
  // The handler sees argv from the subcommand name onwards.
  return cmd->fn(argc - 1, argv + 1);
}
