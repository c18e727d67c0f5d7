#pragma once
#include <ostream>
#include <string_view>
#include "cli/command.hpp"

namespace makemeld::cli {

void register_command(Command cmd);
// nullptr when no command of that name was registered
const Command *find_command(std::string_view name);
// Command list, in registration order.
void print_usage(std::ostream &out);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace makemeld::cli
