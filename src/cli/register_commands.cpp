#include "cli/registry.hpp"

int cmd_meld(int argc, char **argv);
int cmd_inspect(int argc, char **argv);
int cmd_help(int argc, char **argv);

namespace makemeld::cli {

void register_all_commands() {
  register_command(Command{
      .name = "meld",
      .fn = ::cmd_meld,
      .summary = "Compare a source Makefile against a target Makefile",
      .usage = "usage: makemeld meld <source> <target> [-o analysis|json|diff|prompt] "
               "[-U <n>] [-v]\n"
               "\n"
               "  -o, --output <format>  report format (default: analysis, or 'output:' in "
               ".makemeld)\n"
               "  -U, --context <n>      context lines in unified diffs (default: 3)\n"
               "  -v, --verbose          print parse summaries to stderr\n",
  });
  register_command(Command{
      .name = "inspect",
      .fn = ::cmd_inspect,
      .summary = "Show the targets, variables and help entries read from a Makefile",
      .usage = "usage: makemeld inspect <file>\n",
  });
  register_command(Command{
      .name = "help",
      .fn = ::cmd_help,
      .summary = "Show this help, or the options of one command",
      .usage = "usage: makemeld help [command]\n",
  });
}

} // namespace makemeld::cli
