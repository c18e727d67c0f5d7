#include "cli/registry.hpp"
#include "makemeld/parser.hpp"
#include "makemeld/session.hpp"
#include "makemeld/util.hpp"

#include <iostream>
#include <string>

int cmd_inspect(int argc, char **argv) {
  if (argc != 2) {
    if (const auto *cmd = makemeld::cli::find_command("inspect"))
      std::cerr << cmd->usage;
    return 2;
  }
  try {
    const std::string text = makemeld::read_makefile(argv[1], "input");
    const makemeld::Document doc = makemeld::parse(text);
    using makemeld::strutil::join;

    std::cout << argv[1] << ": " << makemeld::summarize(doc) << "\n";
    if (!doc.targets().empty()) {
      std::cout << "\ntargets:\n";
      for (const auto &t : doc.targets()) {
        std::cout << "  " << t.key() << (doc.is_phony(t) ? " [phony]" : "") << ": "
                  << join(t.prerequisites, " ") << "\n";
        std::cout << "    recipe lines: " << t.recipe.size() << "\n";
        if (const auto *help = doc.help_for(t.key()))
          std::cout << "    help: " << *help << "\n";
      }
    }
    if (!doc.variables().empty()) {
      std::cout << "\nvariables:\n";
      for (const auto &v : doc.variables())
        std::cout << "  " << v.name << " " << v.op_text << " " << v.value << "\n";
    }
    if (!doc.phony().empty())
      std::cout << "\nphony: " << join(doc.phony(), " ") << "\n";
    if (!doc.help_entries().empty()) {
      std::cout << "\nhelp entries:\n";
      for (const auto &h : doc.help_entries())
        std::cout << "  " << h.target << ": " << h.description << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "inspect: " << e.what() << "\n";
    return 1;
  }
}
