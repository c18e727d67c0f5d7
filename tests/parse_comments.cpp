// Comments attach to the declaration directly below them, with no blank line
// in between. Anything else in between (a blank line, an unknown directive)
// drops the pending block.
#include "makemeld/parser.hpp"

#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool ok, const std::string &what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

using strings = std::vector<std::string>;

int main() {
  using makemeld::parse;

  {
    const char *text = "# Compiler to use\n"
                       "  # (override on the command line)\n"
                       "CC = gcc\n"
                       "\n"
                       "# stray comment\n"
                       "\n"
                       "## build: Build everything\n"
                       "# Build the app\n"
                       "build: app\n"
                       "\tmake app\n"
                       "\t# passed to the shell\n"
                       "\n"
                       "## deploy: Ship it\n"
                       ".PHONY: deploy\n"
                       "deploy:\n"
                       "\t./deploy.sh\n"
                       "\n"
                       "# about the include\n"
                       "include extra.mk\n"
                       "LATE = 1\n";
    const auto doc = parse(text);

    const auto *cc = doc.find_variable("CC");
    expect(cc && cc->comments == strings{"Compiler to use", "(override on the command line)"},
           "comment block above a variable");

    const auto *build = doc.find_target("build");
    expect(build && build->comments == strings{"# build: Build everything", "Build the app"},
           "comment block above a rule, help line included");
    expect(build && build->recipe == strings{"make app", "# passed to the shell"},
           "tab-indented comment inside a recipe is a recipe line");

    const auto *deploy = doc.find_target("deploy");
    expect(deploy && deploy->comments.empty(), ".PHONY consumes the pending comments");

    const auto *late = doc.find_variable("LATE");
    expect(late && late->comments.empty(), "unknown directive drops pending comments");

    expect(doc.help_entries().size() == 2, "two help entries");
    const auto *h_build = doc.help_for("build");
    const auto *h_deploy = doc.help_for("deploy");
    expect(h_build && *h_build == "Build everything", "## help for build");
    expect(h_deploy && *h_deploy == "Ship it", "## help for deploy");
  }

  // A blank line separates a comment from the next declaration
  {
    const auto doc = parse("# about X\n\nX = 1\n");
    const auto *x = doc.find_variable("X");
    expect(x && x->comments.empty(), "blank line resets comments");
  }

  // Help entries: recorded without a matching target, last write wins
  {
    const auto doc = parse("## ghost: No such target\n## x: one\n## x: two\n## Not help\n");
    expect(doc.help_entries().size() == 2, "ghost and x");
    const auto *ghost = doc.help_for("ghost");
    const auto *x = doc.help_for("x");
    expect(ghost && *ghost == "No such target", "help without target");
    expect(x && *x == "two", "last help wins");
    expect(doc.help_entries()[1].target == "x", "help keeps first position");
  }

  // Inline "## description" on the rule header
  {
    const auto doc = parse("test lint: ## Run the checks\n\tpytest\n");
    const auto *test = doc.help_for("test");
    const auto *lint = doc.help_for("lint");
    expect(test && *test == "Run the checks" && lint && *lint == "Run the checks",
           "inline help applies to each name");
    const auto *rule = doc.find_target("test lint");
    expect(rule && rule->prerequisites.empty(), "inline help is not a prerequisite");
  }

  // printf table in the recipe of a help target
  {
    const char *text = "help:\n"
                       "\t@printf \"%-12s %s\\n\" \"Target\" \"Description\"\n"
                       "\t@printf \"%-12s %s\\n\" \"------\" \"-----------\"\n"
                       "\t@printf \"%-12s %s\\n\" \"check\" \"Lint sources.\"\n"
                       "\t@printf \"%-12s %s\\n\" \"test\" \"Run tests with coverage.\"\n"
                       "\n"
                       "other:\n"
                       "\t@printf \"%-12s %s\\n\" \"nope\" \"Not a help target.\"\n";
    const auto doc = parse(text);
    const auto *check = doc.help_for("check");
    const auto *test = doc.help_for("test");
    expect(check && *check == "Lint sources.", "printf help entry");
    expect(test && *test == "Run tests with coverage.", "second printf help entry");
    expect(!doc.help_for("Target") && !doc.help_for("------"), "table header skipped");
    expect(!doc.help_for("nope"), "printf outside help target ignored");
  }

  if (failures) {
    std::cerr << failures << " check(s) failed\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
