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
  using makemeld::logical_lines;
  using makemeld::parse;

  expect(logical_lines("").empty(), "empty text has no lines");
  expect(logical_lines("A = 1\nB = 2\n") == strings{"A = 1", "B = 2"}, "plain lines");
  expect(logical_lines("A = 1\r\nB = 2\r\n") == strings{"A = 1", "B = 2"}, "CRLF endings");
  expect(logical_lines("A = 1\nB = 2") == strings{"A = 1", "B = 2"}, "no final newline");

  // Continuation collapses to a single space
  expect(logical_lines("A = one \\\n    two\n") == strings{"A = one two"}, "continuation joined");
  expect(logical_lines("A = x\\\n\\\n  y\n") == strings{"A = x y"}, "empty continuation line");

  // An even run of backslashes is escaped, not a continuation
  expect(logical_lines("X = a\\\\\nY = b\n") == strings{"X = a\\\\", "Y = b"},
         "escaped backslash");

  // Backslash on the very last line
  {
    const auto lines = logical_lines("A = 1 \\");
    expect(lines.size() == 1, "dangling continuation kept");
    const auto doc = parse("A = 1 \\");
    const auto *a = doc.find_variable("A");
    expect(a && a->value == "1", "dangling continuation value trimmed");
  }

  // Variable values and recipes are continuation-joined
  {
    const auto doc = parse("SRCS = a.c \\\n  b.c \\\n  c.c\n"
                           "t: one \\\n   two\n"
                           "\tgcc -c \\\n\t\tfoo.c\n"
                           "\techo done\n");
    const auto *srcs = doc.find_variable("SRCS");
    expect(srcs && srcs->value == "a.c b.c c.c", "multi-line value");
    const auto *t = doc.find_target("t");
    expect(t && t->prerequisites == strings{"one", "two"}, "multi-line prerequisites");
    expect(t && t->recipe == strings{"gcc -c foo.c", "echo done"}, "multi-line recipe command");
  }

  if (failures) {
    std::cerr << failures << " check(s) failed\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
