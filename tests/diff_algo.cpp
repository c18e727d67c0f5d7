#include "makemeld/diff.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static std::size_t count_of(const std::string &hay, const std::string &needle) {
  std::size_t n = 0;
  for (auto pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1))
    ++n;
  return n;
}

static std::string numbered(int from, int to) {
  std::string out;
  for (int i = from; i <= to; ++i)
    out += "line" + std::to_string(i) + "\n";
  return out;
}

int main() {
  using makemeld::diff::apply_patch;
  using makemeld::diff::edit_script;
  using makemeld::diff::Op;
  using makemeld::diff::split_lines_keep;
  using makemeld::diff::unified_diff;

  const char* A = "line1\nline2\nline3\n";
  const char* B = "line1\nlineZ\nline3\nline4\n";
  auto ud = unified_diff(A, B, "a/demo.txt", "b/demo.txt");
  if (ud.find("--- a/demo.txt\n") != 0) { std::cerr << "missing header\n"; return 1; }
  if (ud.find("+++ b/demo.txt\n") == std::string::npos) { std::cerr << "missing header2\n"; return 1; }
  if (ud.find("@@ -1,3 +1,4 @@\n") == std::string::npos) { std::cerr << "bad hunk header\n"; return 1; }
  if (ud.find("-line2\n") == std::string::npos) { std::cerr << "missing deletion\n"; return 1; }
  if (ud.find("+lineZ\n") == std::string::npos) { std::cerr << "missing addition\n"; return 1; }
  if (ud.find("+line4\n") == std::string::npos) { std::cerr << "missing trailing addition\n"; return 1; }
  if (apply_patch(A, ud) != B) { std::cerr << "patch does not reproduce B\n"; return 1; }

  if (!unified_diff(A, A, "x", "y").empty()) { std::cerr << "identical texts must diff empty\n"; return 1; }

  // Minimal edit script
  {
    const std::vector<std::string> a{"a", "b", "c"};
    const std::vector<std::string> b{"a", "c"};
    const auto ops = edit_script(a, b);
    const auto edits = std::ranges::count_if(ops, [](Op op) { return op != Op::Keep; });
    if (ops.size() != 3 || edits != 1) { std::cerr << "edit script not minimal\n"; return 1; }
  }

  // Context is limited to three lines around a change
  {
    const std::string from = numbered(1, 20);
    std::string to = from;
    to.replace(to.find("line10\n"), 7, "changed\n");
    const auto d = unified_diff(from, to, "f", "t");
    if (d.find("@@ -7,7 +7,7 @@\n") == std::string::npos) { std::cerr << "context window\n" << d; return 1; }
    if (d.find(" line6\n") != std::string::npos || d.find(" line14\n") != std::string::npos) {
      std::cerr << "too much context\n";
      return 1;
    }
    if (apply_patch(from, d) != to) { std::cerr << "context patch does not apply\n"; return 1; }
  }

  // Distant changes give separate hunks, close ones share a hunk
  {
    const std::string from = numbered(1, 20);
    std::string far = from;
    far.replace(far.find("line2\n"), 6, "two\n");
    far.replace(far.find("line18\n"), 7, "eighteen\n");
    const auto d1 = unified_diff(from, far, "f", "t");
    if (count_of(d1, "@@ -") != 2) { std::cerr << "expected two hunks\n" << d1; return 1; }
    if (apply_patch(from, d1) != far) { std::cerr << "two-hunk patch does not apply\n"; return 1; }

    std::string near = from;
    near.replace(near.find("line5\n"), 6, "five\n");
    near.replace(near.find("line9\n"), 6, "nine\n");
    const auto d2 = unified_diff(from, near, "f", "t");
    if (count_of(d2, "@@ -") != 1) { std::cerr << "expected one merged hunk\n" << d2; return 1; }
  }

  // Missing final newline is marked and survives the round trip
  {
    const char *from = "a\nb";
    const char *to = "a\nb\n";
    const auto d = unified_diff(from, to, "f", "t");
    if (d.find("\\ No newline at end of file\n") == std::string::npos) {
      std::cerr << "missing no-newline marker\n";
      return 1;
    }
    if (apply_patch(from, d) != to || apply_patch(to, unified_diff(to, from, "t", "f")) != from) {
      std::cerr << "no-newline round trip\n";
      return 1;
    }
  }

  // Insertion into an empty file
  {
    const auto d = unified_diff("", "x\n", "f", "t");
    if (d.find("@@ -0,0 +1 @@\n") == std::string::npos) { std::cerr << "empty-file hunk\n" << d; return 1; }
    if (apply_patch("", d) != "x\n") { std::cerr << "empty-file patch\n"; return 1; }
  }

  // A patch against the wrong text is rejected
  {
    bool threw = false;
    try {
      (void)apply_patch("something else\n", ud);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) { std::cerr << "mismatched patch should throw\n"; return 1; }
  }

  // Large inputs: unrelated files and scattered edits stay minimal and cheap
  {
    std::vector<std::string> a;
    std::vector<std::string> b;
    for (int i = 0; i < 3000; ++i) {
      a.push_back("old" + std::to_string(i) + "\n");
      b.push_back("new" + std::to_string(i) + "\n");
    }
    const auto ops = edit_script(a, b);
    if (ops.size() != 6000 || std::ranges::count(ops, Op::Delete) != 3000 ||
        std::ranges::count(ops, Op::Insert) != 3000) {
      std::cerr << "unrelated inputs: unexpected edit script\n";
      return 1;
    }

    const std::string from = numbered(1, 2000);
    std::string to;
    for (int i = 1; i <= 2000; ++i)
      to += (i % 10 == 0 ? "edited" : "line") + std::to_string(i) + "\n";
    const auto lines_from = split_lines_keep(from);
    const auto lines_to = split_lines_keep(to);
    const auto scattered = edit_script(lines_from, lines_to);
    if (std::ranges::count(scattered, Op::Keep) != 1800 ||
        std::ranges::count(scattered, Op::Delete) != 200 ||
        std::ranges::count(scattered, Op::Insert) != 200) {
      std::cerr << "scattered edits: edit script not minimal\n";
      return 1;
    }
    if (apply_patch(from, unified_diff(from, to, "f", "t", 1)) != to) {
      std::cerr << "scattered edits: patch does not apply\n";
      return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
