#include "makemeld/parser.hpp"

#include "makemeld/consts.hpp"
#include "makemeld/util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <regex>

namespace makemeld {

namespace {

using strutil::ltrim;
using strutil::rtrim;
using strutil::trim;

constexpr std::size_t kNoTarget = static_cast<std::size_t>(-1);

// Directives whose lines carry no structure we track.
constexpr std::array<std::string_view, 10> kIgnoredDirectives = {
    "ifeq",   "ifneq",   "ifdef",    "ifndef", "else",
    "endif",  "include", "-include", "sinclude", "vpath"};

bool ends_with_continuation(std::string_view line) {
  std::size_t n = 0;
  while (n < line.size() && line[line.size() - 1 - n] == consts::kContinuation)
    ++n;
  return n % 2 == 1;
}

std::string_view first_word(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size() && s[i] != ' ' && s[i] != '\t')
    ++i;
  return s.substr(0, i);
}

bool starts_with_word(std::string_view s, std::string_view word) {
  return first_word(s) == word;
}

bool is_identifier(std::string_view s) {
  if (s.empty())
    return false;
  return std::ranges::all_of(s, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
  });
}

// Walks `s` one character at a time, tracking $(...) and ${...} nesting,
// and calls `visit(i)` for characters outside any reference until it
// returns true. Returns that position, or npos.
template <typename Visit> std::size_t scan_outside_refs(std::string_view s, Visit visit) {
  int depth = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '$' && i + 1 < s.size()) {
      const char next = s[i + 1];
      if (next == '(' || next == '{')
        ++depth;
      ++i; // "$$" and single-letter references like $@ are skipped whole
      continue;
    }
    if (depth > 0) {
      if (c == '(' || c == '{')
        ++depth;
      else if (c == ')' || c == '}')
        --depth;
      continue;
    }
    if (visit(i))
      return i;
  }
  return std::string_view::npos;
}

// Whitespace split that keeps references such as $(patsubst %.c, %.o, $(SRCS)) whole.
std::vector<std::string> split_words(std::string_view s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  auto flush = [&](std::size_t end) {
    if (end > start)
      out.emplace_back(s.substr(start, end - start));
  };
  scan_outside_refs(s, [&](std::size_t i) {
    if (s[i] == ' ' || s[i] == '\t') {
      flush(i);
      start = i + 1;
    }
    return false;
  });
  flush(s.size());
  return out;
}

struct OpMatch {
  std::size_t pos = 0; // first character of the operator
  std::size_t len = 0;
  AssignOp op = AssignOp::Recursive;
};

// Locate an assignment operator, provided it comes before any plain colon.
std::optional<OpMatch> find_assignment_op(std::string_view s) {
  const auto i = scan_outside_refs(s, [s](std::size_t at) { return s[at] == ':' || s[at] == '='; });
  if (i == std::string_view::npos)
    return std::nullopt;
  if (s[i] == ':') {
    if (s.substr(i).starts_with("::="))
      return OpMatch{.pos = i, .len = 3, .op = AssignOp::Immediate};
    if (s.substr(i).starts_with(":="))
      return OpMatch{.pos = i, .len = 2, .op = AssignOp::Immediate};
    return std::nullopt; // rule header
  }
  if (i > 0) {
    switch (s[i - 1]) {
    case '?':
      return OpMatch{.pos = i - 1, .len = 2, .op = AssignOp::Conditional};
    case '+':
      return OpMatch{.pos = i - 1, .len = 2, .op = AssignOp::Append};
    case '!':
      return OpMatch{.pos = i - 1, .len = 2, .op = AssignOp::Shell};
    default:
      break;
    }
  }
  return OpMatch{.pos = i, .len = 1, .op = AssignOp::Recursive};
}

// `## name: description`, with the leading "##" already removed.
std::optional<HelpEntry> parse_help_comment(std::string_view rest) {
  rest = trim(rest);
  const auto colon = rest.find(':');
  if (colon == std::string_view::npos)
    return std::nullopt;
  const auto name = trim(rest.substr(0, colon));
  const auto desc = trim(rest.substr(colon + 1));
  if (name.empty() || desc.empty() || name.find_first_of(" \t") != std::string_view::npos)
    return std::nullopt;
  return HelpEntry{.target = std::string(name), .description = std::string(desc)};
}

// @printf "%-12s %s\n" "name" "description" in the recipe of a help target.
std::optional<HelpEntry> parse_help_printf(const std::string &recipe_line) {
  static const std::regex kPrintf(R"re(@printf\s+"%-\d+s\s+%s\\n"\s+"([^"]+)"\s+"([^"]*)")re");
  std::smatch m;
  if (!std::regex_search(recipe_line, m, kPrintf))
    return std::nullopt;
  std::string name = m[1].str();
  if (name == consts::kHelpHeaderName || name == consts::kHelpRuleName)
    return std::nullopt;
  return HelpEntry{.target = std::move(name), .description = m[2].str()};
}

} // namespace

std::vector<std::string> logical_lines(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  bool continuing = false;

  std::size_t start = 0;
  while (start < text.size()) {
    auto nl = text.find('\n', start);
    if (nl == std::string_view::npos)
      nl = text.size();
    std::string_view line = text.substr(start, nl - start);
    start = nl + 1;
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);

    const bool cont = ends_with_continuation(line);
    if (cont)
      line.remove_suffix(1);

    if (continuing) {
      line = ltrim(line);
      while (!cur.empty() && (cur.back() == ' ' || cur.back() == '\t'))
        cur.pop_back();
      if (!line.empty()) {
        cur.push_back(' ');
        cur.append(line);
      }
    } else {
      cur.assign(line);
    }

    if (cont) {
      continuing = true;
      continue;
    }
    out.push_back(std::move(cur));
    cur.clear();
    continuing = false;
  }
  if (continuing) // backslash on the last line
    out.push_back(std::move(cur));
  return out;
}

// Line classifier. Holds the pending comment block and the open recipe.
class Parser {
public:
  explicit Parser(Document &doc) : doc_(doc) {}

  void feed(std::string_view line) {
    if (in_define_) {
      if (starts_with_word(ltrim(line), consts::kEndef))
        in_define_ = false;
      return;
    }
    if (strutil::is_blank(line)) {
      pending_.clear();
      close_recipe();
      return;
    }
    if (line.front() == consts::kRecipePrefix) {
      if (open_ != kNoTarget)
        add_recipe(std::string(line.substr(1)));
      // else: recipe line before any rule, dropped
      pending_.clear();
      return;
    }

    close_recipe();
    const std::string_view body = ltrim(line);
    if (body.front() == consts::kCommentMarker) {
      on_comment(body);
      return;
    }
    if (starts_with_word(body, consts::kDefine)) {
      in_define_ = true;
      pending_.clear();
      return;
    }
    const auto word = first_word(body);
    const bool directive =
        std::ranges::find(kIgnoredDirectives, word) != kIgnoredDirectives.end();
    if (!directive && (try_phony(body) || try_assignment(body) || try_rule(body)))
      return;
    pending_.clear();
  }

private:
  void close_recipe() {
    open_ = kNoTarget;
    replace_recipe_ = false;
  }

  void on_comment(std::string_view body) {
    if (body.starts_with(consts::kHelpMarker)) {
      if (auto entry = parse_help_comment(body.substr(consts::kHelpMarker.size())))
        doc_.set_help(std::move(entry->target), std::move(entry->description));
    }
    pending_.emplace_back(trim(body.substr(1)));
  }

  bool try_phony(std::string_view body) {
    if (!body.starts_with(consts::kPhonyTarget))
      return false;
    auto rest = ltrim(body.substr(consts::kPhonyTarget.size()));
    if (rest.empty() || rest.front() != ':' || rest.starts_with(":="))
      return false;
    rest = rest.substr(1);
    if (const auto hash = rest.find(consts::kCommentMarker); hash != std::string_view::npos)
      rest = rest.substr(0, hash);
    for (auto &name : strutil::split_ws(rest))
      doc_.add_phony(std::move(name));
    pending_.clear();
    return true;
  }

  bool try_assignment(std::string_view body) {
    std::string_view s = body;
    for (;;) {
      const auto w = first_word(s);
      if ((w == consts::kExport || w == consts::kOverride) && w.size() < s.size()) {
        s = ltrim(s.substr(w.size()));
        continue;
      }
      break;
    }
    const auto m = find_assignment_op(s);
    if (!m)
      return false;
    const auto name = trim(s.substr(0, m->pos));
    if (!is_identifier(name))
      return false;
    const auto value = trim(s.substr(m->pos + m->len));

    if (name == consts::kDefaultGoal) {
      doc_.set_default_goal(std::string(value));
      pending_.clear();
      return true;
    }
    doc_.set_variable(Variable{.name = std::string(name),
                               .op = m->op,
                               .op_text = std::string(s.substr(m->pos, m->len)),
                               .value = std::string(value),
                               .comments = std::move(pending_)});
    pending_.clear();
    return true;
  }

  bool try_rule(std::string_view body) {
    const auto colon = scan_outside_refs(body, [body](std::size_t i) { return body[i] == ':'; });
    if (colon == std::string_view::npos)
      return false;
    auto names = split_words(body.substr(0, colon));
    if (names.empty())
      return false;

    std::size_t after = colon + 1;
    if (after < body.size() && body[after] == ':')
      ++after; // double-colon rule
    if (after < body.size() && body[after] == '=')
      return false; // assignment with a name we cannot key
    std::string_view rest = body.substr(after);

    std::optional<std::string> inline_recipe;
    const auto hash = rest.find(consts::kCommentMarker);
    const auto semi = rest.find(';');
    if (hash != std::string_view::npos && (semi == std::string_view::npos || hash < semi)) {
      const auto comment = rest.substr(hash);
      rest = rest.substr(0, hash);
      if (comment.starts_with(consts::kHelpMarker)) {
        const auto desc = trim(comment.substr(consts::kHelpMarker.size()));
        if (!desc.empty()) {
          for (const auto &n : names)
            doc_.set_help(n, std::string(desc));
        }
      }
    } else if (semi != std::string_view::npos) {
      inline_recipe = std::string(trim(rest.substr(semi + 1)));
      rest = rest.substr(0, semi);
    }

    // target: VAR = value (target-specific variable)
    if (const auto m = find_assignment_op(rest); m && is_identifier(trim(rest.substr(0, m->pos)))) {
      pending_.clear();
      return true;
    }

    bool created = false;
    open_ = doc_.open_target(names, created);
    Target &t = doc_.targets_[open_];
    auto prereqs = split_words(rest);
    if (created) {
      t.prerequisites = std::move(prereqs);
      t.comments = std::move(pending_);
    } else {
      t.prerequisites.insert(t.prerequisites.end(), std::make_move_iterator(prereqs.begin()),
                             std::make_move_iterator(prereqs.end()));
      if (t.comments.empty())
        t.comments = std::move(pending_);
    }
    pending_.clear();
    // A second rule for the same key: its recipe, if any, overrides the first.
    replace_recipe_ = !created;

    if (inline_recipe && !inline_recipe->empty())
      add_recipe(std::move(*inline_recipe));
    return true;
  }

  void add_recipe(std::string line) {
    Target &t = doc_.targets_[open_];
    if (replace_recipe_) {
      t.recipe.clear();
      replace_recipe_ = false;
    }
    if (std::ranges::find(t.names, consts::kHelpTarget) != t.names.end()) {
      if (auto entry = parse_help_printf(line))
        doc_.set_help(std::move(entry->target), std::move(entry->description));
    }
    t.recipe.push_back(std::move(line));
  }

  Document &doc_;
  std::vector<std::string> pending_; // comment block awaiting a declaration
  std::size_t open_ = kNoTarget;     // target receiving recipe lines
  bool replace_recipe_ = false;
  bool in_define_ = false;
};

Document parse(std::string_view text) {
  Document doc;
  Parser parser{doc};
  for (const auto &line : logical_lines(text))
    parser.feed(line);
  return doc;
}

} // namespace makemeld
