// Small string helpers shared by the parser, renderers and settings loader
#include "makemeld/util.hpp"

#include <algorithm>

namespace makemeld::strutil {

namespace {
bool is_hspace(char c) { return c == ' ' || c == '\t' || c == '\r'; }
} // namespace

std::string_view ltrim(std::string_view sv) {
  while (!sv.empty() && is_hspace(sv.front()))
    sv.remove_prefix(1);
  return sv;
}

std::string_view rtrim(std::string_view sv) {
  while (!sv.empty() && is_hspace(sv.back()))
    sv.remove_suffix(1);
  return sv;
}

std::string_view trim(std::string_view sv) { return rtrim(ltrim(sv)); }

std::vector<std::string> split_ws(std::string_view sv) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && is_hspace(sv[i]))
      ++i;
    const std::size_t start = i;
    while (i < sv.size() && !is_hspace(sv[i]))
      ++i;
    if (i > start)
      out.emplace_back(sv.substr(start, i - start));
  }
  return out;
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i)
      out.append(sep);
    out += parts[i];
  }
  return out;
}

bool is_blank(std::string_view sv) {
  return std::ranges::all_of(sv, [](char c) { return is_hspace(c) || c == '\n'; });
}

} // namespace makemeld::strutil
