#pragma once
#include "makemeld/document.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace makemeld {

// Parse Makefile text into a Document.
// Best effort: constructs that are not understood (orphaned recipe lines,
// conditionals, include, define blocks) are skipped, never reported.
[[nodiscard]] auto parse(std::string_view text) -> Document;

// Split text into logical lines. A physical line ending in an unescaped
// backslash is joined with the next one; the break collapses to one space.
auto logical_lines(std::string_view text) -> std::vector<std::string>;

} // namespace makemeld
