#pragma once
#include "makemeld/consts.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace makemeld::diff {

enum class Op : std::uint8_t { Keep, Delete, Insert };

// Split keeping each line's terminator; a final line without '\n' stays bare.
std::vector<std::string> split_lines_keep(std::string_view text);

// Shortest edit script turning `a` into `b` (Myers O(ND), linear space).
std::vector<Op> edit_script(const std::vector<std::string>& a,
                            const std::vector<std::string>& b);

// Unified diff turning `from_text` into `to_text`, with `context` lines
// around each change. Identical inputs give an empty string.
std::string unified_diff(std::string_view from_text, std::string_view to_text,
                         std::string_view from_label, std::string_view to_label,
                         int context = consts::kDefaultContext);

// Apply a unified diff (as produced above) to the text it was made from.
// Throws std::runtime_error when a hunk does not match `original`.
std::string apply_patch(std::string_view original, std::string_view patch);

} // namespace makemeld::diff
