#pragma once
#include "makemeld/consts.hpp"
#include "makemeld/render.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace makemeld {

struct MeldRequest {
  std::filesystem::path source; // Makefile carrying the features
  std::filesystem::path target; // Makefile to meld them into
  OutputFormat format = OutputFormat::Analysis;
  int context_lines = consts::kDefaultContext;
  std::ostream* log = nullptr; // parse summaries, when set
};

// Read both files, compare them and render in the requested format.
// Missing, unreadable or empty input files throw std::runtime_error.
auto meld_files(const MeldRequest& request) -> std::string;

// Read a Makefile for melding; the same checks as meld_files().
auto read_makefile(const std::filesystem::path& path, std::string_view role) -> std::string;

} // namespace makemeld
