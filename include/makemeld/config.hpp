#pragma once
#include "makemeld/consts.hpp"
#include "makemeld/render.hpp"

#include <filesystem>

namespace makemeld {

struct Settings {
  OutputFormat output = OutputFormat::Analysis;
  int context_lines = consts::kDefaultContext;
};

// $MAKEMELD_CONFIG when set, else <dir>/.makemeld
auto settings_path(const std::filesystem::path& dir) -> std::filesystem::path;

// Read "key: value" settings (output, context). Defaults if the file is missing;
// unknown keys are skipped, bad values throw std::runtime_error.
auto load_settings(const std::filesystem::path& path) -> Settings;

} // namespace makemeld
