#pragma once
#include <filesystem>
#include <string>

namespace makemeld::fs {

bool exists(const std::filesystem::path& p);

// Whole file as text. Throws std::runtime_error when it cannot be opened.
std::string read_text(const std::filesystem::path& p);

} // namespace makemeld::fs
