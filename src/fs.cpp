#include "makemeld/fs.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace makemeld::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

std::string read_text(const std::filesystem::path &p) {
  std::error_code ec;
  if (std::filesystem::is_directory(p, ec))
    throw std::runtime_error("is a directory: " + p.string());

  std::ifstream ifs(p, std::ios::binary);
  if (!ifs)
    throw std::runtime_error("cannot open " + p.string());
  std::string text{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
  if (ifs.bad())
    throw std::runtime_error("read failed: " + p.string());
  return text;
}

} // namespace makemeld::fs
