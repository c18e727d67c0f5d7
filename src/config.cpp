#include "makemeld/config.hpp"

#include "makemeld/fs.hpp"
#include "makemeld/util.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace makemeld {

std::filesystem::path settings_path(const std::filesystem::path &dir) {
  if (const char *env = std::getenv(std::string(consts::kSettingsEnv).c_str()); env && *env)
    return std::filesystem::path(env);
  return dir / consts::kSettingsFile;
}

auto load_settings(const std::filesystem::path &path) -> Settings {
  Settings out{};
  if (!fs::exists(path))
    return out;

  const std::string text = fs::read_text(path);
  std::istringstream iss(text);

  constexpr std::string_view k_output = "output:";
  constexpr std::string_view k_context = "context:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv = strutil::trim(line);
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_output)) {
      const auto value = strutil::trim(sv.substr(k_output.size()));
      const auto format = parse_output_format(value);
      if (!format)
        throw std::runtime_error(path.string() + ": unknown output format '" +
                                 std::string(value) + "'");
      out.output = *format;
    } else if (sv.starts_with(k_context)) {
      const auto value = strutil::trim(sv.substr(k_context.size()));
      int n = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
      if (ec != std::errc{} || ptr != value.data() + value.size() || n < 0)
        throw std::runtime_error(path.string() + ": bad context value '" + std::string(value) +
                                 "'");
      out.context_lines = n;
    }
  }
  return out;
}

} // namespace makemeld
