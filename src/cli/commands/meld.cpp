#include "cli/registry.hpp"
#include "makemeld/config.hpp"
#include "makemeld/render.hpp"
#include "makemeld/session.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

static void usage(std::ostream &out) {
  if (const auto *cmd = makemeld::cli::find_command("meld"))
    out << cmd->usage;
}

static bool parse_context(std::string_view s, int &out) {
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size() && out >= 0;
}

int cmd_meld(int argc, char **argv) {
  makemeld::Settings settings;
  try {
    settings = makemeld::load_settings(makemeld::settings_path(std::filesystem::current_path()));
  } catch (const std::exception &e) {
    std::cerr << "meld: " << e.what() << "\n";
    return 1;
  }

  makemeld::MeldRequest req;
  req.format = settings.output;
  req.context_lines = settings.context_lines;
  bool verbose = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    std::string value;
    bool is_output = false;
    bool is_context = false;
    if ((a == "-o" || a == "--output") && i + 1 < argc) {
      is_output = true;
      value = argv[++i];
    } else if (a.starts_with("--output=")) {
      is_output = true;
      value = a.substr(9);
    } else if ((a == "-U" || a == "--context") && i + 1 < argc) {
      is_context = true;
      value = argv[++i];
    } else if (a.starts_with("--context=")) {
      is_context = true;
      value = a.substr(10);
    } else if (a == "-v" || a == "--verbose") {
      verbose = true;
    } else if (a == "-h" || a == "--help") {
      usage(std::cout);
      return 0;
    } else if (a == "-o" || a == "--output" || a == "-U" || a == "--context") {
      std::cerr << "meld: option " << a << " needs a value\n";
      usage(std::cerr);
      return 2;
    } else if (a.starts_with("-") && a.size() > 1) {
      std::cerr << "meld: unknown option " << a << "\n";
      usage(std::cerr);
      return 2;
    } else {
      positional.push_back(a);
    }

    if (is_output) {
      const auto format = makemeld::parse_output_format(value);
      if (!format) {
        std::cerr << "meld: unknown output format '" << value << "'\n";
        usage(std::cerr);
        return 2;
      }
      req.format = *format;
    } else if (is_context && !parse_context(value, req.context_lines)) {
      std::cerr << "meld: bad context value '" << value << "'\n";
      usage(std::cerr);
      return 2;
    }
  }

  if (positional.size() != 2) {
    usage(std::cerr);
    return 2;
  }
  req.source = positional[0];
  req.target = positional[1];
  if (verbose)
    req.log = &std::cerr;

  try {
    std::string out = makemeld::meld_files(req);
    std::cout << out;
    if (!out.empty() && out.back() != '\n')
      std::cout << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "meld: " << e.what() << "\n";
    return 1;
  }
}
