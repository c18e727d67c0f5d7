#include "makemeld/session.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static bool throws_with(const makemeld::MeldRequest &req, std::string_view needle) {
  try {
    (void)makemeld::meld_files(req);
  } catch (const std::runtime_error &e) {
    return std::string_view(e.what()).find(needle) != std::string_view::npos;
  }
  return false;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("makemeld_session_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  int rc = 0;
  try {
    write_file(root / "source.mk", "CC ?= clang\n"
                                   ".PHONY: lint\n"
                                   "lint: ## Run linters\n"
                                   "\truff check .\n"
                                   "build:\n"
                                   "\t$(CC) -O2 main.c\n");
    write_file(root / "target.mk", "CC ?= gcc\n"
                                   "build:\n"
                                   "\t$(CC) -O2 main.c\n");
    write_file(root / "blank.mk", "  \n\n\t\n");

    makemeld::MeldRequest req;
    req.source = root / "source.mk";
    req.target = root / "target.mk";

    // 1) json output, with parse summaries on the log stream
    {
      std::ostringstream log;
      req.format = makemeld::OutputFormat::Json;
      req.log = &log;
      const auto j = nlohmann::json::parse(makemeld::meld_files(req));
      if (j["new_targets"] != nlohmann::json::array({"lint"})) {
        std::cerr << "expected new target lint\n";
        rc = 1;
      }
      if (!j["changed_variables"].contains("CC") || !j["modified_targets"].empty()) {
        std::cerr << "expected only CC to change\n";
        rc = 1;
      }
      if (j["help_changes"]["lint"]["new"] != "Run linters") {
        std::cerr << "expected inline help for lint\n";
        rc = 1;
      }
      const std::string summary = log.str();
      if (summary.find("source: 2 targets (1 phony), 1 variables, 1 help entries\n") ==
              std::string::npos ||
          summary.find("target: 1 targets (0 phony), 1 variables, 0 help entries\n") ==
              std::string::npos) {
        std::cerr << "unexpected summary log:\n" << summary;
        rc = 1;
      }
      req.log = nullptr;
    }

    // 2) diff output labels the files by path
    {
      req.format = makemeld::OutputFormat::Diff;
      req.context_lines = 0;
      const auto d = makemeld::meld_files(req);
      const std::string head =
          "--- " + req.target.string() + "\n+++ " + req.source.string() + "\n";
      if (!d.starts_with(head)) {
        std::cerr << "diff header mismatch:\n" << d;
        rc = 1;
      }
      if (d.find("-CC ?= gcc\n+CC ?= clang\n") == std::string::npos ||
          d.find(" build:") != std::string::npos) {
        std::cerr << "unexpected zero-context diff:\n" << d;
        rc = 1;
      }
    }

    // 3) analysis names both files
    {
      req.format = makemeld::OutputFormat::Analysis;
      const auto a = makemeld::meld_files(req);
      if (a.find("Source: " + req.source.string()) == std::string::npos) {
        std::cerr << "analysis missing source label\n";
        rc = 1;
      }
    }

    // 4) missing and blank inputs are rejected
    {
      auto bad = req;
      bad.source = root / "nope.mk";
      if (!throws_with(bad, "source file not found")) {
        std::cerr << "expected missing source to throw\n";
        rc = 1;
      }
      bad = req;
      bad.target = root / "blank.mk";
      if (!throws_with(bad, "target is empty")) {
        std::cerr << "expected blank target to throw\n";
        rc = 1;
      }
      bad = req;
      bad.target = root;
      if (!throws_with(bad, "")) {
        std::cerr << "expected directory target to throw\n";
        rc = 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  if (rc == 0)
    std::cout << "OK\n";
  return rc;
}
