#pragma once
#include "makemeld/consts.hpp"
#include "makemeld/meld.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace makemeld {

enum class OutputFormat : std::uint8_t { Analysis, Json, Diff, Prompt };

// "analysis" | "json" | "diff" | "prompt"
auto parse_output_format(std::string_view name) -> std::optional<OutputFormat>;
auto to_string(OutputFormat format) -> std::string_view;

struct RenderOptions {
  std::string source_label = "source";
  std::string target_label = "target";
  int context_lines = consts::kDefaultContext;
};

// Sectioned report for people; empty collections are left out.
std::string render_analysis(const DiffResult& result, std::string_view source_text,
                            std::string_view target_text, const RenderOptions& opts = {});

// Object with the seven keys new_targets, modified_targets, removed_targets,
// new_variables, changed_variables, new_phony, help_changes, always present.
std::string render_json(const DiffResult& result);

// Unified diff from the target text to the source text.
std::string render_diff(std::string_view source_text, std::string_view target_text,
                        const RenderOptions& opts = {});

// Self-contained bundle for a language model: instructions, both files and
// the unified diff. Carries no structural diff on purpose.
std::string render_prompt(std::string_view source_text, std::string_view target_text,
                          const RenderOptions& opts = {});

// Dispatch on `format`.
std::string render(const DiffResult& result, std::string_view source_text,
                   std::string_view target_text, OutputFormat format,
                   const RenderOptions& opts = {});

} // namespace makemeld
