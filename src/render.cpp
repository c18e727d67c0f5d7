#include "makemeld/render.hpp"

#include "makemeld/diff.hpp"
#include "makemeld/hash.hpp"
#include "makemeld/parser.hpp"
#include "makemeld/util.hpp"

#include <algorithm>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace makemeld {

namespace {

using ojson = nlohmann::ordered_json;

constexpr int kNameWidth = 20;
const std::string kRule(50, '=');

const HelpChange *find_help(const DiffResult &result, std::string_view name) {
  for (const auto &h : result.help_changes)
    if (h.target == name)
      return &h;
  return nullptr;
}

void section_header(std::ostringstream &out, std::string_view title, std::size_t count) {
  out << title << " (" << count << ")\n";
}

ojson variable_json(const Variable &v) {
  return ojson{{"operator", v.op_text.empty() ? std::string(op_spelling(v.op)) : v.op_text},
               {"value", v.value},
               {"comments", v.comments}};
}

// Body of a fenced block; the closing fence always starts on its own line.
// The fence is longer than any backtick run inside the body.
void fenced(std::ostringstream &out, std::string_view lang, std::string_view body) {
  std::size_t longest = 0;
  std::size_t run = 0;
  for (const char c : body) {
    run = c == '`' ? run + 1 : 0;
    longest = std::max(longest, run);
  }
  const std::string fence(std::max<std::size_t>(3, longest + 1), '`');
  out << fence << lang << "\n" << body;
  if (!body.empty() && body.back() != '\n')
    out << '\n';
  out << fence << "\n";
}

} // namespace

std::optional<OutputFormat> parse_output_format(std::string_view name) {
  if (name == "analysis")
    return OutputFormat::Analysis;
  if (name == "json")
    return OutputFormat::Json;
  if (name == "diff")
    return OutputFormat::Diff;
  if (name == "prompt")
    return OutputFormat::Prompt;
  return std::nullopt;
}

std::string_view to_string(OutputFormat format) {
  switch (format) {
  case OutputFormat::Analysis:
    return "analysis";
  case OutputFormat::Json:
    return "json";
  case OutputFormat::Diff:
    return "diff";
  case OutputFormat::Prompt:
    return "prompt";
  }
  return "analysis";
}

std::string render_analysis(const DiffResult &result, std::string_view source_text,
                            std::string_view target_text, const RenderOptions &opts) {
  std::ostringstream out;
  out << "Makefile Meld Analysis\n" << kRule << "\n\n";
  out << "Source: " << opts.source_label << " (" << fingerprint(source_text).describe() << ")\n";
  out << "Target: " << opts.target_label << " (" << fingerprint(target_text).describe() << ")\n\n";

  if (result.empty())
    out << "No structural differences.\n\n";

  if (!result.new_targets.empty()) {
    section_header(out, "NEW TARGETS", result.new_targets.size());
    for (const auto &name : result.new_targets) {
      out << "  * ";
      if (const auto *help = find_help(result, name))
        out << std::left << std::setw(kNameWidth) << name << " -> " << help->after;
      else
        out << name;
      out << "\n";
    }
    out << "\n";
  }

  if (!result.modified_targets.empty()) {
    section_header(out, "MODIFIED TARGETS", result.modified_targets.size());
    const Document source = parse(source_text);
    for (const auto &name : result.modified_targets) {
      const auto *t = source.find_target(name);
      const std::string deps =
          t && !t->prerequisites.empty() ? strutil::join(t->prerequisites, " ") : "(none)";
      out << "  * " << std::left << std::setw(kNameWidth) << name << " -> Dependencies: " << deps
          << "\n";
    }
    out << "\n";
  }

  if (!result.removed_targets.empty()) {
    section_header(out, "REMOVED TARGETS", result.removed_targets.size());
    for (const auto &name : result.removed_targets)
      out << "  * " << name << "\n";
    out << "\n";
  }

  if (!result.new_variables.empty()) {
    section_header(out, "NEW VARIABLES", result.new_variables.size());
    for (const auto &v : result.new_variables) {
      out << "  * " << v.name << " " << v.op_text << " " << v.value << "  ["
          << op_description(v.op) << "]\n";
    }
    out << "\n";
  }

  if (!result.changed_variables.empty()) {
    section_header(out, "CHANGED VARIABLES", result.changed_variables.size());
    for (const auto &c : result.changed_variables) {
      out << "  * " << c.name << ": " << c.before.value << " -> " << c.after.value << "\n";
      if (c.before.op != c.after.op)
        out << "    (operator changed: " << c.before.op_text << " -> " << c.after.op_text << ")\n";
    }
    out << "\n";
  }

  if (!result.new_phony.empty()) {
    section_header(out, "NEW .PHONY DECLARATIONS", result.new_phony.size());
    out << "  * " << strutil::join(result.new_phony, ", ") << "\n\n";
  }

  if (!result.help_changes.empty()) {
    section_header(out, "HELP ENTRY CHANGES", result.help_changes.size());
    for (const auto &h : result.help_changes) {
      out << "  * " << h.target << ": ";
      if (h.before)
        out << *h.before << " -> ";
      else
        out << "(new) ";
      out << h.after << "\n";
    }
    out << "\n";
  }

  if (result.default_goal) {
    out << "DEFAULT GOAL\n";
    out << "  * " << result.default_goal->before.value_or("(none)") << " -> "
        << result.default_goal->after << "\n\n";
  }

  out << kRule << "\n";
  out << "Run with --output=prompt to generate an LLM analysis prompt\n";
  out << "Run with --output=diff to see unified diff\n";
  out << "Run with --output=json for machine-readable output\n";
  return out.str();
}

std::string render_json(const DiffResult &result) {
  ojson j;
  j["new_targets"] = result.new_targets;
  j["modified_targets"] = result.modified_targets;
  j["removed_targets"] = result.removed_targets;

  ojson new_vars = ojson::object();
  for (const auto &v : result.new_variables)
    new_vars[v.name] = variable_json(v);
  j["new_variables"] = std::move(new_vars);

  ojson changed = ojson::object();
  for (const auto &c : result.changed_variables)
    changed[c.name] = ojson{{"old", variable_json(c.before)}, {"new", variable_json(c.after)}};
  j["changed_variables"] = std::move(changed);

  j["new_phony"] = result.new_phony;

  ojson help = ojson::object();
  for (const auto &h : result.help_changes)
    help[h.target] = h.after;
  j["help_changes"] = std::move(help);

  // Makefiles are not guaranteed to be UTF-8; replace bad bytes instead of throwing.
  return j.dump(2, ' ', false, ojson::error_handler_t::replace);
}

std::string render_diff(std::string_view source_text, std::string_view target_text,
                        const RenderOptions &opts) {
  return diff::unified_diff(target_text, source_text, opts.target_label, opts.source_label,
                            opts.context_lines);
}

std::string render_prompt(std::string_view source_text, std::string_view target_text,
                          const RenderOptions &opts) {
  std::ostringstream out;
  out << "I'm melding features from a source Makefile into a target Makefile.\n"
         "The source may carry targets, variables, .PHONY declarations and help entries\n"
         "that the target lacks or defines differently.\n\n";
  out << "SOURCE: " << opts.source_label << " (" << fingerprint(source_text).describe() << ")\n";
  out << "TARGET: " << opts.target_label << " (" << fingerprint(target_text).describe() << ")\n\n";

  out << "## Full Source File\n\n";
  fenced(out, "makefile", source_text);
  out << "\n## Full Target File\n\n";
  fenced(out, "makefile", target_text);

  const std::string udiff = render_diff(source_text, target_text, opts);
  out << "\n## Unified Diff (target -> source)\n\n";
  fenced(out, "diff",
         udiff.empty() ? std::string_view("(no textual differences)\n") : std::string_view(udiff));

  out << "\n## Analysis Request\n\n"
         "For each feature, evaluate:\n"
         "1. **Compatibility**: Does the target project structure support it?\n"
         "2. **Value**: Does it improve the target's workflow?\n"
         "3. **Risk**: Any naming conflicts or dependency issues?\n"
         "4. **Assignment operators**: Are `?=` vs `:=` vs `=` used correctly?\n"
         "5. **Recommendation**: Include, exclude, or modify?\n\n"
         "Please provide a structured analysis for merging these features.\n";
  return out.str();
}

std::string render(const DiffResult &result, std::string_view source_text,
                   std::string_view target_text, OutputFormat format, const RenderOptions &opts) {
  switch (format) {
  case OutputFormat::Analysis:
    return render_analysis(result, source_text, target_text, opts);
  case OutputFormat::Json:
    return render_json(result);
  case OutputFormat::Diff:
    return render_diff(source_text, target_text, opts);
  case OutputFormat::Prompt:
    return render_prompt(source_text, target_text, opts);
  }
  return render_analysis(result, source_text, target_text, opts);
}

} // namespace makemeld
