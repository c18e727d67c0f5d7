#include "makemeld/session.hpp"

#include "makemeld/fs.hpp"
#include "makemeld/meld.hpp"
#include "makemeld/parser.hpp"
#include "makemeld/util.hpp"

#include <stdexcept>

namespace makemeld {

std::string read_makefile(const std::filesystem::path &path, std::string_view role) {
  if (!fs::exists(path))
    throw std::runtime_error(std::string(role) + " file not found: " + path.string());
  std::string text = fs::read_text(path);
  if (strutil::is_blank(text))
    throw std::runtime_error(std::string(role) + " is empty: " + path.string());
  return text;
}

std::string meld_files(const MeldRequest &request) {
  const std::string source_text = read_makefile(request.source, "source");
  const std::string target_text = read_makefile(request.target, "target");

  const Document source = parse(source_text);
  const Document target = parse(target_text);
  if (request.log) {
    *request.log << "source: " << summarize(source) << "\n";
    *request.log << "target: " << summarize(target) << "\n";
  }
  const DiffResult result = compare(source, target);

  RenderOptions opts;
  opts.source_label = request.source.string();
  opts.target_label = request.target.string();
  opts.context_lines = request.context_lines;
  return render(result, source_text, target_text, request.format, opts);
}

} // namespace makemeld
