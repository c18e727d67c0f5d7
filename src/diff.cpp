#include "makemeld/diff.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace makemeld::diff {

std::vector<std::string> split_lines_keep(std::string_view text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < text.size()) {
    const auto nl = text.find('\n', start);
    const std::size_t end = nl == std::string_view::npos ? text.size() : nl + 1;
    out.emplace_back(text.substr(start, end - start));
    start = end;
  }
  return out;
}

namespace {

// Linear-space Myers: find the middle snake of each subproblem and recurse
// on both halves. Only two diagonal vectors are kept, shared by all levels.
class Myers {
public:
  Myers(const std::vector<std::string> &a, const std::vector<std::string> &b)
      : a_(a), b_(b), offset_(static_cast<std::ptrdiff_t>(b.size()) + 1),
        fd_(a.size() + b.size() + 3), bd_(a.size() + b.size() + 3) {}

  std::vector<Op> run() {
    compare(0, static_cast<std::ptrdiff_t>(a_.size()), 0, static_cast<std::ptrdiff_t>(b_.size()));
    return std::move(ops_);
  }

private:
  struct Split {
    std::ptrdiff_t x;
    std::ptrdiff_t y;
  };

  bool same(std::ptrdiff_t x, std::ptrdiff_t y) const {
    return a_[static_cast<std::size_t>(x)] == b_[static_cast<std::size_t>(y)];
  }
  std::ptrdiff_t &fd(std::ptrdiff_t k) { return fd_[static_cast<std::size_t>(k + offset_)]; }
  std::ptrdiff_t &bd(std::ptrdiff_t k) { return bd_[static_cast<std::size_t>(k + offset_)]; }

  void emit(Op op, std::ptrdiff_t n) { ops_.insert(ops_.end(), static_cast<std::size_t>(n), op); }

  void compare(std::ptrdiff_t xoff, std::ptrdiff_t xlim, std::ptrdiff_t yoff, std::ptrdiff_t ylim) {
    std::ptrdiff_t head = 0;
    while (xoff < xlim && yoff < ylim && same(xoff, yoff)) {
      ++xoff;
      ++yoff;
      ++head;
    }
    std::ptrdiff_t tail = 0;
    while (xlim > xoff && ylim > yoff && same(xlim - 1, ylim - 1)) {
      --xlim;
      --ylim;
      ++tail;
    }

    emit(Op::Keep, head);
    if (xoff == xlim) {
      emit(Op::Insert, ylim - yoff);
    } else if (yoff == ylim) {
      emit(Op::Delete, xlim - xoff);
    } else {
      const Split mid = middle_snake(xoff, xlim, yoff, ylim);
      compare(xoff, mid.x, yoff, mid.y);
      compare(mid.x, xlim, mid.y, ylim);
    }
    emit(Op::Keep, tail);
  }

  // Diagonal k holds points with x - y == k. The forward search starts at
  // (xoff, yoff), the backward one at (xlim, ylim); they meet on a point of
  // some shortest edit path.
  Split middle_snake(std::ptrdiff_t xoff, std::ptrdiff_t xlim, std::ptrdiff_t yoff,
                     std::ptrdiff_t ylim) {
    constexpr std::ptrdiff_t kUnreached = std::numeric_limits<std::ptrdiff_t>::max();
    const std::ptrdiff_t dmin = xoff - ylim;
    const std::ptrdiff_t dmax = xlim - yoff;
    const std::ptrdiff_t fmid = xoff - yoff;
    const std::ptrdiff_t bmid = xlim - ylim;
    std::ptrdiff_t fmin = fmid, fmax = fmid;
    std::ptrdiff_t bmin = bmid, bmax = bmid;
    const bool odd = ((fmid - bmid) & 1) != 0;

    fd(fmid) = xoff;
    bd(bmid) = xlim;

    for (;;) {
      if (fmin > dmin)
        fd(--fmin - 1) = -1;
      else
        ++fmin;
      if (fmax < dmax)
        fd(++fmax + 1) = -1;
      else
        --fmax;
      for (std::ptrdiff_t k = fmax; k >= fmin; k -= 2) {
        const std::ptrdiff_t lo = fd(k - 1);
        const std::ptrdiff_t hi = fd(k + 1);
        std::ptrdiff_t x = lo >= hi ? lo + 1 : hi;
        std::ptrdiff_t y = x - k;
        while (x < xlim && y < ylim && same(x, y)) {
          ++x;
          ++y;
        }
        fd(k) = x;
        if (odd && bmin <= k && k <= bmax && bd(k) <= x)
          return Split{.x = x, .y = y};
      }

      if (bmin > dmin)
        bd(--bmin - 1) = kUnreached;
      else
        ++bmin;
      if (bmax < dmax)
        bd(++bmax + 1) = kUnreached;
      else
        --bmax;
      for (std::ptrdiff_t k = bmax; k >= bmin; k -= 2) {
        const std::ptrdiff_t lo = bd(k - 1);
        const std::ptrdiff_t hi = bd(k + 1);
        std::ptrdiff_t x = lo < hi ? lo : hi - 1;
        std::ptrdiff_t y = x - k;
        while (x > xoff && y > yoff && same(x - 1, y - 1)) {
          --x;
          --y;
        }
        bd(k) = x;
        if (!odd && fmin <= k && k <= fmax && x <= fd(k))
          return Split{.x = x, .y = y};
      }
    }
  }

  const std::vector<std::string> &a_;
  const std::vector<std::string> &b_;
  std::ptrdiff_t offset_;
  std::vector<std::ptrdiff_t> fd_; // furthest x reached forward, per diagonal
  std::vector<std::ptrdiff_t> bd_; // smallest x reached backward, per diagonal
  std::vector<Op> ops_;
};

} // namespace

// Myers O(ND) shortest edit script: Keep, Delete (from a), Insert (from b).
// Memory is linear in the input size.
std::vector<Op> edit_script(const std::vector<std::string> &a,
                            const std::vector<std::string> &b) {
  return Myers(a, b).run();
}

namespace {

struct Row {
  Op op;
  std::size_t a; // index into a (next unconsumed line)
  std::size_t b; // index into b
};

std::string format_range(std::size_t start, std::size_t count) {
  // start is the 0-based index of the first line; an empty range names the line before it
  if (count == 1)
    return std::to_string(start + 1);
  if (count == 0)
    return std::to_string(start) + ",0";
  return std::to_string(start + 1) + "," + std::to_string(count);
}

void emit_line(std::ostringstream &out, char tag, const std::string &line) {
  out << tag;
  if (!line.empty() && line.back() == '\n') {
    out << line;
  } else {
    out << line << '\n' << consts::kNoNewline << '\n';
  }
}

} // namespace

std::string unified_diff(std::string_view from_text, std::string_view to_text,
                         std::string_view from_label, std::string_view to_label, int context) {
  const auto a = split_lines_keep(from_text);
  const auto b = split_lines_keep(to_text);
  const auto ops = edit_script(a, b);
  const std::size_t ctx = context < 0 ? 0 : static_cast<std::size_t>(context);

  std::vector<Row> rows;
  rows.reserve(ops.size());
  std::size_t ia = 0;
  std::size_t ib = 0;
  for (const Op op : ops) {
    rows.push_back(Row{.op = op, .a = ia, .b = ib});
    if (op != Op::Insert)
      ++ia;
    if (op != Op::Delete)
      ++ib;
  }

  std::ostringstream out;
  bool header = false;
  const std::size_t n = rows.size();
  std::size_t i = 0;
  for (;;) {
    std::size_t c = i;
    while (c < n && rows[c].op == Op::Keep)
      ++c;
    if (c >= n)
      break;

    // Grow the hunk while the unchanged gap between changes fits in 2*ctx.
    const std::size_t begin = c >= ctx ? c - ctx : 0;
    std::size_t last_change = c;
    std::size_t j = c;
    while (j < n) {
      if (rows[j].op != Op::Keep) {
        last_change = j++;
        continue;
      }
      std::size_t k = j;
      while (k < n && rows[k].op == Op::Keep)
        ++k;
      if (k == n || k - j > 2 * ctx)
        break;
      j = k;
    }
    const std::size_t end = std::min(n, last_change + 1 + ctx);

    if (!header) {
      out << "--- " << from_label << "\n";
      out << "+++ " << to_label << "\n";
      header = true;
    }
    std::size_t a_count = 0;
    std::size_t b_count = 0;
    for (std::size_t r = begin; r < end; ++r) {
      if (rows[r].op != Op::Insert)
        ++a_count;
      if (rows[r].op != Op::Delete)
        ++b_count;
    }
    out << "@@ -" << format_range(rows[begin].a, a_count) << " +"
        << format_range(rows[begin].b, b_count) << " @@\n";
    for (std::size_t r = begin; r < end; ++r) {
      switch (rows[r].op) {
      case Op::Keep:
        emit_line(out, ' ', a[rows[r].a]);
        break;
      case Op::Delete:
        emit_line(out, '-', a[rows[r].a]);
        break;
      case Op::Insert:
        emit_line(out, '+', b[rows[r].b]);
        break;
      }
    }
    i = end;
  }
  return out.str();
}

namespace {

std::size_t parse_number(std::string_view &s) {
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{})
    throw std::runtime_error("malformed hunk header");
  s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));
  return value;
}

// "-12,3" or "+7" -> start/count
void parse_range(std::string_view &s, char sign, std::size_t &start, std::size_t &count) {
  if (s.empty() || s.front() != sign)
    throw std::runtime_error("malformed hunk header");
  s.remove_prefix(1);
  start = parse_number(s);
  count = 1;
  if (!s.empty() && s.front() == ',') {
    s.remove_prefix(1);
    count = parse_number(s);
  }
}

} // namespace

std::string apply_patch(std::string_view original, std::string_view patch) {
  const auto lines = split_lines_keep(original);
  const auto hunk_lines = split_lines_keep(patch);
  std::string result;
  std::size_t pos = 0; // next unconsumed line of `original`

  std::size_t p = 0;
  while (p < hunk_lines.size()) {
    std::string_view hl = hunk_lines[p];
    if (!hl.starts_with("@@ ")) {
      ++p; // file headers
      continue;
    }
    hl.remove_prefix(3);
    std::size_t from_start = 0, from_count = 0, to_start = 0, to_count = 0;
    parse_range(hl, '-', from_start, from_count);
    if (hl.empty() || hl.front() != ' ')
      throw std::runtime_error("malformed hunk header");
    hl.remove_prefix(1);
    parse_range(hl, '+', to_start, to_count);
    ++p;

    if (from_count > 0 && from_start == 0)
      throw std::runtime_error("malformed hunk header");
    const std::size_t at = from_count == 0 ? from_start : from_start - 1;
    if (at < pos || at > lines.size())
      throw std::runtime_error("hunk out of order");
    for (; pos < at; ++pos)
      result += lines[pos];

    while (from_count > 0 || to_count > 0) {
      if (p >= hunk_lines.size())
        throw std::runtime_error("truncated hunk");
      const std::string &raw = hunk_lines[p++];
      const char tag = raw == "\n" ? ' ' : raw.front();
      std::string content = raw == "\n" ? raw : raw.substr(1);
      if (p < hunk_lines.size() && hunk_lines[p].starts_with('\\')) {
        if (!content.empty() && content.back() == '\n')
          content.pop_back();
        ++p;
      }
      switch (tag) {
      case ' ':
      case '-':
        if (pos >= lines.size() || lines[pos] != content || from_count == 0)
          throw std::runtime_error("hunk does not apply at line " + std::to_string(pos + 1));
        if (tag == ' ') {
          if (to_count == 0)
            throw std::runtime_error("hunk line counts disagree");
          result += content;
          --to_count;
        }
        ++pos;
        --from_count;
        break;
      case '+':
        if (to_count == 0)
          throw std::runtime_error("hunk line counts disagree");
        result += content;
        --to_count;
        break;
      default:
        throw std::runtime_error("unexpected line in hunk");
      }
    }
  }
  for (; pos < lines.size(); ++pos)
    result += lines[pos];
  return result;
}

} // namespace makemeld::diff
