#include "hunkwise/diff.hpp"

#include "hunkwise/consts.hpp"

#include <algorithm>
#include <charconv>

namespace hunkwise {

std::string_view to_string(ChangeType type) {
  switch (type) {
  case ChangeType::Add:
    return "add";
  case ChangeType::Del:
    return "del";
  case ChangeType::Normal:
    return "normal";
  }
  return "normal";
}

namespace diff {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      out.emplace_back(text.substr(pos));
      break;
    }
    out.emplace_back(text.substr(pos, nl - pos));
    pos = nl + 1;
  }
  return out;
}

std::string unquote_path(std::string_view path) {
  if (path.size() < 2 || path.front() != '"' || path.back() != '"')
    return std::string(path);
  path = path.substr(1, path.size() - 2);

  std::string out;
  out.reserve(path.size());
  for (std::size_t i = 0; i < path.size(); ++i) {
    const char c = path[i];
    if (c != '\\' || i + 1 == path.size()) {
      out.push_back(c);
      continue;
    }
    const char e = path[++i];
    switch (e) {
    case 'a': out.push_back('\a'); break;
    case 'b': out.push_back('\b'); break;
    case 't': out.push_back('\t'); break;
    case 'n': out.push_back('\n'); break;
    case 'v': out.push_back('\v'); break;
    case 'f': out.push_back('\f'); break;
    case 'r': out.push_back('\r'); break;
    case '"': out.push_back('"'); break;
    case '\\': out.push_back('\\'); break;
    default:
      if (e >= '0' && e <= '7' && i + 2 < path.size()) {
        // three octal digits encode one byte (used for non-ASCII names)
        const int v = ((e - '0') << 6) | ((path[i + 1] - '0') << 3) | (path[i + 2] - '0');
        out.push_back(static_cast<char>(v));
        i += 2;
      } else {
        out.push_back('\\');
        out.push_back(e);
      }
    }
  }
  return out;
}

} // namespace diff

namespace {

// "12,4" or "12" (count defaults to 1)
bool parse_range(std::string_view s, int &start, int &count) {
  const char *first = s.data();
  const char *last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, start);
  if (ec != std::errc{})
    return false;
  if (ptr == last) {
    count = 1;
    return true;
  }
  if (*ptr != ',')
    return false;
  auto [ptr2, ec2] = std::from_chars(ptr + 1, last, count);
  return ec2 == std::errc{} && ptr2 == last;
}

// "@@ -a,b +c,d @@ section"
bool parse_hunk_header(std::string_view line, DiffHunk &hunk) {
  if (!line.starts_with(consts::kHunkPrefix))
    return false;
  line.remove_prefix(consts::kHunkPrefix.size());

  const auto close = line.find(" @@");
  if (close == std::string_view::npos)
    return false;
  const std::string_view ranges = line.substr(0, close);
  std::string_view rest = line.substr(close + 3);
  if (rest.starts_with(' '))
    rest.remove_prefix(1);

  const auto space = ranges.find(' ');
  if (space == std::string_view::npos || !ranges.starts_with('-') ||
      ranges.size() <= space + 1 || ranges[space + 1] != '+')
    return false;

  if (!parse_range(ranges.substr(1, space - 1), hunk.old_start, hunk.old_lines))
    return false;
  if (!parse_range(ranges.substr(space + 2), hunk.new_start, hunk.new_lines))
    return false;
  hunk.section = std::string(rest);
  return true;
}

// Path on a "--- " / "+++ " line: drop git's trailing tab, then unquote.
std::string header_path(std::string_view value) {
  while (!value.empty() && (value.back() == '\t' || value.back() == '\r'))
    value.remove_suffix(1);
  return diff::unquote_path(value);
}

// Read one (possibly quoted) path token from the front of `s`.
std::string take_path_token(std::string_view &s) {
  if (s.starts_with('"')) {
    std::size_t i = 1;
    while (i < s.size() && s[i] != '"') {
      i += s[i] == '\\' ? 2 : 1;
    }
    const auto end = std::min(i + 1, s.size());
    auto token = diff::unquote_path(s.substr(0, end));
    s.remove_prefix(end);
    if (s.starts_with(' '))
      s.remove_prefix(1);
    return token;
  }
  const auto space = s.find(' ');
  auto token = std::string(s.substr(0, space));
  s.remove_prefix(space == std::string_view::npos ? s.size() : space + 1);
  return token;
}

// "diff --git <old> <new>". Without prefixes both names are usually equal,
// which lets a name containing spaces be split in the middle.
void parse_diff_git_paths(std::string_view rest, FileDiff &file) {
  const auto n = rest.size();
  if (!rest.starts_with('"') && n % 2 == 1 && rest[n / 2] == ' ' &&
      rest.substr(0, n / 2) == rest.substr(n / 2 + 1)) {
    file.from = file.to = std::string(rest.substr(0, n / 2));
    return;
  }
  file.from = take_path_token(rest);
  file.to = take_path_token(rest);
}

class Parser {
public:
  std::vector<FileDiff> run(std::string_view raw) {
    for (const auto &line : diff::split_lines(raw)) {
      feed(line);
    }
    finish_file();
    return std::move(files_);
  }

private:
  std::vector<FileDiff> files_;
  bool have_file_ = false;
  bool saw_old_header_ = false;
  bool in_hunk_ = false;
  int old_remaining_ = 0;
  int new_remaining_ = 0;
  int current_old_ = 0;
  int current_new_ = 0;

  FileDiff &file() { return files_.back(); }

  void start_file() {
    finish_file();
    files_.emplace_back();
    have_file_ = true;
    saw_old_header_ = false;
    in_hunk_ = false;
  }

  void finish_file() {
    if (!have_file_)
      return;
    auto &f = file();
    if (f.is_new)
      f.from = std::string(consts::kDevNull);
    if (f.is_deleted)
      f.to = std::string(consts::kDevNull);
    f.additions = 0;
    f.deletions = 0;
    for (const auto &h : f.hunks) {
      for (const auto &c : h.changes) {
        if (c.type == ChangeType::Add)
          ++f.additions;
        else if (c.type == ChangeType::Del)
          ++f.deletions;
      }
    }
    f.is_renamed = f.from != f.to && !f.is_new && !f.is_deleted;
    have_file_ = false;
  }

  void mark_no_newline() {
    if (!have_file_ || file().hunks.empty() || file().hunks.back().changes.empty())
      return;
    file().hunks.back().changes.back().no_newline_at_eof = true;
  }

  bool hunk_open() const { return in_hunk_ && (old_remaining_ > 0 || new_remaining_ > 0); }

  // Returns false when the line does not belong to the hunk body.
  bool feed_hunk_line(const std::string &line) {
    const char marker = line.empty() ? ' ' : line[0];
    DiffChange change;
    switch (marker) {
    case '+':
      change.type = ChangeType::Add;
      change.new_line = current_new_++;
      --new_remaining_;
      break;
    case '-':
      change.type = ChangeType::Del;
      change.old_line = current_old_++;
      --old_remaining_;
      break;
    case ' ':
      change.type = ChangeType::Normal;
      change.old_line = current_old_++;
      change.new_line = current_new_++;
      --old_remaining_;
      --new_remaining_;
      break;
    default:
      return false;
    }
    change.content = line.empty() ? std::string{} : line.substr(1);
    file().hunks.back().changes.push_back(std::move(change));
    return true;
  }

  void feed(const std::string &line) {
    const std::string_view sv{line};

    if (sv.starts_with('\\') && in_hunk_) {
      mark_no_newline();
      return;
    }
    if (hunk_open()) {
      if (feed_hunk_line(line))
        return;
      in_hunk_ = false; // malformed body; fall back to header parsing
    }

    if (sv.starts_with(consts::kDiffGitPrefix)) {
      start_file();
      parse_diff_git_paths(sv.substr(consts::kDiffGitPrefix.size()), file());
      return;
    }
    if (sv.starts_with(consts::kOldFilePrefix)) {
      if (!have_file_ || saw_old_header_ || !file().hunks.empty())
        start_file();
      saw_old_header_ = true;
      in_hunk_ = false;
      auto p = header_path(sv.substr(consts::kOldFilePrefix.size()));
      if (p == consts::kDevNull)
        file().is_new = true;
      else
        file().from = std::move(p);
      return;
    }
    if (!have_file_)
      return; // preamble (e.g. commit message) before the first file

    if (sv.starts_with(consts::kNewFilePrefix) && !in_hunk_) {
      auto p = header_path(sv.substr(consts::kNewFilePrefix.size()));
      if (p == consts::kDevNull)
        file().is_deleted = true;
      else
        file().to = std::move(p);
      return;
    }
    if (sv.starts_with(consts::kHunkPrefix)) {
      DiffHunk hunk;
      if (!parse_hunk_header(sv, hunk))
        return;
      current_old_ = hunk.old_start != 0 ? hunk.old_start : 1;
      current_new_ = hunk.new_start != 0 ? hunk.new_start : 1;
      old_remaining_ = hunk.old_lines;
      new_remaining_ = hunk.new_lines;
      in_hunk_ = true;
      file().hunks.push_back(std::move(hunk));
      return;
    }
    if (in_hunk_)
      return; // trailing noise after a complete hunk

    if (sv.starts_with(consts::kNewFileMode)) {
      file().is_new = true;
      file().new_mode = std::string(sv.substr(consts::kNewFileMode.size()));
    } else if (sv.starts_with(consts::kDeletedFileMode)) {
      file().is_deleted = true;
      file().old_mode = std::string(sv.substr(consts::kDeletedFileMode.size()));
    } else if (sv.starts_with(consts::kOldMode)) {
      file().old_mode = std::string(sv.substr(consts::kOldMode.size()));
    } else if (sv.starts_with(consts::kNewMode)) {
      file().new_mode = std::string(sv.substr(consts::kNewMode.size()));
    } else if (sv.starts_with(consts::kRenameFrom)) {
      file().from = diff::unquote_path(sv.substr(consts::kRenameFrom.size()));
    } else if (sv.starts_with(consts::kRenameTo)) {
      file().to = diff::unquote_path(sv.substr(consts::kRenameTo.size()));
    } else if (sv.starts_with(consts::kBinaryFiles)) {
      file().is_binary = true;
    }
  }
};

} // namespace

namespace diff {

std::vector<FileDiff> parse(std::string_view raw) { return Parser{}.run(raw); }

} // namespace diff

} // namespace hunkwise
