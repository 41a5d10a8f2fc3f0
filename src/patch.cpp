#include "hunkwise/patch.hpp"

#include "hunkwise/consts.hpp"
#include "hunkwise/error.hpp"

#include <algorithm>
#include <sstream>

namespace hunkwise::patch {

namespace {

bool needs_quoting(std::string_view path) {
  return std::ranges::any_of(path, [](char c) {
    const auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u >= 0x7f || c == '"' || c == '\\';
  });
}

std::string side_path(std::string_view prefix, const std::string &path) {
  if (path == consts::kDevNull)
    return path;
  std::string full = std::string(prefix) + path;
  return needs_quoting(full) ? quote_path(full) : full;
}

char marker_for(ChangeType type) {
  switch (type) {
  case ChangeType::Add:
    return '+';
  case ChangeType::Del:
    return '-';
  case ChangeType::Normal:
    return ' ';
  }
  return ' ';
}

} // namespace

std::string quote_path(std::string_view path) {
  static constexpr std::string_view kOctal = "01234567";
  std::string out = "\"";
  for (const char c : path) {
    const auto u = static_cast<unsigned char>(c);
    switch (c) {
    case '\a': out += "\\a"; break;
    case '\b': out += "\\b"; break;
    case '\t': out += "\\t"; break;
    case '\n': out += "\\n"; break;
    case '\v': out += "\\v"; break;
    case '\f': out += "\\f"; break;
    case '\r': out += "\\r"; break;
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    default:
      if (u < 0x20 || u >= 0x7f) {
        out += '\\';
        out += kOctal[(u >> 6) & 7];
        out += kOctal[(u >> 3) & 7];
        out += kOctal[u & 7];
      } else {
        out += c;
      }
    }
  }
  out += '"';
  return out;
}

std::string render(const FileDiff &file, const std::vector<DiffHunk> &hunks) {
  const std::string &old_path = file.is_new ? file.to : file.from;
  const std::string &new_path = file.is_deleted ? file.from : file.to;

  std::ostringstream out;
  out << consts::kDiffGitPrefix << side_path("a/", old_path) << ' ' << side_path("b/", new_path)
      << '\n';
  if (file.is_new) {
    out << consts::kNewFileMode << (file.new_mode.empty() ? "100644" : file.new_mode) << '\n';
  } else if (file.is_deleted) {
    out << consts::kDeletedFileMode << (file.old_mode.empty() ? "100644" : file.old_mode)
        << '\n';
  } else if (!file.old_mode.empty() && !file.new_mode.empty() && file.old_mode != file.new_mode) {
    out << consts::kOldMode << file.old_mode << '\n' << consts::kNewMode << file.new_mode << '\n';
  }
  if (file.is_renamed) {
    out << consts::kRenameFrom << file.from << '\n' << consts::kRenameTo << file.to << '\n';
  }
  if (hunks.empty())
    return out.str();

  out << consts::kOldFilePrefix << (file.is_new ? file.from : side_path("a/", old_path)) << '\n';
  out << consts::kNewFilePrefix << (file.is_deleted ? file.to : side_path("b/", new_path))
      << '\n';

  // Net lines added by the hunks emitted so far; dropped hunks do not shift
  // the new side of later ones.
  int delta = 0;
  for (const auto &hunk : hunks) {
    int old_count = 0;
    int new_count = 0;
    for (const auto &c : hunk.changes) {
      if (c.type != ChangeType::Add)
        ++old_count;
      if (c.type != ChangeType::Del)
        ++new_count;
    }
    // git numbers an empty side by the line before it
    const int first_old = old_count == 0 ? hunk.old_start + 1 : hunk.old_start;
    const int first_new = first_old + delta;
    const int new_start = new_count == 0 ? first_new - 1 : first_new;

    out << "@@ -" << hunk.old_start << ',' << old_count << " +" << new_start << ',' << new_count
        << " @@";
    if (!hunk.section.empty())
      out << ' ' << hunk.section;
    out << '\n';

    for (const auto &c : hunk.changes) {
      out << marker_for(c.type) << c.content << '\n';
      if (c.no_newline_at_eof)
        out << consts::kNoNewlineMarker << '\n';
    }
    delta += new_count - old_count;
  }
  return out.str();
}

std::string build(std::string_view file_path, std::string_view raw_diff,
                  const std::vector<DiffHunk> &hunks_to_keep) {
  auto files = diff::parse(raw_diff);
  const auto it = std::ranges::find_if(files, [&](const FileDiff &f) {
    return f.path() == file_path || f.from == file_path || f.to == file_path;
  });
  if (it == files.end()) {
    throw Error(ErrorKind::ChangeNotFound,
                "no diff for " + std::string(file_path) + " in the supplied patch text");
  }

  std::vector<DiffHunk> kept;
  for (const auto &hunk : it->hunks) {
    const bool wanted = std::ranges::any_of(hunks_to_keep, [&](const DiffHunk &h) {
      return h.old_start == hunk.old_start && h.new_start == hunk.new_start;
    });
    if (wanted)
      kept.push_back(hunk);
  }
  if (kept.size() != hunks_to_keep.size()) {
    throw Error(ErrorKind::ChangeNotFound,
                "requested hunk missing from the diff of " + std::string(file_path));
  }
  return render(*it, kept);
}

} // namespace hunkwise::patch
