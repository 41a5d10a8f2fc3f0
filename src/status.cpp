#include "hunkwise/status.hpp"

#include "hunkwise/repo.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

namespace hunkwise {

namespace {

std::optional<ChangeKind> kind_from_code(char code) {
  switch (code) {
  case 'A':
    return ChangeKind::Added;
  case 'M':
  case 'T':
    return ChangeKind::Modified;
  case 'D':
    return ChangeKind::Deleted;
  case 'R':
  case 'C':
    return ChangeKind::Renamed;
  default:
    return std::nullopt;
  }
}

// Both sides touched by a merge: DD AU UD UA DU AA UU
bool is_unmerged(char x, char y) {
  return x == 'U' || y == 'U' || (x == 'A' && y == 'A') || (x == 'D' && y == 'D');
}

} // namespace

Status parse_porcelain(std::string_view z) {
  Status st;

  std::vector<std::string_view> entries;
  while (!z.empty()) {
    const auto nul = z.find('\0');
    entries.push_back(z.substr(0, nul));
    z.remove_prefix(nul == std::string_view::npos ? z.size() : nul + 1);
  }

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto e = entries[i];
    if (e.size() < 4)
      continue;
    const char x = e[0];
    const char y = e[1];
    const std::string path{e.substr(3)};

    // a rename/copy entry is followed by its source path
    if (x == 'R' || x == 'C' || y == 'R' || y == 'C')
      ++i;

    if (x == '?' && y == '?') {
      st.untracked.push_back(path);
      continue;
    }
    if (x == '!')
      continue;
    if (is_unmerged(x, y)) {
      st.conflicted.push_back(path);
      continue;
    }
    if (auto k = kind_from_code(x))
      st.staged.push_back({*k, path});
    if (auto k = kind_from_code(y))
      st.unstaged.push_back({*k, path});
  }

  std::ranges::sort(st.untracked);
  std::ranges::sort(st.conflicted);
  return st;
}

Status compute_status(const Repository &repo) {
  return parse_porcelain(
      repo.git({"status", "--porcelain=v1", "-z", "--untracked-files=all"}));
}

} // namespace hunkwise
