#include "hunkwise/conflict.hpp"

#include "hunkwise/consts.hpp"

#include <array>
#include <optional>

namespace hunkwise {

std::string_view to_string(ConflictSide side) {
  switch (side) {
  case ConflictSide::Ours:
    return "ours";
  case ConflictSide::Theirs:
    return "theirs";
  case ConflictSide::Base:
    return "base";
  }
  return "ours";
}

namespace conflict {

namespace {

constexpr std::array<std::string_view, 3> kMarkers = {consts::kMarkerOurs, consts::kMarkerSplit,
                                                      consts::kMarkerTheirs};

} // namespace

bool is_conflict_marker(std::string_view content) {
  for (const auto m : kMarkers) {
    if (content.starts_with(m))
      return true;
  }
  return false;
}

bool is_conflict_content(std::string_view content) {
  for (const auto m : kMarkers) {
    if (content.find(m) != std::string_view::npos)
      return true;
  }
  return false;
}

void annotate(std::vector<FileDiff> &files) {
  for (auto &file : files) {
    file.has_conflicts = false;
    for (auto &hunk : file.hunks) {
      hunk.has_conflicts = false;
      for (auto &change : hunk.changes) {
        change.is_conflict =
            is_conflict_marker(change.content) || is_conflict_content(change.content);
        hunk.has_conflicts = hunk.has_conflicts || change.is_conflict;
      }
      file.has_conflicts = file.has_conflicts || hunk.has_conflicts;
    }
  }
}

std::vector<ConflictMarker> extract_markers(std::string_view text) {
  std::vector<ConflictMarker> out;
  std::optional<ConflictMarker> open;
  int line_no = 0;

  auto close_open = [&](int last_line) {
    open->end_line = last_line;
    out.push_back(std::move(*open));
    open.reset();
  };

  for (const auto &line : diff::split_lines(text)) {
    ++line_no;
    const std::string_view sv{line};
    if (sv.starts_with(consts::kMarkerOurs)) {
      open = ConflictMarker{ConflictSide::Ours, line_no + 1, -1, {}};
    } else if (sv.starts_with(consts::kMarkerBase) && open) {
      close_open(line_no - 1);
      open = ConflictMarker{ConflictSide::Base, line_no + 1, -1, {}};
    } else if (sv.starts_with(consts::kMarkerSplit) && open) {
      close_open(line_no - 1);
      open = ConflictMarker{ConflictSide::Theirs, line_no + 1, -1, {}};
    } else if (sv.starts_with(consts::kMarkerTheirs) && open) {
      close_open(line_no - 1);
    } else if (open) {
      open->content += line;
      open->content += '\n';
    }
  }
  return out;
}

} // namespace conflict

} // namespace hunkwise
