#pragma once
#include "hunkwise/diff.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hunkwise {

enum class ConflictSide : std::uint8_t { Ours, Theirs, Base };

auto to_string(ConflictSide side) -> std::string_view;

struct ConflictMarker {
  ConflictSide type = ConflictSide::Ours;
  int start_line = 0; // 1-based, first line inside the region
  int end_line = 0;   // 1-based, last line inside the region
  std::string content;
};

namespace conflict {

// Line begins with <<<<<<<, ======= or >>>>>>>
bool is_conflict_marker(std::string_view content);

// One of those tokens appears anywhere in the line
bool is_conflict_content(std::string_view content);

// Set is_conflict / has_conflicts on every change, hunk and file.
void annotate(std::vector<FileDiff>& files);

// Pair up the regions of every conflict block in `text`. An unterminated
// block at end of input is dropped.
std::vector<ConflictMarker> extract_markers(std::string_view text);

} // namespace conflict

} // namespace hunkwise
