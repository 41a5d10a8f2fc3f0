#pragma once
#include "hunkwise/consts.hpp"
#include "hunkwise/diff.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hunkwise {

class Repository; // fwd

namespace discard {

// One line of a file being rebuilt. `eol` is false only for a last line that
// had no trailing newline.
struct BufferLine {
  std::string text;
  bool eol = true;
};

// Split file content into buffer lines
std::vector<BufferLine> to_buffer(std::string_view content);
// Join buffer lines back into file content
std::string from_buffer(const std::vector<BufferLine>& lines);

// "{line_number}-{add|del}"
std::string line_key(int line_number, ChangeType type);

// Rebuild a file from its HEAD content and its working-tree diff, reverting
// the changes named by `discard_keys` and keeping every other change.
// Returns the new content and the number of keys that matched a change.
struct ReplayResult {
  std::string content;
  std::size_t matched = 0;
};
ReplayResult replay_line_discard(std::string_view head_content, const FileDiff& file,
                                 const std::vector<DiscardLineInfo>& discard);

// Every hunk of `file` except the one at (target.old_start, target.new_start).
// Throws Error{ChangeNotFound} when no hunk has that position.
std::vector<DiffHunk> select_hunks_to_keep(const FileDiff& file, const DiffHunk& target);

// Revert a file to HEAD. A staged new file is dropped from the index and the
// working tree; an untracked file is deleted.
void discard_file(const Repository& repo, std::string_view file_path);

// Revert one hunk of a tracked file, keeping its other changes.
void discard_hunk(const Repository& repo, std::string_view file_path, const DiffHunk& target,
                  int context_lines = consts::kDefaultContextLines);

// Revert individual added/deleted lines of a tracked file.
void discard_lines(const Repository& repo, std::string_view file_path,
                   const std::vector<DiscardLineInfo>& lines,
                   int context_lines = consts::kDefaultContextLines);

// Bring a deleted file back from HEAD
void restore_deleted_file(const Repository& repo, std::string_view file_path);

} // namespace discard

} // namespace hunkwise
