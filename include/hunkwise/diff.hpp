#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hunkwise {

enum class ChangeType : std::uint8_t { Add, Del, Normal };

auto to_string(ChangeType type) -> std::string_view;

struct DiffChange {
  ChangeType type = ChangeType::Normal;
  std::optional<int> old_line; // absent for Add
  std::optional<int> new_line; // absent for Del
  std::string content;         // without the leading '+', '-' or ' '
  bool is_conflict = false;
  // A "\ No newline at end of file" marker followed this line
  bool no_newline_at_eof = false;

  // Key used by line discards: old side first, then new side
  [[nodiscard]] auto line_number() const -> int { return old_line.value_or(new_line.value_or(0)); }
};

struct DiffHunk {
  int old_start = 0;
  int old_lines = 0;
  int new_start = 0;
  int new_lines = 0;
  std::string section; // text after the closing "@@", if any
  std::vector<DiffChange> changes;
  bool has_conflicts = false;
};

struct FileDiff {
  std::string from; // "/dev/null" for a new file
  std::string to;   // "/dev/null" for a deleted file
  std::vector<DiffHunk> hunks;
  int additions = 0;
  int deletions = 0;
  bool is_new = false;
  bool is_deleted = false;
  bool is_renamed = false;
  bool is_binary = false;
  bool has_conflicts = false;
  std::string old_mode; // e.g. "100644", empty when git did not report it
  std::string new_mode;

  // The path that exists in the working tree (or existed, for a deletion)
  [[nodiscard]] auto path() const -> const std::string & { return is_deleted ? from : to; }
};

struct DiscardLineInfo {
  int line_number = 0;
  ChangeType type = ChangeType::Add; // Add or Del
};

namespace diff {

// Parse unified diff text as produced by `git diff --no-prefix --no-color`.
// Line numbers are reconstructed from the hunk headers.
std::vector<FileDiff> parse(std::string_view raw);

// Split on '\n'. '\r' is kept; a trailing newline does not produce an empty
// last element.
std::vector<std::string> split_lines(std::string_view text);

// Decode a git C-quoted path ("a\tb" -> a<TAB>b); other input is returned as is.
std::string unquote_path(std::string_view path);

} // namespace diff

} // namespace hunkwise
