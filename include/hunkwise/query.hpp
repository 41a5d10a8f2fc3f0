#pragma once
#include "hunkwise/conflict.hpp"
#include "hunkwise/consts.hpp"
#include "hunkwise/diff.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hunkwise {

class Repository; // fwd

struct DiffOptions {
  std::string from = "HEAD"; // commit, branch or HEAD
  std::optional<std::string> to;
  std::optional<std::string> file_path;
  int context_lines = consts::kDefaultContextLines;
};

namespace query {

// `--unified=N --no-color --no-ext-diff --no-prefix`
std::vector<std::string> diff_format_args(int context_lines);

// Raw `git diff` text for the options; an unborn HEAD diffs against the empty tree.
std::string raw_diff(const Repository& repo, const DiffOptions& options);

std::vector<FileDiff> get_diff(const Repository& repo, const DiffOptions& options);

// Working tree vs HEAD. An untracked file is diffed against /dev/null; with no
// file_path every untracked file is appended after the tracked ones.
std::vector<FileDiff> get_uncommitted_diff(const Repository& repo,
                                           const std::optional<std::string>& file_path,
                                           int context_lines = consts::kDefaultContextLines);

// A single untracked file as 100% additions
std::vector<FileDiff> get_untracked_diff(const Repository& repo, const std::string& rel,
                                         int context_lines = consts::kDefaultContextLines);

// Index vs HEAD
std::vector<FileDiff> get_staged_diff(const Repository& repo,
                                      const std::optional<std::string>& file_path,
                                      int context_lines = consts::kDefaultContextLines);

std::vector<std::string> get_conflicted_files(const Repository& repo);

// Throws Error{FileNotFound} when `ref` has no such path
std::string get_file_content(const Repository& repo, const std::string& file_path,
                             const std::string& ref = "HEAD");

// Conflict regions of the working-tree file
std::vector<ConflictMarker> get_conflict_markers(const Repository& repo,
                                                 const std::string& file_path);

} // namespace query

} // namespace hunkwise
