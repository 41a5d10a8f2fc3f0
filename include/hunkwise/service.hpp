#pragma once
#include "hunkwise/config.hpp"
#include "hunkwise/conflict.hpp"
#include "hunkwise/diff.hpp"
#include "hunkwise/process.hpp"
#include "hunkwise/query.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hunkwise {

class Repository; // fwd

// Entry point for callers: every method names the repository it works on,
// checks that it is a git working tree and then runs one query or discard.
class DiffService {
public:
  DiffService();
  explicit DiffService(const Settings& settings);
  DiffService(std::shared_ptr<CommandRunner> runner, int context_lines);

  [[nodiscard]] int context_lines() const { return context_lines_; }

  // Queries
  auto get_diff(const std::filesystem::path& repo_path, const DiffOptions& options) const
      -> std::vector<FileDiff>;
  auto get_uncommitted_diff(const std::filesystem::path& repo_path,
                            const std::optional<std::string>& file_path = std::nullopt) const
      -> std::vector<FileDiff>;
  auto get_staged_diff(const std::filesystem::path& repo_path,
                       const std::optional<std::string>& file_path = std::nullopt) const
      -> std::vector<FileDiff>;
  auto get_conflicted_files(const std::filesystem::path& repo_path) const
      -> std::vector<std::string>;
  auto get_file_content(const std::filesystem::path& repo_path, const std::string& file_path,
                        const std::string& ref = "HEAD") const -> std::string;
  auto get_conflict_markers(const std::filesystem::path& repo_path,
                            const std::string& file_path) const -> std::vector<ConflictMarker>;

  // Discards
  void discard_file_changes(const std::filesystem::path& repo_path,
                            const std::string& file_path) const;
  void discard_hunk_changes(const std::filesystem::path& repo_path, const std::string& file_path,
                            const DiffHunk& hunk) const;
  void discard_line_changes(const std::filesystem::path& repo_path, const std::string& file_path,
                            const std::vector<DiscardLineInfo>& lines) const;
  void restore_deleted_file(const std::filesystem::path& repo_path,
                            const std::string& file_path) const;

private:
  // Throws Error{NotAGitRepository}
  [[nodiscard]] Repository open(const std::filesystem::path& repo_path) const;

  std::shared_ptr<CommandRunner> runner_;
  int context_lines_;
};

} // namespace hunkwise
