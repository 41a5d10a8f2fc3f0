#include "hunkwise/service.hpp"

#include "hunkwise/discard.hpp"
#include "hunkwise/repo.hpp"

#include <utility>

namespace hunkwise {

DiffService::DiffService() : DiffService(Settings{}) {}

DiffService::DiffService(const Settings &settings)
    : DiffService(std::make_shared<ProcessRunner>(settings.git_binary), settings.context_lines) {}

DiffService::DiffService(std::shared_ptr<CommandRunner> runner, int context_lines)
    : runner_{std::move(runner)}, context_lines_{context_lines} {}

Repository DiffService::open(const std::filesystem::path &repo_path) const {
  Repository repo{repo_path, runner_};
  repo.require_git_repository();
  return repo;
}

std::vector<FileDiff> DiffService::get_diff(const std::filesystem::path &repo_path,
                                            const DiffOptions &options) const {
  return query::get_diff(open(repo_path), options);
}

std::vector<FileDiff>
DiffService::get_uncommitted_diff(const std::filesystem::path &repo_path,
                                  const std::optional<std::string> &file_path) const {
  return query::get_uncommitted_diff(open(repo_path), file_path, context_lines_);
}

std::vector<FileDiff>
DiffService::get_staged_diff(const std::filesystem::path &repo_path,
                             const std::optional<std::string> &file_path) const {
  return query::get_staged_diff(open(repo_path), file_path, context_lines_);
}

std::vector<std::string>
DiffService::get_conflicted_files(const std::filesystem::path &repo_path) const {
  return query::get_conflicted_files(open(repo_path));
}

std::string DiffService::get_file_content(const std::filesystem::path &repo_path,
                                          const std::string &file_path,
                                          const std::string &ref) const {
  return query::get_file_content(open(repo_path), file_path, ref);
}

std::vector<ConflictMarker>
DiffService::get_conflict_markers(const std::filesystem::path &repo_path,
                                  const std::string &file_path) const {
  return query::get_conflict_markers(open(repo_path), file_path);
}

void DiffService::discard_file_changes(const std::filesystem::path &repo_path,
                                       const std::string &file_path) const {
  discard::discard_file(open(repo_path), file_path);
}

void DiffService::discard_hunk_changes(const std::filesystem::path &repo_path,
                                       const std::string &file_path,
                                       const DiffHunk &hunk) const {
  discard::discard_hunk(open(repo_path), file_path, hunk, context_lines_);
}

void DiffService::discard_line_changes(const std::filesystem::path &repo_path,
                                       const std::string &file_path,
                                       const std::vector<DiscardLineInfo> &lines) const {
  discard::discard_lines(open(repo_path), file_path, lines, context_lines_);
}

void DiffService::restore_deleted_file(const std::filesystem::path &repo_path,
                                       const std::string &file_path) const {
  discard::restore_deleted_file(open(repo_path), file_path);
}

} // namespace hunkwise
