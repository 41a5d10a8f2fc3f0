#pragma once
#include "hunkwise/process.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hunkwise {

// A git working tree driven through a CommandRunner. Holds no cached state:
// every query asks git again.
class Repository {
public:
  explicit Repository(std::filesystem::path root,
                      std::shared_ptr<CommandRunner> runner = std::make_shared<ProcessRunner>());

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto git_dir() const -> std::filesystem::path;
  [[nodiscard]] auto runner() const -> const std::shared_ptr<CommandRunner> & { return runner_; }

  // Repo-relative, '/'-separated form of `path`; absolute paths inside the
  // working tree are made relative.
  [[nodiscard]] auto relative_path(std::string_view path) const -> std::string;

  [[nodiscard]] auto is_git_repository() const -> bool;
  // Throws Error{NotAGitRepository}
  void require_git_repository() const;

  // Run git; non-zero exit throws Error{VersionControlCommandFailed}.
  auto git(const std::vector<std::string> &args) const -> std::string;
  // Run git and hand back whatever happened.
  auto git_unchecked(const std::vector<std::string> &args) const -> CommandResult;

  // False for a freshly initialized repository with no commits.
  [[nodiscard]] auto has_head() const -> bool;

  // In the index or in HEAD
  [[nodiscard]] auto is_tracked(const std::string &rel) const -> bool;
  [[nodiscard]] auto in_index(const std::string &rel) const -> bool;
  [[nodiscard]] auto exists_in_head(const std::string &rel) const -> bool;
  [[nodiscard]] auto exists_on_disk(const std::string &rel) const -> bool;

  // `git show <ref>:<rel>`, raw bytes
  [[nodiscard]] auto show(const std::string &ref, const std::string &rel) const -> std::string;

  // `git checkout HEAD -- <rel>`: working tree and index entry back to HEAD
  void checkout_from_head(const std::string &rel) const;

  // Drop a path that only the index knows about from index and working tree.
  void remove_from_index(const std::string &rel) const;

  // `git apply --whitespace=nowarn` on the working tree. A rejection throws
  // Error{PatchApplicationFailed} carrying git's stderr.
  void apply_patch(std::string_view patch) const;

private:
  std::filesystem::path root_;
  std::shared_ptr<CommandRunner> runner_;
};

} // namespace hunkwise
