#include "cli/common.hpp"

#include "hunkwise/repo.hpp"
#include "hunkwise/status.hpp"

#include <iostream>
#include <memory>

using hunkwise::ChangeKind;

int cmd_status(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    (void)hunkwise::cli::parse_common(argc, argv, flags);
    const auto session = hunkwise::cli::open_session(flags);

    const hunkwise::Repository repo{
        session.repo_path, std::make_shared<hunkwise::ProcessRunner>(session.settings.git_binary)};
    repo.require_git_repository();
    const auto st = hunkwise::compute_status(repo);

    auto print_changes = [](const char *header, const std::vector<hunkwise::Change> &xs) {
      std::cout << header << "\n";
      for (const auto &[kind, path] : xs) {
        const char code = (kind == ChangeKind::Added      ? 'A'
                           : kind == ChangeKind::Modified ? 'M'
                           : kind == ChangeKind::Renamed  ? 'R'
                                                          : 'D');
        std::cout << "  " << code << "  " << path << "\n";
      }
      if (xs.empty())
        std::cout << "  (none)\n";
      std::cout << "\n";
    };
    auto print_paths = [](const char *header, const std::vector<std::string> &xs) {
      std::cout << header << "\n";
      if (xs.empty())
        std::cout << "  (none)\n";
      for (const auto &p : xs)
        std::cout << "  " << p << "\n";
      std::cout << "\n";
    };

    print_changes("Changes to be committed:", st.staged);
    print_changes("Changes not staged for commit:", st.unstaged);
    print_paths("Untracked files:", st.untracked);
    if (!st.conflicted.empty())
      print_paths("Unmerged paths:", st.conflicted);
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("status", e);
  }
}
