#include "cli/common.hpp"

#include <iostream>

int cmd_conflicts(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    (void)hunkwise::cli::parse_common(argc, argv, flags);
    auto session = hunkwise::cli::open_session(flags);
    for (const auto &path : session.service.get_conflicted_files(session.repo_path))
      std::cout << path << "\n";
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("conflicts", e);
  }
}
