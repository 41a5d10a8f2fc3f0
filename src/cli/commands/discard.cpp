#include "cli/common.hpp"

#include <iostream>

// hunkwise discard <path>...
int cmd_discard(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    const auto args = hunkwise::cli::parse_common(argc, argv, flags);
    if (args.empty()) {
      std::cerr << "usage: hunkwise discard <path>...\n";
      return 2;
    }
    auto session = hunkwise::cli::open_session(flags);
    for (const auto &path : args) {
      session.service.discard_file_changes(session.repo_path,
                                           hunkwise::cli::path_arg(session, path));
      std::cout << "discarded " << path << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("discard", e);
  }
}
