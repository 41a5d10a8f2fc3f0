#include "cli/common.hpp"

#include <iostream>

// hunkwise restore <path>
int cmd_restore(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    const auto args = hunkwise::cli::parse_common(argc, argv, flags);
    if (args.size() != 1) {
      std::cerr << "usage: hunkwise restore <path>\n";
      return 2;
    }
    auto session = hunkwise::cli::open_session(flags);
    const auto path = hunkwise::cli::path_arg(session, args[0]);
    session.service.restore_deleted_file(session.repo_path, path);
    std::cout << "restored " << args[0] << "\n";
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("restore", e);
  }
}
