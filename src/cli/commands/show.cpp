#include "cli/common.hpp"

#include <iostream>

// hunkwise show <path> [ref]
int cmd_show(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    const auto args = hunkwise::cli::parse_common(argc, argv, flags);
    if (args.empty() || args.size() > 2) {
      std::cerr << "usage: hunkwise show <path> [ref]\n";
      return 2;
    }
    auto session = hunkwise::cli::open_session(flags);
    const auto path = hunkwise::cli::path_arg(session, args[0]);
    std::cout << session.service.get_file_content(session.repo_path, path,
                                                  args.size() == 2 ? args[1] : "HEAD");
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("show", e);
  }
}
