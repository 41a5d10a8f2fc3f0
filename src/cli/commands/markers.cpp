#include "cli/common.hpp"

#include <iostream>

// hunkwise markers <path>
int cmd_markers(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    const auto args = hunkwise::cli::parse_common(argc, argv, flags);
    if (args.size() != 1) {
      std::cerr << "usage: hunkwise markers <path>\n";
      return 2;
    }
    auto session = hunkwise::cli::open_session(flags);
    const auto path = hunkwise::cli::path_arg(session, args[0]);
    const auto markers = session.service.get_conflict_markers(session.repo_path, path);
    if (markers.empty())
      std::cout << "(no conflict markers)\n";
    for (const auto &m : markers) {
      std::cout << hunkwise::to_string(m.type) << " " << m.start_line << "-" << m.end_line
                << "\n";
      std::cout << m.content;
      if (!m.content.empty() && !m.content.ends_with('\n'))
        std::cout << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("markers", e);
  }
}
