#include "cli/common.hpp"

#include <iostream>
#include <optional>

// hunkwise discard-hunk <path> <old_start> <new_start>
int cmd_discard_hunk(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    const auto args = hunkwise::cli::parse_common(argc, argv, flags);
    const auto old_start = args.size() == 3 ? hunkwise::cli::parse_int(args[1]) : std::nullopt;
    const auto new_start = args.size() == 3 ? hunkwise::cli::parse_int(args[2]) : std::nullopt;
    if (!old_start || !new_start) {
      std::cerr << "usage: hunkwise discard-hunk <path> <old_start> <new_start>\n";
      return 2;
    }
    auto session = hunkwise::cli::open_session(flags);
    hunkwise::DiffHunk hunk;
    hunk.old_start = *old_start;
    hunk.new_start = *new_start;
    const auto path = hunkwise::cli::path_arg(session, args[0]);
    session.service.discard_hunk_changes(session.repo_path, path, hunk);
    std::cout << "discarded hunk -" << hunk.old_start << " +" << hunk.new_start << " in "
              << args[0] << "\n";
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("discard-hunk", e);
  }
}
