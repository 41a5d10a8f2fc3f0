#include "cli/common.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

// hunkwise diff [--cached] [--from <ref>] [--to <ref>] [path]
int cmd_diff(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    const auto args = hunkwise::cli::parse_common(argc, argv, flags);

    bool cached = false;
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<std::string> path;
    for (std::size_t i = 0; i < args.size(); ++i) {
      const auto &a = args[i];
      if (a == "--cached" || a == "--staged") {
        cached = true;
      } else if ((a == "--from" || a == "--to") && i + 1 < args.size()) {
        (a == "--from" ? from : to) = args[++i];
      } else if (!path) {
        path = a;
      } else {
        std::cerr << "usage: hunkwise diff [--cached] [--from <ref>] [--to <ref>] [path]\n";
        return 2;
      }
    }

    auto session = hunkwise::cli::open_session(flags);
    if (path)
      path = hunkwise::cli::path_arg(session, *path);
    std::vector<hunkwise::FileDiff> files;
    if (cached) {
      files = session.service.get_staged_diff(session.repo_path, path);
    } else if (from || to) {
      hunkwise::DiffOptions options;
      options.from = from.value_or("HEAD");
      options.to = to;
      options.file_path = path;
      options.context_lines = session.settings.context_lines;
      files = session.service.get_diff(session.repo_path, options);
    } else {
      files = session.service.get_uncommitted_diff(session.repo_path, path);
    }
    hunkwise::cli::print_diff(std::cout, files);
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("diff", e);
  }
}
