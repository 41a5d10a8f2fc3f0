#include "cli/common.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

// "12:add" / "7:del"
std::optional<hunkwise::DiscardLineInfo> parse_line_spec(const std::string &spec) {
  const auto colon = spec.find(':');
  if (colon == std::string::npos)
    return std::nullopt;
  const auto n = hunkwise::cli::parse_int(spec.substr(0, colon));
  const auto kind = spec.substr(colon + 1);
  if (!n || *n == 0)
    return std::nullopt;
  if (kind == "add")
    return hunkwise::DiscardLineInfo{*n, hunkwise::ChangeType::Add};
  if (kind == "del")
    return hunkwise::DiscardLineInfo{*n, hunkwise::ChangeType::Del};
  return std::nullopt;
}

} // namespace

// hunkwise discard-lines <path> <n>:add|del...
int cmd_discard_lines(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    const auto args = hunkwise::cli::parse_common(argc, argv, flags);
    if (args.size() < 2) {
      std::cerr << "usage: hunkwise discard-lines <path> <n>:add|del...\n";
      return 2;
    }
    std::vector<hunkwise::DiscardLineInfo> lines;
    for (std::size_t i = 1; i < args.size(); ++i) {
      const auto info = parse_line_spec(args[i]);
      if (!info) {
        std::cerr << "discard-lines: expected <n>:add or <n>:del, got " << args[i] << "\n";
        return 2;
      }
      lines.push_back(*info);
    }
    auto session = hunkwise::cli::open_session(flags);
    const auto path = hunkwise::cli::path_arg(session, args[0]);
    session.service.discard_line_changes(session.repo_path, path, lines);
    std::cout << "discarded " << lines.size() << " line(s) in " << args[0] << "\n";
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("discard-lines", e);
  }
}
