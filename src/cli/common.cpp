#include "cli/common.hpp"

#include "hunkwise/fs.hpp"
#include "hunkwise/log.hpp"
#include "hunkwise/process.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace hunkwise::cli {

namespace {

// `git rev-parse --show-toplevel` from the current directory; the current
// directory itself when git does not know it.
std::filesystem::path find_repo_root(const std::string &git) {
  const auto cwd = std::filesystem::current_path();
  ProcessRunner runner{git};
  auto res = runner.run({"rev-parse", "--show-toplevel"}, cwd);
  if (res.exit_code != 0)
    return cwd;
  while (!res.out.empty() && (res.out.back() == '\n' || res.out.back() == '\r'))
    res.out.pop_back();
  return res.out.empty() ? cwd : std::filesystem::path{res.out};
}

std::string line_col(const std::optional<int> &n) {
  return n ? std::to_string(*n) : std::string{};
}

} // namespace

std::optional<int> parse_int(const std::string &s) {
  int n = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
  if (ec != std::errc{} || ptr != s.data() + s.size() || n < 0)
    return std::nullopt;
  return n;
}

std::vector<std::string> parse_common(int argc, char **argv, CommonFlags &flags) {
  std::vector<std::string> rest;
  bool only_positional = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (only_positional) {
      rest.push_back(a);
    } else if (a == "--") {
      only_positional = true;
    } else if (a == "-v" || a == "--verbose") {
      flags.verbose = true;
    } else if (a == "-U" || a == "--git") {
      if (i + 1 >= argc)
        throw std::invalid_argument(a + " needs a value");
      const std::string v = argv[++i];
      if (a == "--git") {
        flags.git = v;
      } else if (auto n = parse_int(v)) {
        flags.context_lines = *n;
      } else {
        throw std::invalid_argument("bad context line count: " + v);
      }
    } else if (a.starts_with("-U") && a.size() > 2) {
      const auto n = parse_int(a.substr(2));
      if (!n)
        throw std::invalid_argument("bad context line count: " + a.substr(2));
      flags.context_lines = *n;
    } else {
      rest.push_back(a);
    }
  }
  return rest;
}

Session open_session(const CommonFlags &flags) {
  const auto root = find_repo_root(flags.git.value_or("git"));
  auto settings = load_settings(root);
  if (flags.git)
    settings.git_binary = *flags.git;
  if (flags.context_lines)
    settings.context_lines = *flags.context_lines;
  if (flags.verbose)
    settings.log_level = "debug";

  std::optional<std::filesystem::path> log_file;
  if (!settings.log_file.empty())
    log_file = settings.log_file;
  log::Registry::init(log::level_from_string(settings.log_level), log_file);

  return Session{.repo_path = root,
                 .cwd = std::filesystem::current_path(),
                 .settings = settings, .service = DiffService{settings}};
}

std::string path_arg(const Session &session, const std::string &arg) {
  return fs::resolve_from(session.cwd, arg);
}

int report(const char *command, const std::exception &e) {
  std::cerr << command << ": " << e.what() << "\n";
  return 1;
}

void print_diff(std::ostream &os, const std::vector<FileDiff> &files) {
  if (files.empty()) {
    os << "(no differences)\n";
    return;
  }
  for (const auto &f : files) {
    os << f.path() << "  +" << f.additions << " -" << f.deletions;
    if (f.is_new)
      os << "  [new]";
    if (f.is_deleted)
      os << "  [deleted]";
    if (f.is_renamed)
      os << "  [renamed from " << f.from << "]";
    if (f.is_binary)
      os << "  [binary]";
    if (f.has_conflicts)
      os << "  [conflict]";
    os << "\n";

    for (const auto &h : f.hunks) {
      os << "  @@ -" << h.old_start << ',' << h.old_lines << " +" << h.new_start << ','
         << h.new_lines << " @@";
      if (!h.section.empty())
        os << ' ' << h.section;
      os << "\n";
      for (const auto &c : h.changes) {
        const char marker = c.type == ChangeType::Add ? '+' : c.type == ChangeType::Del ? '-' : ' ';
        os << "  " << std::setw(5) << line_col(c.old_line) << ' ' << std::setw(5)
           << line_col(c.new_line) << ' ' << (c.is_conflict ? '!' : ' ') << marker << c.content
           << "\n";
        if (c.no_newline_at_eof)
          os << "              \\ No newline at end of file\n";
      }
    }
  }
}

} // namespace hunkwise::cli
