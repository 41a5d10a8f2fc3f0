#pragma once
#include "hunkwise/config.hpp"
#include "hunkwise/diff.hpp"
#include "hunkwise/service.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace hunkwise::cli {

// Flags every command accepts
struct CommonFlags {
  std::optional<int> context_lines; // -U <n>
  std::optional<std::string> git;   // --git <path>
  bool verbose = false;             // -v
};

// Pull -U/--git/-v (and `--` handling) out of argv[1..]; everything else is
// returned in order. Throws std::invalid_argument on a malformed flag.
std::vector<std::string> parse_common(int argc, char** argv, CommonFlags& flags);

// Repository of the current directory, its settings with flags applied, and a
// service built from them. Logging is configured as a side effect.
struct Session {
  std::filesystem::path repo_path;
  std::filesystem::path cwd;
  Settings settings;
  DiffService service;
};
Session open_session(const CommonFlags& flags);

// A path argument as typed from the session's working directory, made
// absolute so the repository resolves it against its root.
std::string path_arg(const Session& session, const std::string& arg);

// Non-negative decimal, or nullopt
std::optional<int> parse_int(const std::string& s);

// Print "<command>: <message>" and return the exit status for a failure
int report(const char* command, const std::exception& e);

// Human-readable listing with old/new line numbers per change
void print_diff(std::ostream& os, const std::vector<FileDiff>& files);

} // namespace hunkwise::cli
