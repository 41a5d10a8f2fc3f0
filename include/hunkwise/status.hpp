#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hunkwise {

enum class ChangeKind : std::uint8_t { Added, Modified, Deleted, Renamed };

struct Change {
  ChangeKind kind;
  std::string path;  // repo-relative
};

struct Status {
  std::vector<Change> staged;          // HEAD vs index
  std::vector<Change> unstaged;        // index vs working
  std::vector<std::string> untracked;  // working - index
  std::vector<std::string> conflicted; // unmerged paths
};

// Snapshot from `git status --porcelain=v1 -z`.
class Repository; // fwd
auto compute_status(const Repository& repo) -> Status;

// Parser behind compute_status, exposed for tests.
auto parse_porcelain(std::string_view porcelain_z) -> Status;

} // namespace hunkwise
