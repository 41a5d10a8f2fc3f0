#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hunkwise {

enum class ErrorKind : std::uint8_t {
  NotAGitRepository,
  FileNotFound,
  UntrackedFileRestriction, // hunk/line discard on a file git does not track
  NoChangesFound,
  ChangeNotFound,           // requested hunk/line is not in the current diff
  PatchApplicationFailed,
  VersionControlCommandFailed,
  FileOperationFailed,      // working-tree file could not be changed
};

auto to_string(ErrorKind kind) -> std::string_view;

// Every failure surfaced by the library. what() carries the full message,
// including git's stderr where one exists.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_{kind} {}

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace hunkwise
