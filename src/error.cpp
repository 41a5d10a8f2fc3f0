#include "hunkwise/error.hpp"

namespace hunkwise {

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotAGitRepository:
    return "not a git repository";
  case ErrorKind::FileNotFound:
    return "file not found";
  case ErrorKind::UntrackedFileRestriction:
    return "untracked file";
  case ErrorKind::NoChangesFound:
    return "no changes found";
  case ErrorKind::ChangeNotFound:
    return "change not found";
  case ErrorKind::PatchApplicationFailed:
    return "patch application failed";
  case ErrorKind::VersionControlCommandFailed:
    return "git command failed";
  case ErrorKind::FileOperationFailed:
    return "file operation failed";
  }
  return "unknown error";
}

} // namespace hunkwise
