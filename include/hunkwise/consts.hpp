#pragma once
#include <string_view>

namespace hunkwise::consts {

// Repository layout
inline constexpr std::string_view kGitDir       = ".git";
inline constexpr std::string_view kIndexFile    = "index";
inline constexpr std::string_view kHeadFile     = "HEAD";
inline constexpr std::string_view kRefsDir      = "refs";
inline constexpr std::string_view kSettingsFile = "hunkwise"; // lives inside .git/

inline constexpr std::string_view kHeadRef  = "HEAD";
inline constexpr std::string_view kDevNull  = "/dev/null";

// `git hash-object -t tree /dev/null`, the baseline for an unborn HEAD
inline constexpr std::string_view kEmptyTree = "4b825dc642cb6eb9a060e54bf8d69288fbee4904";

// Pathspec magic so a path with glob characters names only itself
inline constexpr std::string_view kLiteralPathspec = ":(literal)";

inline constexpr int kDefaultContextLines = 3;

// ——— Unified diff syntax ———
inline constexpr std::string_view kDiffGitPrefix   = "diff --git ";
inline constexpr std::string_view kOldFilePrefix   = "--- ";
inline constexpr std::string_view kNewFilePrefix   = "+++ ";
inline constexpr std::string_view kHunkPrefix      = "@@ ";
inline constexpr std::string_view kNewFileMode     = "new file mode ";
inline constexpr std::string_view kDeletedFileMode = "deleted file mode ";
inline constexpr std::string_view kOldMode         = "old mode ";
inline constexpr std::string_view kNewMode         = "new mode ";
inline constexpr std::string_view kRenameFrom      = "rename from ";
inline constexpr std::string_view kRenameTo        = "rename to ";
inline constexpr std::string_view kBinaryFiles     = "Binary files ";
inline constexpr std::string_view kNoNewlineMarker = "\\ No newline at end of file";

// ——— Merge conflict markers ———
inline constexpr std::string_view kMarkerOurs   = "<<<<<<<";
inline constexpr std::string_view kMarkerBase   = "|||||||";
inline constexpr std::string_view kMarkerSplit  = "=======";
inline constexpr std::string_view kMarkerTheirs = ">>>>>>>";

// Exit status of `git diff --no-index` when the inputs differ
inline constexpr int kNoIndexDiffersExit = 1;

} // namespace hunkwise::consts
