#pragma once
#include "hunkwise/diff.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace hunkwise::patch {

// Render a patch for `file` holding only `hunks` (in file order), suitable for
// `git apply` against the file's old side. Headers use a/ and b/ prefixes.
// Hunk counts come from the changes themselves; new_start is rebased on the
// hunks actually emitted.
std::string render(const FileDiff& file, const std::vector<DiffHunk>& hunks);

// Parse `raw_diff`, take the diff of `file_path` and keep the hunks whose
// (old_start, new_start) pair equals one in `hunks_to_keep`. Throws
// Error{ChangeNotFound} when the file or a requested hunk is absent.
std::string build(std::string_view file_path, std::string_view raw_diff,
                  const std::vector<DiffHunk>& hunks_to_keep);

// C-quote a path the way git does when it holds special bytes.
std::string quote_path(std::string_view path);

} // namespace hunkwise::patch
