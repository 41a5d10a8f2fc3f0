#include "hunkwise/discard.hpp"

#include "hunkwise/error.hpp"
#include "hunkwise/fs.hpp"
#include "hunkwise/log.hpp"
#include "hunkwise/patch.hpp"
#include "hunkwise/query.hpp"
#include "hunkwise/repo.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

namespace hunkwise::discard {

namespace {

// Hunk and line discards only make sense for files git knows about.
void require_tracked(const Repository &repo, const std::string &rel) {
  if (repo.is_tracked(rel))
    return;
  if (repo.exists_on_disk(rel)) {
    throw Error(ErrorKind::UntrackedFileRestriction,
                "cannot discard part of untracked file " + rel +
                    "; discard the whole file instead");
  }
  throw Error(ErrorKind::FileNotFound, rel + " is not in the repository");
}

FileDiff current_diff(const Repository &repo, const std::string &rel, int context_lines,
                      std::string &raw) {
  DiffOptions options;
  options.file_path = rel;
  options.context_lines = context_lines;
  raw = query::raw_diff(repo, options);

  auto files = diff::parse(raw);
  const auto it =
      std::ranges::find_if(files, [&](const FileDiff &f) { return f.path() == rel; });
  if (it == files.end() || (it->hunks.empty() && !it->is_deleted)) {
    throw Error(ErrorKind::NoChangesFound, "no changes found for " + rel);
  }
  return std::move(*it);
}

} // namespace

std::vector<BufferLine> to_buffer(std::string_view content) {
  std::vector<BufferLine> lines;
  for (auto &text : diff::split_lines(content))
    lines.push_back({std::move(text), true});
  if (!lines.empty() && !content.ends_with('\n'))
    lines.back().eol = false;
  return lines;
}

std::string from_buffer(const std::vector<BufferLine> &lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    out += lines[i].text;
    if (i + 1 < lines.size() || lines[i].eol)
      out.push_back('\n');
  }
  return out;
}

std::string line_key(int line_number, ChangeType type) {
  return std::to_string(line_number) + "-" + std::string(to_string(type));
}

ReplayResult replay_line_discard(std::string_view head_content, const FileDiff &file,
                                 const std::vector<DiscardLineInfo> &discard) {
  std::set<std::string> keys;
  for (const auto &l : discard)
    keys.insert(line_key(l.line_number, l.type));

  std::set<std::string> matched;
  auto buffer = to_buffer(head_content);
  // Net lines inserted into the buffer so far
  long offset = 0;

  for (const auto &hunk : file.hunks) {
    // HEAD line the next change sits in front of
    int next_old = hunk.old_lines == 0 ? hunk.old_start + 1 : hunk.old_start;

    for (const auto &change : hunk.changes) {
      if (change.type == ChangeType::Normal) {
        next_old = change.old_line.value_or(next_old) + 1;
        continue;
      }

      const auto key = line_key(change.line_number(), change.type);
      const bool drop = keys.contains(key);
      if (drop)
        matched.insert(key);

      if (change.type == ChangeType::Add) {
        if (drop)
          continue;
        const long pos = std::clamp<long>(next_old - 1 + offset, 0,
                                          static_cast<long>(buffer.size()));
        buffer.insert(buffer.begin() + pos, BufferLine{change.content, !change.no_newline_at_eof});
        ++offset;
        continue;
      }

      // Del
      const int old_line = change.old_line.value_or(next_old);
      next_old = old_line + 1;
      if (drop)
        continue;
      const long pos = old_line - 1 + offset;
      if (pos >= 0 && pos < static_cast<long>(buffer.size())) {
        buffer.erase(buffer.begin() + pos);
        --offset;
      }
    }
  }

  return {from_buffer(buffer), matched.size()};
}

std::vector<DiffHunk> select_hunks_to_keep(const FileDiff &file, const DiffHunk &target) {
  std::vector<DiffHunk> keep;
  bool found = false;
  for (const auto &hunk : file.hunks) {
    if (!found && hunk.old_start == target.old_start && hunk.new_start == target.new_start) {
      found = true;
      continue;
    }
    keep.push_back(hunk);
  }
  if (!found) {
    throw Error(ErrorKind::ChangeNotFound,
                "no hunk at -" + std::to_string(target.old_start) + " +" +
                    std::to_string(target.new_start) + " in " + file.path());
  }
  return keep;
}

void discard_file(const Repository &repo, std::string_view file_path) {
  const auto rel = repo.relative_path(file_path);
  auto logger = log::Registry::discard();

  if (repo.exists_in_head(rel)) {
    repo.checkout_from_head(rel);
    logger->info("discarded all changes in {}", rel);
  } else if (repo.in_index(rel)) {
    repo.remove_from_index(rel);
    logger->info("dropped staged new file {}", rel);
  } else if (repo.exists_on_disk(rel)) {
    std::error_code ec;
    std::filesystem::remove_all(repo.root() / rel, ec);
    if (ec) {
      logger->error("failed to delete untracked {}: {}", rel, ec.message());
      throw Error(ErrorKind::FileOperationFailed, "cannot delete " + rel + ": " + ec.message());
    }
    logger->info("deleted untracked {}", rel);
  } else {
    throw Error(ErrorKind::FileNotFound, rel + " is not in the repository");
  }
}

void discard_hunk(const Repository &repo, std::string_view file_path, const DiffHunk &target,
                  int context_lines) {
  const auto rel = repo.relative_path(file_path);
  auto logger = log::Registry::discard();
  require_tracked(repo, rel);

  std::string raw;
  const auto file = current_diff(repo, rel, context_lines, raw);
  const auto keep = select_hunks_to_keep(file, target);
  // Rendered before anything is touched so a bad request leaves the file alone
  const auto text = keep.empty() ? std::string{} : patch::build(rel, raw, keep);

  if (repo.exists_in_head(rel)) {
    repo.checkout_from_head(rel);
  } else if (repo.exists_on_disk(rel)) {
    // staged new file: the baseline is "no file"; the index entry stays
    fs::remove_file(repo.root() / rel);
  }

  if (!keep.empty()) {
    try {
      repo.apply_patch(text);
    } catch (const Error &e) {
      logger->error("re-applying {} kept hunk(s) of {} failed: {}", keep.size(), rel, e.what());
      throw;
    }
  }
  logger->info("discarded hunk -{} +{} in {} ({} kept)", target.old_start, target.new_start, rel,
               keep.size());
}

void discard_lines(const Repository &repo, std::string_view file_path,
                   const std::vector<DiscardLineInfo> &lines, int context_lines) {
  const auto rel = repo.relative_path(file_path);
  auto logger = log::Registry::discard();
  require_tracked(repo, rel);

  if (lines.empty())
    return;
  std::string raw;
  const auto file = current_diff(repo, rel, context_lines, raw);

  const std::string head = repo.exists_in_head(rel) ? repo.show(std::string(consts::kHeadRef), rel) : "";
  const auto result = replay_line_discard(head, file, lines);

  std::set<std::string> requested;
  for (const auto &l : lines)
    requested.insert(line_key(l.line_number, l.type));
  if (result.matched != requested.size()) {
    throw Error(ErrorKind::ChangeNotFound,
                std::to_string(requested.size() - result.matched) +
                    " requested line(s) are not changes in " + rel);
  }

  fs::write_text_atomic(repo.root() / rel, result.content);
  logger->info("discarded {} line(s) in {}", requested.size(), rel);
}

void restore_deleted_file(const Repository &repo, std::string_view file_path) {
  const auto rel = repo.relative_path(file_path);
  if (!repo.exists_in_head(rel)) {
    throw Error(ErrorKind::FileNotFound, rel + " does not exist in HEAD");
  }
  repo.checkout_from_head(rel);
  log::Registry::discard()->info("restored {} from HEAD", rel);
}

} // namespace hunkwise::discard
