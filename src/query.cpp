#include "hunkwise/query.hpp"

#include "hunkwise/error.hpp"
#include "hunkwise/fs.hpp"
#include "hunkwise/log.hpp"
#include "hunkwise/repo.hpp"
#include "hunkwise/status.hpp"

namespace hunkwise::query {

namespace {

std::vector<FileDiff> parse_annotated(std::string_view raw) {
  auto files = diff::parse(raw);
  conflict::annotate(files);
  return files;
}

} // namespace

std::vector<std::string> diff_format_args(int context_lines) {
  return {"--unified=" + std::to_string(context_lines), "--no-color", "--no-ext-diff",
          "--no-prefix"};
}

std::string raw_diff(const Repository &repo, const DiffOptions &options) {
  std::vector<std::string> args{"diff"};
  for (auto &a : diff_format_args(options.context_lines))
    args.push_back(std::move(a));

  std::string from = options.from.empty() ? std::string(consts::kHeadRef) : options.from;
  if (from == consts::kHeadRef && !repo.has_head())
    from = std::string(consts::kEmptyTree);

  if (options.to)
    args.push_back(from + ".." + *options.to);
  else
    args.push_back(from);

  if (options.file_path) {
    args.emplace_back("--");
    args.push_back(std::string(consts::kLiteralPathspec) +
                   repo.relative_path(*options.file_path));
  }
  return repo.git(args);
}

std::vector<FileDiff> get_diff(const Repository &repo, const DiffOptions &options) {
  const auto raw = raw_diff(repo, options);
  if (raw.empty())
    return {};
  auto files = parse_annotated(raw);
  log::Registry::diff()->debug("diff {}: {} file(s)", options.from, files.size());
  return files;
}

std::vector<FileDiff> get_untracked_diff(const Repository &repo, const std::string &rel,
                                         int context_lines) {
  std::vector<std::string> args{"diff", "--no-index"};
  for (auto &a : diff_format_args(context_lines))
    args.push_back(std::move(a));
  args.insert(args.end(), {"--", std::string(consts::kDevNull), rel});

  const auto res = repo.git_unchecked(args);
  // --no-index exits 1 when the files differ
  if (res.exit_code != 0 && res.exit_code != consts::kNoIndexDiffersExit) {
    throw Error(ErrorKind::VersionControlCommandFailed,
                "git diff --no-index for " + rel + " failed: " + res.err);
  }
  if (res.out.empty())
    return {};

  auto files = parse_annotated(res.out);
  for (auto &f : files) {
    if (f.to.empty())
      f.to = rel;
    f.is_new = true;
    f.from = std::string(consts::kDevNull);
    f.is_renamed = false;
  }
  return files;
}

std::vector<FileDiff> get_uncommitted_diff(const Repository &repo,
                                           const std::optional<std::string> &file_path,
                                           int context_lines) {
  if (file_path) {
    const auto rel = repo.relative_path(*file_path);
    if (!repo.is_tracked(rel) && repo.exists_on_disk(rel)) {
      log::Registry::diff()->debug("{} is untracked, diffing against /dev/null", rel);
      return get_untracked_diff(repo, rel, context_lines);
    }
  }

  DiffOptions options;
  options.file_path = file_path;
  options.context_lines = context_lines;
  auto files = get_diff(repo, options);

  if (!file_path) {
    for (const auto &rel : compute_status(repo).untracked) {
      for (auto &f : get_untracked_diff(repo, rel, context_lines))
        files.push_back(std::move(f));
    }
  }
  return files;
}

std::vector<FileDiff> get_staged_diff(const Repository &repo,
                                      const std::optional<std::string> &file_path,
                                      int context_lines) {
  std::vector<std::string> args{"diff", "--cached"};
  for (auto &a : diff_format_args(context_lines))
    args.push_back(std::move(a));
  if (file_path) {
    args.emplace_back("--");
    args.push_back(std::string(consts::kLiteralPathspec) + repo.relative_path(*file_path));
  }
  const auto raw = repo.git(args);
  if (raw.empty())
    return {};
  return parse_annotated(raw);
}

std::vector<std::string> get_conflicted_files(const Repository &repo) {
  return compute_status(repo).conflicted;
}

std::string get_file_content(const Repository &repo, const std::string &file_path,
                             const std::string &ref) {
  const auto rel = repo.relative_path(file_path);
  if (repo.git_unchecked({"cat-file", "-e", ref + ":" + rel}).exit_code != 0) {
    throw Error(ErrorKind::FileNotFound, rel + " does not exist at " + ref);
  }
  return repo.show(ref, rel);
}

std::vector<ConflictMarker> get_conflict_markers(const Repository &repo,
                                                 const std::string &file_path) {
  const auto rel = repo.relative_path(file_path);
  if (!repo.exists_on_disk(rel))
    throw Error(ErrorKind::FileNotFound, rel + " does not exist in the working tree");
  return conflict::extract_markers(fs::read_text(repo.root() / rel));
}

} // namespace hunkwise::query
