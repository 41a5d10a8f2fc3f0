#include "hunkwise/repo.hpp"

#include "hunkwise/consts.hpp"
#include "hunkwise/error.hpp"
#include "hunkwise/fs.hpp"
#include "hunkwise/log.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace {

std::string join_args(const std::vector<std::string> &args) {
  std::string s;
  for (const auto &a : args) {
    if (!s.empty())
      s.push_back(' ');
    s += a;
  }
  return s;
}

std::string trim_trailing(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
    s.pop_back();
  return s;
}

// mkstemp-backed file removed when the guard goes out of scope
class TempPatchFile {
public:
  explicit TempPatchFile(std::string_view contents) {
    std::string tmpl = (std::filesystem::temp_directory_path() / "hunkwise_patch_XXXXXX").string();
    const int fd = ::mkstemp(tmpl.data());
    if (fd < 0)
      throw std::runtime_error(std::string("mkstemp failed: ") + std::strerror(errno));
    path_ = tmpl;

    std::size_t off = 0;
    while (off < contents.size()) {
      const ssize_t n = ::write(fd, contents.data() + off, contents.size() - off);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        const int saved = errno;
        ::close(fd);
        throw std::runtime_error(std::string("write patch failed: ") + std::strerror(saved));
      }
      off += static_cast<std::size_t>(n);
    }
    ::close(fd);
  }

  TempPatchFile(const TempPatchFile &) = delete;
  auto operator=(const TempPatchFile &) -> TempPatchFile & = delete;

  ~TempPatchFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace

namespace hunkwise {

Repository::Repository(std::filesystem::path root, std::shared_ptr<CommandRunner> runner)
    : root_{std::move(root)}, runner_{std::move(runner)} {}

std::filesystem::path Repository::git_dir() const { return root_ / consts::kGitDir; }

std::string Repository::relative_path(std::string_view path) const {
  const std::filesystem::path p{path};
  if (p.is_absolute()) {
    const auto base = std::filesystem::weakly_canonical(root_);
    const auto rel = std::filesystem::weakly_canonical(p).lexically_relative(base);
    if (!rel.empty() && *rel.begin() != "..")
      return rel.generic_string();
    return p.generic_string();
  }
  auto normal = p.lexically_normal().generic_string();
  if (normal.starts_with("./"))
    normal.erase(0, 2);
  return normal;
}

bool Repository::is_git_repository() const {
  if (!fs::exists(root_))
    return false;
  const auto res = git_unchecked({"rev-parse", "--is-inside-work-tree"});
  return res.exit_code == 0 && res.out.starts_with("true");
}

void Repository::require_git_repository() const {
  if (!is_git_repository()) {
    throw Error(ErrorKind::NotAGitRepository, "not a git repository: " + root_.string());
  }
}

std::string Repository::git(const std::vector<std::string> &args) const {
  auto res = git_unchecked(args);
  if (res.exit_code != 0) {
    const auto msg = "git " + join_args(args) + " failed (" + std::to_string(res.exit_code) +
                     "): " + trim_trailing(res.err);
    log::Registry::git()->error(msg);
    throw Error(ErrorKind::VersionControlCommandFailed, msg);
  }
  return std::move(res.out);
}

CommandResult Repository::git_unchecked(const std::vector<std::string> &args) const {
  log::Registry::git()->debug("git {} (in {})", join_args(args), root_.string());
  return runner_->run(args, root_);
}

bool Repository::has_head() const {
  return git_unchecked({"rev-parse", "--verify", "--quiet", std::string(consts::kHeadRef)})
             .exit_code == 0;
}

// `rel` is matched literally; a directory counts when it holds indexed files.
bool Repository::in_index(const std::string &rel) const {
  return !git({"ls-files", "-z", "--", std::string(consts::kLiteralPathspec) + rel}).empty();
}

bool Repository::exists_in_head(const std::string &rel) const {
  if (!has_head())
    return false;
  return git_unchecked({"cat-file", "-e", std::string(consts::kHeadRef) + ":" + rel}).exit_code ==
         0;
}

bool Repository::is_tracked(const std::string &rel) const {
  return in_index(rel) || exists_in_head(rel);
}

bool Repository::exists_on_disk(const std::string &rel) const {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::symlink_status(root_ / rel, ec));
}

std::string Repository::show(const std::string &ref, const std::string &rel) const {
  return git({"show", ref + ":" + rel});
}

void Repository::checkout_from_head(const std::string &rel) const {
  (void)git({"checkout", std::string(consts::kHeadRef), "--",
             std::string(consts::kLiteralPathspec) + rel});
}

void Repository::remove_from_index(const std::string &rel) const {
  (void)git({"rm", "--cached", "--force", "--quiet", "--",
             std::string(consts::kLiteralPathspec) + rel});
  if (exists_on_disk(rel))
    fs::remove_file(root_ / rel);
}

void Repository::apply_patch(std::string_view patch) const {
  const TempPatchFile file{patch};
  const auto res = git_unchecked({"apply", "--whitespace=nowarn", file.path().string()});
  if (res.exit_code != 0) {
    log::Registry::git()->error("git apply rejected patch: {}", trim_trailing(res.err));
    throw Error(ErrorKind::PatchApplicationFailed, "failed to re-apply hunks: " + res.err);
  }
}

} // namespace hunkwise
