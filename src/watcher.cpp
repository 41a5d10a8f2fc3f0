#include "hunkwise/watcher.hpp"

#include "hunkwise/consts.hpp"
#include "hunkwise/error.hpp"
#include "hunkwise/log.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <poll.h>
#include <string_view>
#include <sys/inotify.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace hunkwise {

namespace {

constexpr std::uint32_t kGitDirMask = IN_CLOSE_WRITE | IN_MOVED_TO | IN_DELETE;
constexpr std::uint32_t kRefsMask =
    IN_CLOSE_WRITE | IN_MOVED_TO | IN_MOVED_FROM | IN_CREATE | IN_DELETE | IN_DELETE_SELF;

bool is_lock_file(std::string_view name) { return name.ends_with(".lock"); }

} // namespace

bool RepoWatcher::forces_refresh(std::uint32_t mask) noexcept {
  return (mask & IN_Q_OVERFLOW) != 0;
}

RepoWatcher::RepoWatcher(std::filesystem::path repo_root, ChangeCallback callback)
    : root_{std::move(repo_root)}, callback_{std::move(callback)} {}

RepoWatcher::~RepoWatcher() { stop(); }

void RepoWatcher::start() {
  if (running_)
    return;

  const auto git_dir = root_ / consts::kGitDir;
  std::error_code ec;
  if (!std::filesystem::is_directory(git_dir, ec)) {
    throw Error(ErrorKind::NotAGitRepository, "no .git directory in " + root_.string());
  }

  inotify_.reset(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (!inotify_.valid())
    throw std::system_error(errno, std::generic_category(), "inotify_init1");

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe2");
  wake_read_.reset(fds[0]);
  wake_write_.reset(fds[1]);

  dirs_.clear();
  if (!add_watch(git_dir, kGitDirMask))
    throw std::system_error(errno, std::generic_category(), "inotify_add_watch " + git_dir.string());
  add_tree(git_dir / consts::kRefsDir);

  running_ = true;
  thread_ = std::thread(&RepoWatcher::run, this);
  log::Registry::watch()->info("watching {} ({} directories)", root_.string(), dirs_.size());
}

void RepoWatcher::stop() {
  if (running_.exchange(false)) {
    const char byte = 1;
    if (::write(wake_write_.get(), &byte, 1) < 0 && errno != EAGAIN)
      log::Registry::watch()->warn("wake pipe write failed: {}", std::strerror(errno));
  }
  if (!thread_.joinable())
    return;
  thread_.join();

  inotify_.reset();
  wake_read_.reset();
  wake_write_.reset();
  dirs_.clear();
  log::Registry::watch()->info("stopped watching {}", root_.string());
}

bool RepoWatcher::add_watch(const std::filesystem::path &dir, std::uint32_t mask) {
  const int wd = ::inotify_add_watch(inotify_.get(), dir.c_str(), mask);
  if (wd < 0)
    return false;
  dirs_[wd] = dir;
  return true;
}

void RepoWatcher::add_tree(const std::filesystem::path &dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec))
    return;
  if (!add_watch(dir, kRefsMask)) {
    // the directory can vanish between listing and watching
    log::Registry::watch()->debug("cannot watch {}: {}", dir.string(), std::strerror(errno));
    return;
  }
  for (auto it = std::filesystem::directory_iterator(dir, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (it->is_directory(ec))
      add_tree(it->path());
  }
}

bool RepoWatcher::handle_events() {
  alignas(inotify_event) char buf[4096];
  bool relevant = false;

  for (;;) {
    const ssize_t n = ::read(inotify_.get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      if (errno != EAGAIN)
        log::Registry::watch()->error("inotify read failed: {}", std::strerror(errno));
      break;
    }
    if (n == 0)
      break;

    for (ssize_t off = 0; off < n;) {
      const auto *ev = reinterpret_cast<const inotify_event *>(buf + off);
      off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);

      if (forces_refresh(ev->mask)) {
        log::Registry::watch()->warn("inotify queue overflow for {}", root_.string());
        relevant = true;
        continue;
      }
      if (ev->mask & IN_IGNORED) {
        dirs_.erase(ev->wd);
        continue;
      }
      const auto dir = dirs_.find(ev->wd);
      if (dir == dirs_.end())
        continue;

      const std::string_view name = ev->len > 0 ? std::string_view{ev->name} : std::string_view{};
      const bool in_git_dir = dir->second == root_ / consts::kGitDir;

      if (in_git_dir) {
        if (name == consts::kIndexFile || name == consts::kHeadFile) {
          log::Registry::watch()->debug("{} changed in {}", name, root_.string());
          relevant = true;
        }
        continue;
      }

      // under refs/
      if ((ev->mask & IN_ISDIR) && (ev->mask & (IN_CREATE | IN_MOVED_TO)))
        add_tree(dir->second / std::string(name));
      if (!is_lock_file(name)) {
        log::Registry::watch()->debug("ref change {}/{}", dir->second.string(), name);
        relevant = true;
      }
    }
  }
  return relevant;
}

void RepoWatcher::notify() {
  try {
    callback_(root_);
  } catch (const std::exception &e) {
    log::Registry::watch()->error("change callback for {} threw: {}", root_.string(), e.what());
  }
}

void RepoWatcher::run() {
  pollfd fds[2] = {{inotify_.get(), POLLIN, 0}, {wake_read_.get(), POLLIN, 0}};
  bool pending = false;

  while (running_) {
    const int timeout = pending ? static_cast<int>(kSettleTime.count()) : -1;
    const int n = ::poll(fds, 2, timeout);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      log::Registry::watch()->error("poll failed: {}", std::strerror(errno));
      running_ = false;
      break;
    }
    if (n == 0) {
      // quiet for kSettleTime: report the burst
      pending = false;
      notify();
      continue;
    }
    if (fds[1].revents != 0)
      break;
    if ((fds[0].revents & POLLIN) && handle_events())
      pending = true;
  }
}

// ---------------------------------------------------------------------------

WatcherRegistry::~WatcherRegistry() { stop_all(); }

std::string WatcherRegistry::key_for(const std::filesystem::path &repo_path) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(repo_path, ec);
  return (ec ? repo_path : canonical).lexically_normal().string();
}

void WatcherRegistry::start(const std::filesystem::path &repo_path, ChangeCallback callback) {
  const auto key = key_for(repo_path);
  auto watcher = std::make_unique<RepoWatcher>(key, std::move(callback));
  watcher->start();

  std::unique_ptr<RepoWatcher> replaced;
  {
    std::lock_guard lock(mutex_);
    auto &slot = watchers_[key];
    replaced = std::move(slot);
    slot = std::move(watcher);
  }
  if (replaced) {
    log::Registry::watch()->info("replacing existing watcher for {}", key);
    replaced->stop();
  }
}

bool WatcherRegistry::stop(const std::filesystem::path &repo_path) {
  std::unique_ptr<RepoWatcher> watcher;
  {
    std::lock_guard lock(mutex_);
    const auto it = watchers_.find(key_for(repo_path));
    if (it == watchers_.end())
      return false;
    watcher = std::move(it->second);
    watchers_.erase(it);
  }
  watcher->stop();
  return true;
}

void WatcherRegistry::stop_all() {
  std::map<std::string, std::unique_ptr<RepoWatcher>> all;
  {
    std::lock_guard lock(mutex_);
    all.swap(watchers_);
  }
  for (auto &[key, watcher] : all)
    watcher->stop();
}

std::size_t WatcherRegistry::active_count() const {
  std::lock_guard lock(mutex_);
  return watchers_.size();
}

} // namespace hunkwise
