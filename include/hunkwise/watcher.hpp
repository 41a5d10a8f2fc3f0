#pragma once
#include "hunkwise/unique_fd.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace hunkwise {

// Called on the watcher thread once a burst of changes has settled.
using ChangeCallback = std::function<void(const std::filesystem::path& repo_root)>;

// Watches .git/index, .git/HEAD and everything under .git/refs of one
// repository with inotify. Events arriving within kSettleTime of each other
// produce a single callback.
class RepoWatcher {
public:
  RepoWatcher(std::filesystem::path repo_root, ChangeCallback callback);
  ~RepoWatcher();

  RepoWatcher(const RepoWatcher&) = delete;
  auto operator=(const RepoWatcher&) -> RepoWatcher& = delete;

  // Throws Error{NotAGitRepository} when there is no .git directory and
  // std::system_error when inotify is unavailable.
  void start();
  // Joins the watcher thread; must not be called from the callback.
  void stop();

  // True for an inotify mask after which events may have been lost
  // (queue overflow), so a refresh is due regardless of which file changed.
  [[nodiscard]] static bool forces_refresh(std::uint32_t mask) noexcept;

  [[nodiscard]] bool running() const { return running_; }
  [[nodiscard]] const std::filesystem::path& repo_root() const { return root_; }

  static constexpr std::chrono::milliseconds kSettleTime{100};

private:
  void run();
  bool add_watch(const std::filesystem::path& dir, std::uint32_t mask);
  void add_tree(const std::filesystem::path& dir);
  // Drain the inotify queue; true when any event touched a watched git file
  bool handle_events();
  void notify();

  std::filesystem::path root_;
  ChangeCallback callback_;
  UniqueFd inotify_;
  UniqueFd wake_read_;
  UniqueFd wake_write_;
  std::map<int, std::filesystem::path> dirs_; // watch descriptor -> directory
  std::thread thread_;
  std::atomic<bool> running_{false};
};

// One watcher per repository path. Starting a path that is already watched
// replaces its watcher.
class WatcherRegistry {
public:
  WatcherRegistry() = default;
  ~WatcherRegistry();

  WatcherRegistry(const WatcherRegistry&) = delete;
  auto operator=(const WatcherRegistry&) -> WatcherRegistry& = delete;

  void start(const std::filesystem::path& repo_path, ChangeCallback callback);
  // False when nothing was watching `repo_path`
  bool stop(const std::filesystem::path& repo_path);
  void stop_all();
  [[nodiscard]] std::size_t active_count() const;

private:
  static std::string key_for(const std::filesystem::path& repo_path);

  mutable std::mutex mutex_;
  std::map<std::string, std::unique_ptr<RepoWatcher>> watchers_;
};

} // namespace hunkwise
