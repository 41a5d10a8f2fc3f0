#include "cli/common.hpp"

#include "hunkwise/watcher.hpp"

#include <csignal>
#include <iostream>
#include <mutex>
#include <pthread.h>

// hunkwise watch: print a line whenever the index, HEAD or a ref changes,
// until interrupted.
int cmd_watch(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    (void)hunkwise::cli::parse_common(argc, argv, flags);
    auto session = hunkwise::cli::open_session(flags);
    // fail early outside a repository
    (void)session.service.get_conflicted_files(session.repo_path);

    // Block the stop signals before the watcher thread exists so it inherits
    // the mask and only sigwait() below sees them.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    std::mutex out_mutex;
    hunkwise::WatcherRegistry watchers;
    watchers.start(session.repo_path, [&out_mutex](const std::filesystem::path &root) {
      const std::lock_guard lock(out_mutex);
      std::cout << "changed " << root.string() << std::endl;
    });
    std::cout << "watching " << session.repo_path.string() << " (Ctrl-C to stop)" << std::endl;

    int sig = 0;
    sigwait(&stop_signals, &sig);
    watchers.stop_all();
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("watch", e);
  }
}
