#include "hunkwise/process.hpp"

#include "hunkwise/unique_fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace {

using hunkwise::UniqueFd;

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

auto make_pipe() -> Pipe {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe2");
  return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

// Child side: never returns.
[[noreturn]] void exec_child(const std::string &program, const std::vector<std::string> &args,
                             const std::filesystem::path &cwd, int out_fd, int err_fd) {
  const int null_fd = ::open("/dev/null", O_RDONLY);
  if (null_fd >= 0)
    ::dup2(null_fd, STDIN_FILENO);
  ::dup2(out_fd, STDOUT_FILENO);
  ::dup2(err_fd, STDERR_FILENO);

  if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
    const std::string msg = "chdir " + cwd.string() + ": " + std::strerror(errno) + "\n";
    (void)!::write(STDERR_FILENO, msg.data(), msg.size());
    ::_exit(127);
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(program.c_str()));
  for (const auto &a : args)
    argv.push_back(const_cast<char *>(a.c_str()));
  argv.push_back(nullptr);

  ::execvp(program.c_str(), argv.data());
  const std::string msg = "exec " + program + ": " + std::strerror(errno) + "\n";
  (void)!::write(STDERR_FILENO, msg.data(), msg.size());
  ::_exit(127);
}

// Drain both pipes until the child closes them.
void drain(UniqueFd &out_fd, UniqueFd &err_fd, std::string &out, std::string &err) {
  char buf[8192];
  while (out_fd.valid() || err_fd.valid()) {
    pollfd fds[2];
    nfds_t n = 0;
    int out_slot = -1;
    int err_slot = -1;
    if (out_fd.valid()) {
      out_slot = static_cast<int>(n);
      fds[n++] = pollfd{out_fd.get(), POLLIN, 0};
    }
    if (err_fd.valid()) {
      err_slot = static_cast<int>(n);
      fds[n++] = pollfd{err_fd.get(), POLLIN, 0};
    }
    if (::poll(fds, n, -1) < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "poll");
    }

    auto pump = [&](int slot, UniqueFd &fd, std::string &sink) {
      if (slot < 0 || fds[slot].revents == 0)
        return;
      const ssize_t got = ::read(fd.get(), buf, sizeof buf);
      if (got > 0) {
        sink.append(buf, static_cast<std::size_t>(got));
      } else if (got == 0 || errno != EINTR) {
        fd.reset();
      }
    };
    pump(out_slot, out_fd, out);
    pump(err_slot, err_fd, err);
  }
}

} // namespace

namespace hunkwise {

ProcessRunner::ProcessRunner(std::string program) : program_{std::move(program)} {}

CommandResult ProcessRunner::run(const std::vector<std::string> &args,
                                 const std::filesystem::path &cwd) {
  Pipe out = make_pipe();
  Pipe err = make_pipe();

  const pid_t pid = ::fork();
  if (pid < 0)
    throw std::system_error(errno, std::generic_category(), "fork");
  if (pid == 0)
    exec_child(program_, args, cwd, out.write.get(), err.write.get());

  out.write.reset();
  err.write.reset();

  CommandResult result;
  drain(out.read, err.read, result.out, result.err);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  if (WIFEXITED(status))
    result.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exit_code = 128 + WTERMSIG(status);
  return result;
}

} // namespace hunkwise
