#pragma once
#include "hunkwise/repo.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

inline void write_file(const fs::path &p, std::string_view s) {
  if (p.has_parent_path())
    fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

inline std::string read_file(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline fs::path unique_temp_dir(const std::string &tag) {
  const auto dir =
      fs::temp_directory_path() / ("hunkwise_" + tag + "_" + std::to_string(std::random_device{}()));
  fs::create_directories(dir);
  return dir;
}

// Throwaway repository with a local identity, removed on destruction.
class TempGitRepo {
public:
  explicit TempGitRepo(const std::string &tag) : root_{unique_temp_dir(tag)}, repo_{root_} {
    (void)repo_.git({"init", "-q"});
    (void)repo_.git({"config", "user.name", "Hunkwise Test"});
    (void)repo_.git({"config", "user.email", "test@example.com"});
    (void)repo_.git({"config", "commit.gpgsign", "false"});
    (void)repo_.git({"config", "core.autocrlf", "false"});
    (void)repo_.git({"config", "merge.conflictstyle", "merge"});
  }

  ~TempGitRepo() {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  TempGitRepo(const TempGitRepo &) = delete;
  auto operator=(const TempGitRepo &) -> TempGitRepo & = delete;

  [[nodiscard]] const fs::path &root() const { return root_; }
  [[nodiscard]] const hunkwise::Repository &repo() const { return repo_; }

  void write(const std::string &rel, std::string_view content) const {
    write_file(root_ / rel, content);
  }
  [[nodiscard]] std::string read(const std::string &rel) const { return read_file(root_ / rel); }

  // Stage everything and commit; returns the new commit id.
  std::string commit_all(const std::string &message) const {
    (void)repo_.git({"add", "-A"});
    (void)repo_.git({"commit", "-q", "-m", message});
    auto id = repo_.git({"rev-parse", "HEAD"});
    while (!id.empty() && id.back() == '\n')
      id.pop_back();
    return id;
  }

private:
  fs::path root_;
  hunkwise::Repository repo_;
};

// "l1\n" .. "l<n>\n"
inline std::string numbered_lines(int n) {
  std::string s;
  for (int i = 1; i <= n; ++i)
    s += "l" + std::to_string(i) + "\n";
  return s;
}
