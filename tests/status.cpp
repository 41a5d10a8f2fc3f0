#include "hunkwise/status.hpp"

#include "git_fixture.hpp"

#include <iostream>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

static bool has_change(const std::vector<hunkwise::Change> &xs, hunkwise::ChangeKind k,
                       std::string_view path) {
  for (auto &c : xs)
    if (c.kind == k && c.path == path)
      return true;
  return false;
}

static int check_parser() {
  const auto z = "M  a.txt\0 M b.txt\0?? c.txt\0R  new.txt\0old.txt\0UU d.txt\0AA e.txt\0"
                 "MM both.txt\0"sv;
  const auto st = hunkwise::parse_porcelain(z);

  if (!has_change(st.staged, hunkwise::ChangeKind::Modified, "a.txt") ||
      !has_change(st.staged, hunkwise::ChangeKind::Renamed, "new.txt") ||
      !has_change(st.staged, hunkwise::ChangeKind::Modified, "both.txt")) {
    std::cerr << "staged entries missing\n";
    return 1;
  }
  if (!has_change(st.unstaged, hunkwise::ChangeKind::Modified, "b.txt") ||
      !has_change(st.unstaged, hunkwise::ChangeKind::Modified, "both.txt") ||
      st.unstaged.size() != 2) {
    std::cerr << "unstaged entries wrong\n";
    return 1;
  }
  if (st.untracked != std::vector<std::string>{"c.txt"}) {
    std::cerr << "untracked wrong\n";
    return 1;
  }
  if (st.conflicted != std::vector<std::string>{"d.txt", "e.txt"}) {
    std::cerr << "conflicted wrong\n";
    return 1;
  }
  for (const auto &c : st.staged) {
    if (c.path == "old.txt") {
      std::cerr << "rename source leaked as its own entry\n";
      return 1;
    }
  }
  return 0;
}

int main() {
  if (check_parser() != 0)
    return 1;

  try {
    TempGitRepo t{"status"};
    const auto &repo = t.repo();

    // 1) Stage a file with no HEAD yet => staged Added
    t.write("a.txt", "hello\n");
    (void)repo.git({"add", "a.txt"});
    {
      auto st = hunkwise::compute_status(repo);
      if (!has_change(st.staged, hunkwise::ChangeKind::Added, "a.txt")) {
        std::cerr << "expected staged Added a.txt (initial)\n";
        return 1;
      }
      if (!st.unstaged.empty() || !st.untracked.empty()) {
        std::cerr << "unexpected unstaged/untracked (initial)\n";
        return 1;
      }
    }

    // Commit -> clean
    t.commit_all("first");
    {
      auto st = hunkwise::compute_status(repo);
      if (!st.staged.empty() || !st.unstaged.empty() || !st.untracked.empty()) {
        std::cerr << "expected clean status after commit\n";
        return 1;
      }
    }

    // 2) Modify a tracked file -> unstaged Modified; new file -> untracked
    t.write("a.txt", "hello world\n");
    t.write("dir/u.txt", "u\n");
    {
      auto st = hunkwise::compute_status(repo);
      if (!has_change(st.unstaged, hunkwise::ChangeKind::Modified, "a.txt")) {
        std::cerr << "expected unstaged Modified a.txt\n";
        return 1;
      }
      if (st.untracked != std::vector<std::string>{"dir/u.txt"}) {
        std::cerr << "expected untracked dir/u.txt\n";
        return 1;
      }
    }

    // 3) Delete it from disk -> unstaged Deleted
    fs::remove(t.root() / "a.txt");
    {
      auto st = hunkwise::compute_status(repo);
      if (!has_change(st.unstaged, hunkwise::ChangeKind::Deleted, "a.txt")) {
        std::cerr << "expected unstaged Deleted a.txt\n";
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "status OK\n";
  return 0;
}
