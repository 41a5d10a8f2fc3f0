#include "hunkwise/error.hpp"
#include "hunkwise/fs.hpp"
#include "hunkwise/service.hpp"

#include "git_fixture.hpp"

#include <initializer_list>
#include <iostream>
#include <string>
#include <unistd.h>

using hunkwise::ChangeType;
using hunkwise::ErrorKind;

template <typename Fn>
static bool throws_kind(ErrorKind kind, Fn &&fn) {
  try {
    fn();
  } catch (const hunkwise::Error &e) {
    return e.kind() == kind;
  }
  return false;
}

static bool same_changes(const hunkwise::DiffHunk &a, const hunkwise::DiffHunk &b) {
  if (a.old_start != b.old_start || a.new_start != b.new_start ||
      a.changes.size() != b.changes.size())
    return false;
  for (std::size_t i = 0; i < a.changes.size(); ++i) {
    const auto &x = a.changes[i];
    const auto &y = b.changes[i];
    if (x.type != y.type || x.content != y.content || x.old_line != y.old_line ||
        x.new_line != y.new_line)
      return false;
  }
  return true;
}

// "l1".."l<n>" with the given 1-based lines replaced by "L<i>"
static std::string edited_lines(int n, std::initializer_list<int> changed) {
  std::string s;
  for (int i = 1; i <= n; ++i) {
    bool hit = false;
    for (int c : changed)
      hit = hit || c == i;
    s += (hit ? "L" : "l") + std::to_string(i) + "\n";
  }
  return s;
}

int main() {
  try {
    TempGitRepo t{"discard"};
    const hunkwise::DiffService service;
    const auto &root = t.root();

    t.write("f.txt", "1\n2\n3\n");
    t.write("long.txt", numbered_lines(30));
    t.write("shift.txt", numbered_lines(30));
    t.write("gone.txt", "keep me\n");
    t.commit_all("base");

    // line discard on the documented example
    {
      t.write("f.txt", "1\n2x\n3\n4\n");
      const auto diff = service.get_uncommitted_diff(root, "f.txt");
      if (diff.size() != 1 || diff[0].hunks.size() != 1 || diff[0].hunks[0].changes.size() != 5) {
        std::cerr << "unexpected diff for f.txt\n";
        return 1;
      }
      service.discard_line_changes(root, "f.txt", {{4, ChangeType::Add}});
      if (t.read("f.txt") != "1\n2x\n3\n") {
        std::cerr << "line discard result: " << t.read("f.txt") << "\n";
        return 1;
      }
      if (!throws_kind(ErrorKind::ChangeNotFound, [&] {
            service.discard_line_changes(root, "f.txt", {{4, ChangeType::Add}});
          })) {
        std::cerr << "already discarded line not reported\n";
        return 1;
      }
      if (t.read("f.txt") != "1\n2x\n3\n") {
        std::cerr << "failed line discard touched the file\n";
        return 1;
      }
    }

    // hunk round trip: the kept hunks come back unchanged
    {
      t.write("long.txt", edited_lines(30, {3, 15, 28}));
      const auto before = service.get_uncommitted_diff(root, "long.txt").at(0);
      if (before.hunks.size() != 3) {
        std::cerr << "expected three hunks, got " << before.hunks.size() << "\n";
        return 1;
      }
      service.discard_hunk_changes(root, "long.txt", before.hunks[1]);

      const auto after = service.get_uncommitted_diff(root, "long.txt").at(0);
      if (after.hunks.size() != 2 || !same_changes(after.hunks[0], before.hunks[0]) ||
          !same_changes(after.hunks[1], before.hunks[2])) {
        std::cerr << "kept hunks changed after discard\n";
        return 1;
      }
      if (t.read("long.txt") != edited_lines(30, {3, 28})) {
        std::cerr << "long.txt content wrong after hunk discard\n";
        return 1;
      }

      // stale hint: the middle hunk no longer exists
      if (!throws_kind(ErrorKind::ChangeNotFound,
                       [&] { service.discard_hunk_changes(root, "long.txt", before.hunks[1]); })) {
        std::cerr << "stale hunk not reported\n";
        return 1;
      }
      if (t.read("long.txt") != edited_lines(30, {3, 28})) {
        std::cerr << "stale hunk request corrupted the file\n";
        return 1;
      }

      service.discard_hunk_changes(root, "long.txt", after.hunks[0]);
      service.discard_hunk_changes(root, "long.txt", after.hunks[1]);
      if (t.read("long.txt") != numbered_lines(30)) {
        std::cerr << "discarding every hunk did not restore HEAD\n";
        return 1;
      }
      if (!throws_kind(ErrorKind::NoChangesFound,
                       [&] { service.discard_hunk_changes(root, "long.txt", after.hunks[0]); })) {
        std::cerr << "clean file did not report NoChangesFound\n";
        return 1;
      }
    }

    // dropping an insertion hunk still lets the later hunk apply
    {
      std::string edited;
      for (int i = 1; i <= 30; ++i) {
        edited += (i == 20 ? "L20" : "l" + std::to_string(i)) + "\n";
        if (i == 2)
          edited += "extra1\nextra2\n";
      }
      t.write("shift.txt", edited);
      const auto diff = service.get_uncommitted_diff(root, "shift.txt").at(0);
      if (diff.hunks.size() != 2) {
        std::cerr << "expected two hunks in shift.txt\n";
        return 1;
      }
      service.discard_hunk_changes(root, "shift.txt", diff.hunks[0]);
      if (t.read("shift.txt") != edited_lines(30, {20})) {
        std::cerr << "later hunk not re-applied at its HEAD position\n";
        return 1;
      }
    }

    // deleted file comes back
    {
      fs::remove(root / "gone.txt");
      service.restore_deleted_file(root, "gone.txt");
      if (t.read("gone.txt") != "keep me\n") {
        std::cerr << "restore_deleted_file\n";
        return 1;
      }
      if (!throws_kind(ErrorKind::FileNotFound,
                       [&] { service.restore_deleted_file(root, "never.txt"); })) {
        std::cerr << "restoring an unknown file must fail\n";
        return 1;
      }
    }

    // whole-file discards
    {
      t.write("f.txt", "changed\n");
      service.discard_file_changes(root, (root / "f.txt").string());
      if (t.read("f.txt") != "1\n2\n3\n") {
        std::cerr << "discard_file (absolute path) did not restore HEAD\n";
        return 1;
      }

      t.write("untracked.txt", "scratch\n");
      if (!throws_kind(ErrorKind::UntrackedFileRestriction, [&] {
            hunkwise::DiffHunk h;
            h.old_start = 0;
            h.new_start = 1;
            service.discard_hunk_changes(root, "untracked.txt", h);
          })) {
        std::cerr << "untracked hunk discard not refused\n";
        return 1;
      }
      service.discard_file_changes(root, "untracked.txt");
      if (fs::exists(root / "untracked.txt")) {
        std::cerr << "untracked file not deleted\n";
        return 1;
      }

      t.write("staged.txt", "new\n");
      (void)t.repo().git({"add", "staged.txt"});
      service.discard_file_changes(root, "staged.txt");
      if (fs::exists(root / "staged.txt") || !t.repo().git({"ls-files", "staged.txt"}).empty()) {
        std::cerr << "staged new file not dropped\n";
        return 1;
      }

      if (!throws_kind(ErrorKind::FileNotFound,
                       [&] { service.discard_file_changes(root, "nowhere.txt"); })) {
        std::cerr << "discarding an unknown path must fail\n";
        return 1;
      }
    }

    // paths typed from a subdirectory name files in that subdirectory
    {
      t.write("foo.txt", "root\n");
      t.write("sub/foo.txt", "sub\n");
      t.commit_all("two foos");
      t.write("foo.txt", "ROOT-EDIT\n");
      t.write("sub/foo.txt", "SUB-EDIT\n");

      const auto cwd = root / "sub";
      service.discard_file_changes(root, hunkwise::fs::resolve_from(cwd, "foo.txt"));
      if (t.read("sub/foo.txt") != "sub\n" || t.read("foo.txt") != "ROOT-EDIT\n") {
        std::cerr << "subdirectory path resolved against the wrong directory\n";
        return 1;
      }
      service.discard_file_changes(root, hunkwise::fs::resolve_from(cwd, "../foo.txt"));
      if (t.read("foo.txt") != "root\n") {
        std::cerr << "../ path from a subdirectory not resolved\n";
        return 1;
      }
    }

    // staged new file: HEAD has nothing, the index entry survives both discards
    {
      t.write("n.txt", "a\nb\nc\n");
      (void)t.repo().git({"add", "n.txt"});

      service.discard_line_changes(root, "n.txt", {{2, ChangeType::Add}});
      if (t.read("n.txt") != "a\nc\n" || !t.repo().in_index("n.txt")) {
        std::cerr << "line discard on staged new file: " << t.read("n.txt") << "\n";
        return 1;
      }

      const auto diff = service.get_uncommitted_diff(root, "n.txt");
      if (diff.size() != 1 || diff[0].hunks.size() != 1) {
        std::cerr << "unexpected diff for staged new file\n";
        return 1;
      }
      service.discard_hunk_changes(root, "n.txt", diff[0].hunks[0]);
      if (fs::exists(root / "n.txt") || !t.repo().in_index("n.txt")) {
        std::cerr << "hunk discard on staged new file left wrong state\n";
        return 1;
      }
      (void)t.repo().git({"rm", "-q", "--cached", "n.txt"});
    }

    // glob characters in a path name only that path
    {
      t.write("a1", "tracked\n");
      t.commit_all("a1");
      t.write("a*", "scratch\n");
      if (t.repo().in_index("a*")) {
        std::cerr << "a* matched a1 in the index\n";
        return 1;
      }
      if (!throws_kind(ErrorKind::UntrackedFileRestriction, [&] {
            service.discard_line_changes(root, "a*", {{1, ChangeType::Add}});
          })) {
        std::cerr << "untracked a* not refused\n";
        return 1;
      }
      service.discard_file_changes(root, "a*");
      if (fs::exists(root / "a*") || t.read("a1") != "tracked\n" || !t.repo().in_index("a1")) {
        std::cerr << "discarding a* touched a1\n";
        return 1;
      }
    }

    // an untracked file that cannot be deleted (permissions do not bind root)
    if (hunkwise::to_string(ErrorKind::FileOperationFailed) != "file operation failed") {
      std::cerr << "FileOperationFailed has no name\n";
      return 1;
    }
    if (::geteuid() != 0) {
      t.write("locked/x.txt", "x\n");
      fs::permissions(root / "locked", fs::perms::owner_read | fs::perms::owner_exec,
                      fs::perm_options::replace);
      const bool failed = throws_kind(ErrorKind::FileOperationFailed, [&] {
        service.discard_file_changes(root, "locked/x.txt");
      });
      fs::permissions(root / "locked", fs::perms::owner_all, fs::perm_options::replace);
      fs::remove_all(root / "locked");
      if (!failed) {
        std::cerr << "undeletable untracked file not reported\n";
        return 1;
      }
    }

    // a directory that is not a repository
    {
      const auto plain = unique_temp_dir("plain");
      const bool refused = throws_kind(ErrorKind::NotAGitRepository,
                                       [&] { service.discard_file_changes(plain, "x.txt"); });
      std::error_code ec;
      fs::remove_all(plain, ec);
      if (!refused) {
        std::cerr << "non-repository accepted\n";
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "discard repo OK\n";
  return 0;
}
