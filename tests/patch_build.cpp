#include "hunkwise/diff.hpp"
#include "hunkwise/error.hpp"
#include "hunkwise/patch.hpp"

#include <iostream>
#include <string>

static const char *kTwoHunks = "diff --git f.txt f.txt\n"
                               "index 1111111..2222222 100644\n"
                               "--- f.txt\n"
                               "+++ f.txt\n"
                               "@@ -2,3 +2,4 @@\n"
                               " l2\n"
                               "+new\n"
                               " l3\n"
                               " l4\n"
                               "@@ -15,3 +16,3 @@ section\n"
                               " l15\n"
                               "-l16\n"
                               "+L16\n"
                               " l17\n";

static bool expect_change_not_found(const std::string &raw, const hunkwise::DiffHunk &h,
                                    const char *path) {
  try {
    (void)hunkwise::patch::build(path, raw, {h});
  } catch (const hunkwise::Error &e) {
    return e.kind() == hunkwise::ErrorKind::ChangeNotFound;
  }
  return false;
}

int main() {
  const auto files = hunkwise::diff::parse(kTwoHunks);
  const auto &file = files.at(0);
  const auto &first = file.hunks.at(0);
  const auto &second = file.hunks.at(1);

  // keeping only the later hunk moves its new side back by the dropped insertion
  {
    const std::string expected = "diff --git a/f.txt b/f.txt\n"
                                 "--- a/f.txt\n"
                                 "+++ b/f.txt\n"
                                 "@@ -15,3 +15,3 @@ section\n"
                                 " l15\n"
                                 "-l16\n"
                                 "+L16\n"
                                 " l17\n";
    const auto got = hunkwise::patch::render(file, {second});
    if (got != expected) {
      std::cerr << "render(second) mismatch:\n" << got;
      return 1;
    }
    if (hunkwise::patch::build("f.txt", kTwoHunks, {second}) != expected) {
      std::cerr << "build() differs from render()\n";
      return 1;
    }
  }

  // keeping both leaves the headers as git wrote them
  {
    const auto got = hunkwise::patch::render(file, {first, second});
    if (got.find("@@ -2,3 +2,4 @@\n") == std::string::npos ||
        got.find("@@ -15,3 +16,3 @@ section\n") == std::string::npos) {
      std::cerr << "render(both) rewrote headers:\n" << got;
      return 1;
    }
  }

  // pure deletions: an empty new side is numbered by the line before it
  {
    const std::string raw = "diff --git d.txt d.txt\n"
                            "--- d.txt\n"
                            "+++ d.txt\n"
                            "@@ -3 +2,0 @@\n"
                            "-gone\n"
                            "@@ -10,2 +8,0 @@\n"
                            "-x\n"
                            "-y\n";
    const auto d = hunkwise::diff::parse(raw).at(0);
    const auto only_second = hunkwise::patch::render(d, {d.hunks.at(1)});
    if (only_second.find("@@ -10,2 +9,0 @@\n") == std::string::npos) {
      std::cerr << "deletion-only hunk not rebased:\n" << only_second;
      return 1;
    }
    const auto both = hunkwise::patch::render(d, d.hunks);
    if (both.find("@@ -3,1 +2,0 @@\n") == std::string::npos ||
        both.find("@@ -10,2 +8,0 @@\n") == std::string::npos) {
      std::cerr << "deletion-only hunks renumbered:\n" << both;
      return 1;
    }
  }

  // new file without a trailing newline
  {
    const auto n = hunkwise::diff::parse("diff --git new.txt new.txt\n"
                                         "new file mode 100644\n"
                                         "--- /dev/null\n"
                                         "+++ new.txt\n"
                                         "@@ -0,0 +1,2 @@\n"
                                         "+hello\n"
                                         "+world\n"
                                         "\\ No newline at end of file\n")
                       .at(0);
    const std::string expected = "diff --git a/new.txt b/new.txt\n"
                                 "new file mode 100644\n"
                                 "--- /dev/null\n"
                                 "+++ b/new.txt\n"
                                 "@@ -0,0 +1,2 @@\n"
                                 "+hello\n"
                                 "+world\n"
                                 "\\ No newline at end of file\n";
    const auto got = hunkwise::patch::render(n, n.hunks);
    if (got != expected) {
      std::cerr << "new-file patch mismatch:\n" << got;
      return 1;
    }
  }

  // stale hints
  {
    hunkwise::DiffHunk missing;
    missing.old_start = 99;
    missing.new_start = 99;
    if (!expect_change_not_found(kTwoHunks, missing, "f.txt")) {
      std::cerr << "absent hunk did not raise ChangeNotFound\n";
      return 1;
    }
    if (!expect_change_not_found(kTwoHunks, second, "other.txt")) {
      std::cerr << "absent file did not raise ChangeNotFound\n";
      return 1;
    }
  }

  if (hunkwise::patch::quote_path("a\tb") != "\"a\\tb\"") {
    std::cerr << "quote_path\n";
    return 1;
  }

  std::cout << "patch build OK\n";
  return 0;
}
