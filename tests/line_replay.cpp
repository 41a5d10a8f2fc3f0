#include "hunkwise/diff.hpp"
#include "hunkwise/discard.hpp"

#include <iostream>
#include <string>
#include <vector>

using hunkwise::ChangeType;
using hunkwise::DiscardLineInfo;

static hunkwise::FileDiff parse_one(const std::string &body) {
  return hunkwise::diff::parse("diff --git f f\n--- f\n+++ f\n" + body).at(0);
}

static bool check(const std::string &what, const std::string &got, const std::string &want) {
  if (got == want)
    return true;
  std::cerr << what << ": expected\n" << want << "got\n" << got << "\n";
  return false;
}

int main() {
  using hunkwise::discard::replay_line_discard;

  // HEAD "1\n2\n3\n", worktree "1\n2x\n3\n4\n"
  {
    const auto f = parse_one("@@ -1,3 +1,4 @@\n"
                             " 1\n"
                             "-2\n"
                             "+2x\n"
                             " 3\n"
                             "+4\n");
    const std::string head = "1\n2\n3\n";

    const auto r = replay_line_discard(head, f, {{4, ChangeType::Add}});
    if (!check("discard trailing add", r.content, "1\n2x\n3\n") || r.matched != 1)
      return 1;

    if (!check("keep everything", replay_line_discard(head, f, {}).content, "1\n2x\n3\n4\n"))
      return 1;
    if (!check("discard replacement add",
               replay_line_discard(head, f, {{2, ChangeType::Add}}).content, "1\n3\n4\n"))
      return 1;
    // the restored line comes before the kept replacement
    if (!check("discard deletion", replay_line_discard(head, f, {{2, ChangeType::Del}}).content,
               "1\n2\n2x\n3\n4\n"))
      return 1;
    const std::vector<DiscardLineInfo> all{
        {2, ChangeType::Del}, {2, ChangeType::Add}, {4, ChangeType::Add}};
    const auto back = replay_line_discard(head, f, all);
    if (!check("discard all", back.content, head) || back.matched != 3)
      return 1;

    // keys that name no change are counted as unmatched
    const auto stale = replay_line_discard(head, f, {{1, ChangeType::Add}, {3, ChangeType::Del}});
    if (stale.matched != 0) {
      std::cerr << "stale keys matched\n";
      return 1;
    }
  }

  // [normal, del(10), add(10'), del(11), normal]: dropping only the add
  // leaves HEAD without lines 10 and 11
  {
    std::string head;
    std::string want;
    for (int i = 1; i <= 14; ++i) {
      head += "l" + std::to_string(i) + "\n";
      if (i != 10 && i != 11)
        want += "l" + std::to_string(i) + "\n";
    }
    const auto f = parse_one("@@ -9,4 +9,3 @@\n"
                             " l9\n"
                             "-l10\n"
                             "+X\n"
                             "-l11\n"
                             " l12\n");
    if (!check("interleaved offset", replay_line_discard(head, f, {{10, ChangeType::Add}}).content,
               want))
      return 1;
  }

  // offsets carry across hunks
  {
    const std::string head = "a\nb\nc\nd\ne\nf\ng\nh\ni\nj\n";
    const auto f = parse_one("@@ -1,3 +1,4 @@\n"
                             " a\n"
                             " b\n"
                             "+new1\n"
                             " c\n"
                             "@@ -6,3 +7,3 @@\n"
                             " f\n"
                             "-g\n"
                             "+G\n"
                             " h\n");
    if (!check("second hunk after insertion",
               replay_line_discard(head, f, {{7, ChangeType::Del}}).content,
               "a\nb\nnew1\nc\nd\ne\nf\ng\nG\nh\ni\nj\n"))
      return 1;
    if (!check("first hunk dropped",
               replay_line_discard(head, f, {{3, ChangeType::Add}}).content,
               "a\nb\nc\nd\ne\nf\nG\nh\ni\nj\n"))
      return 1;
  }

  // HEAD lacked a final newline; the worktree added one plus a line
  {
    const auto f = parse_one("@@ -1,2 +1,3 @@\n"
                             " a\n"
                             "-b\n"
                             "\\ No newline at end of file\n"
                             "+b\n"
                             "+c\n");
    if (!check("newline follows kept last line",
               replay_line_discard("a\nb", f, {{3, ChangeType::Add}}).content, "a\nb\n"))
      return 1;
    if (!check("restore missing newline",
               replay_line_discard("a\nb", f, {{2, ChangeType::Del}, {2, ChangeType::Add},
                                                {3, ChangeType::Add}})
                   .content,
               "a\nb"))
      return 1;
  }

  // additions into an empty file
  {
    const auto f = parse_one("@@ -0,0 +1,2 @@\n+x\n+y\n");
    if (!check("empty baseline", replay_line_discard("", f, {{1, ChangeType::Add}}).content, "y\n"))
      return 1;
  }

  // buffer round trip keeps CR and a missing final newline
  {
    const std::string text = "x\r\ny";
    const auto buf = hunkwise::discard::to_buffer(text);
    if (buf.size() != 2 || buf[1].eol || hunkwise::discard::from_buffer(buf) != text) {
      std::cerr << "buffer round trip\n";
      return 1;
    }
  }

  if (hunkwise::discard::line_key(4, ChangeType::Add) != "4-add" ||
      hunkwise::discard::line_key(2, ChangeType::Del) != "2-del") {
    std::cerr << "line_key format\n";
    return 1;
  }

  std::cout << "line replay OK\n";
  return 0;
}
