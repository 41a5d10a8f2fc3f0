#include "cli/registry.hpp"

int cmd_diff(int, char **);
int cmd_status(int, char **);
int cmd_show(int, char **);
int cmd_conflicts(int, char **);
int cmd_markers(int, char **);
int cmd_discard(int, char **);
int cmd_discard_hunk(int, char **);
int cmd_discard_lines(int, char **);
int cmd_restore(int, char **);
int cmd_watch(int, char **);
int cmd_config(int, char **);

namespace hunkwise::cli {

void register_all_commands() {
  register_command("diff", ::cmd_diff,
                   "Show changes: hunkwise diff [--cached] [--from <ref>] [--to <ref>] [path]");
  register_command("status", ::cmd_status, "Show staged/unstaged/untracked/unmerged paths");
  register_command("show", ::cmd_show, "Print a file at a revision: hunkwise show <path> [ref]");
  register_command("conflicts", ::cmd_conflicts, "List paths with unresolved merge conflicts");
  register_command("markers", ::cmd_markers,
                   "List conflict regions of a file: hunkwise markers <path>");
  register_command("discard", ::cmd_discard,
                   "Revert whole files to HEAD: hunkwise discard <path>...");
  register_command("discard-hunk", ::cmd_discard_hunk,
                   "Revert one hunk: hunkwise discard-hunk <path> <old_start> <new_start>");
  register_command("discard-lines", ::cmd_discard_lines,
                   "Revert single lines: hunkwise discard-lines <path> <n>:add|del...");
  register_command("restore", ::cmd_restore,
                   "Bring back a deleted file from HEAD: hunkwise restore <path>");
  register_command("watch", ::cmd_watch, "Report index, HEAD and ref changes until interrupted");
  register_command("config", ::cmd_config,
                   "Show or set .git/hunkwise settings: hunkwise config [<key> <value>]");
}

} // namespace hunkwise::cli
