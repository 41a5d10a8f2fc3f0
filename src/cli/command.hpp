#pragma once

namespace hunkwise::cli {

// argv[0] is the subcommand name
using command_fn = int (*)(int, char **);

} // namespace hunkwise::cli
