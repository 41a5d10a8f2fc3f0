#include "cli/common.hpp"

#include "hunkwise/config.hpp"
#include "hunkwise/log.hpp"
#include "hunkwise/repo.hpp"

#include <iostream>
#include <memory>
#include <string>

// hunkwise config              print the effective settings
// hunkwise config <key> <value> set one of git, context, log-level, log-file
int cmd_config(int argc, char **argv) {
  try {
    hunkwise::cli::CommonFlags flags;
    const auto args = hunkwise::cli::parse_common(argc, argv, flags);
    auto session = hunkwise::cli::open_session(flags);
    const auto &root = session.repo_path;

    if (args.empty()) {
      const auto s = hunkwise::load_settings(root);
      std::cout << "git: " << s.git_binary << "\n"
                << "context: " << s.context_lines << "\n"
                << "log-level: " << s.log_level << "\n"
                << "log-file: " << s.log_file << "\n";
      return 0;
    }
    if (args.size() != 2) {
      std::cerr << "usage: hunkwise config [<key> <value>]\n";
      return 2;
    }

    // flags only apply to this run, never to the saved file
    auto s = hunkwise::load_settings(root);
    const auto &key = args[0];
    const auto &value = args[1];
    if (key == "git") {
      s.git_binary = value;
    } else if (key == "context") {
      const auto n = hunkwise::cli::parse_int(value);
      if (!n) {
        std::cerr << "config: context must be a non-negative number\n";
        return 2;
      }
      s.context_lines = *n;
    } else if (key == "log-level") {
      s.log_level = value;
    } else if (key == "log-file") {
      s.log_file = value;
    } else {
      std::cerr << "config: unknown key " << key << "\n";
      return 2;
    }
    hunkwise::Repository{root, std::make_shared<hunkwise::ProcessRunner>(session.settings.git_binary)}
        .require_git_repository();
    hunkwise::save_settings(root, s);
    hunkwise::log::Registry::hunkwise()->info("set {} in {}", key,
                                              hunkwise::settings_path(root).string());
    return 0;
  } catch (const std::exception &e) {
    return hunkwise::cli::report("config", e);
  }
}
