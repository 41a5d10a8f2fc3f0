#pragma once
#include <filesystem>
#include <string>

namespace hunkwise {

struct Settings {
  std::string git_binary = "git";
  int context_lines = 3;
  std::string log_level = "warn";
  std::string log_file; // empty: log to stderr only
};

auto settings_path(const std::filesystem::path& repo_root) -> std::filesystem::path;

// Read settings from .git/hunkwise (defaults for anything missing)
Settings load_settings(const std::filesystem::path& repo_root);

// Overwrite .git/hunkwise with the given settings
void save_settings(const std::filesystem::path& repo_root, const Settings& settings);

} // namespace hunkwise
