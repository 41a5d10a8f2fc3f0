#include "hunkwise/config.hpp"

#include "hunkwise/consts.hpp"
#include "hunkwise/fs.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace

namespace hunkwise {

std::filesystem::path settings_path(const std::filesystem::path &repo_root) {
  return repo_root / consts::kGitDir / consts::kSettingsFile;
}

auto load_settings(const std::filesystem::path &repo_root) -> Settings {
  Settings out{};
  const auto path = settings_path(repo_root);
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_text(path));

  constexpr std::string_view k_git = "git:";
  constexpr std::string_view k_context = "context:";
  constexpr std::string_view k_log_level = "log-level:";
  constexpr std::string_view k_log_file = "log-file:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_git)) {
      if (auto v = trim(sv.substr(k_git.size())); !v.empty())
        out.git_binary = v;
    } else if (sv.starts_with(k_context)) {
      const auto v = trim(sv.substr(k_context.size()));
      int n = 0;
      const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
      if (ec == std::errc{} && ptr == v.data() + v.size() && n >= 0)
        out.context_lines = n;
    } else if (sv.starts_with(k_log_level)) {
      out.log_level = trim(sv.substr(k_log_level.size()));
    } else if (sv.starts_with(k_log_file)) {
      out.log_file = trim(sv.substr(k_log_file.size()));
    }
  }
  return out;
}

void save_settings(const std::filesystem::path &repo_root, const Settings &settings) {
  std::ostringstream os;
  os << "git: " << settings.git_binary << '\n'
     << "context: " << settings.context_lines << '\n'
     << "log-level: " << settings.log_level << '\n';
  if (!settings.log_file.empty())
    os << "log-file: " << settings.log_file << '\n';
  fs::write_text_atomic(settings_path(repo_root), os.str());
}

} // namespace hunkwise
