#include "hunkwise/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <mutex>
#include <vector>

namespace hunkwise::log {

namespace {

constexpr std::array<const char *, 5> kLoggerNames = {"hunkwise", "git", "diff", "discard",
                                                      "watch"};

std::mutex &registry_mutex() {
  static std::mutex m;
  return m;
}

struct SinkSet {
  spdlog::level::level_enum level = spdlog::level::warn;
  std::vector<spdlog::sink_ptr> sinks;
};

SinkSet &sink_set() {
  static SinkSet s;
  return s;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string &name, const SinkSet &set) {
  auto logger = std::make_shared<spdlog::logger>(name, set.sinks.begin(), set.sinks.end());
  logger->set_level(set.level);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

void ensure_default_sinks(SinkSet &set, const char *pattern) {
  if (!set.sinks.empty())
    return;
  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_color_mode(spdlog::color_mode::automatic);
  console->set_pattern(pattern);
  set.sinks.push_back(console);
}

} // namespace

void Registry::init(spdlog::level::level_enum level,
                    const std::optional<std::filesystem::path> &file) {
  std::lock_guard lock(registry_mutex());
  auto &set = sink_set();
  set.sinks.clear();
  set.level = level;
  ensure_default_sinks(set, LOG_FORMAT);
  if (file) {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file->string(),
                                                                          /*truncate=*/false);
    file_sink->set_pattern(LOG_FORMAT);
    set.sinks.push_back(file_sink);
  }

  for (const char *name : kLoggerNames) {
    spdlog::drop(name);
    spdlog::register_logger(make_logger(name, set));
  }
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string &name) {
  if (auto logger = spdlog::get(name))
    return logger;

  std::lock_guard lock(registry_mutex());
  if (auto logger = spdlog::get(name))
    return logger;
  auto &set = sink_set();
  ensure_default_sinks(set, LOG_FORMAT);
  auto logger = make_logger(name, set);
  spdlog::register_logger(logger);
  return logger;
}

spdlog::level::level_enum level_from_string(const std::string &name) {
  const auto level = spdlog::level::from_str(name);
  // from_str answers `off` for names it does not know
  if (level == spdlog::level::off && name != "off")
    return spdlog::level::warn;
  return level;
}

} // namespace hunkwise::log
