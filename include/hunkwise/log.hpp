#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace hunkwise::log {

class Registry {
public:
  // Configure every hunkwise logger. Safe to call again to change the level.
  static void init(spdlog::level::level_enum level,
                   const std::optional<std::filesystem::path>& file = std::nullopt);

  // Named logger; created on first use at `warn` if init() never ran.
  static std::shared_ptr<spdlog::logger> get(const std::string& name);

  static std::shared_ptr<spdlog::logger> hunkwise() { return get("hunkwise"); }
  static std::shared_ptr<spdlog::logger> git()      { return get("git"); }
  static std::shared_ptr<spdlog::logger> diff()     { return get("diff"); }
  static std::shared_ptr<spdlog::logger> discard()  { return get("discard"); }
  static std::shared_ptr<spdlog::logger> watch()    { return get("watch"); }

private:
  static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
};

// "debug", "info", ... ; unknown names map to warn
auto level_from_string(const std::string& name) -> spdlog::level::level_enum;

} // namespace hunkwise::log
