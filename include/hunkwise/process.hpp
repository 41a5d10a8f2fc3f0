#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace hunkwise {

struct CommandResult {
  int exit_code = 0;
  std::string out; // stdout, byte for byte
  std::string err; // stderr
};

// Runs one version-control command. `args` excludes the program name.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual auto run(const std::vector<std::string>& args, const std::filesystem::path& cwd)
      -> CommandResult = 0;
};

// fork/exec runner. stdin is /dev/null; stdout and stderr are captured.
class ProcessRunner : public CommandRunner {
public:
  explicit ProcessRunner(std::string program = "git");

  auto run(const std::vector<std::string>& args, const std::filesystem::path& cwd)
      -> CommandResult override;

  [[nodiscard]] const std::string& program() const { return program_; }

private:
  std::string program_;
};

} // namespace hunkwise
