#pragma once

#include "kild/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace kild::common {

struct CommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  std::filesystem::path working_dir;
};

struct CommandResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  [[nodiscard]] virtual Result<CommandResult> run(const std::vector<std::string> &argv,
                                                  const CommandOptions &options = {}) = 0;

  [[nodiscard]] virtual Result<int> spawn_detached(const std::vector<std::string> &argv,
                                                   const std::filesystem::path &working_dir) = 0;

  [[nodiscard]] virtual bool command_exists(const std::string &name) const = 0;
};

class CliCommandRunner final : public ICommandRunner {
public:
  [[nodiscard]] Result<CommandResult> run(const std::vector<std::string> &argv,
                                          const CommandOptions &options = {}) override;
  [[nodiscard]] Result<int> spawn_detached(const std::vector<std::string> &argv,
                                           const std::filesystem::path &working_dir) override;
  [[nodiscard]] bool command_exists(const std::string &name) const override;
};

[[nodiscard]] std::string join_args(const std::vector<std::string> &args);

} // namespace kild::common
